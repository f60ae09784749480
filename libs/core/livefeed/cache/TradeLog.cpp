#include "TradeLog.hpp"
#include <mutex>
#include <stdexcept>
#include <unordered_set>

TradeLog::TradeLog(std::size_t capacity)
    : m_capacity(capacity)
{
    if (m_capacity == 0) {
        throw std::invalid_argument("TradeLog capacity must be positive");
    }
    m_trades.reserve(m_capacity);
}

void TradeLog::prepend(const std::vector<Trade>& batch) {
    if (batch.empty()) return;

    std::unique_lock lock(m_mx);
    std::vector<Trade> merged;
    merged.reserve(m_capacity);
    std::unordered_set<std::string> seen;
    seen.reserve(m_capacity * 2);

    auto take = [&](const Trade& t) {
        if (merged.size() >= m_capacity) return false;
        if (seen.insert(t.identity()).second) {
            merged.push_back(t);
        }
        return true;
    };

    for (const auto& t : batch) {
        if (!take(t)) break;
    }
    for (const auto& t : m_trades) {
        if (!take(t)) break;
    }
    m_trades.swap(merged);
}

void TradeLog::prepend(const Trade& trade) {
    prepend(std::vector<Trade>{trade});
}

std::size_t TradeLog::attachImages(const ImageLookup& lookup) {
    std::unique_lock lock(m_mx);
    std::size_t patched = 0;
    for (auto& t : m_trades) {
        if (t.image) continue;
        if (auto img = lookup(t)) {
            t.image = std::move(*img);
            ++patched;
        }
    }
    return patched;
}

std::vector<Trade> TradeLog::snapshot() const {
    std::shared_lock lock(m_mx);
    return m_trades;
}

std::size_t TradeLog::size() const {
    std::shared_lock lock(m_mx);
    return m_trades.size();
}

bool TradeLog::empty() const {
    std::shared_lock lock(m_mx);
    return m_trades.empty();
}

std::map<std::string, std::string> TradeLog::availableMarkets() const {
    std::shared_lock lock(m_mx);
    std::map<std::string, std::string> markets;
    for (const auto& t : m_trades) {
        if (t.market_slug.empty()) continue;
        markets.emplace(t.market_slug, t.title);
    }
    return markets;
}

void TradeLog::clear() {
    std::unique_lock lock(m_mx);
    m_trades.clear();
}
