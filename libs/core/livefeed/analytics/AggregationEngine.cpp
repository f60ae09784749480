#include "AggregationEngine.hpp"
#include "Cpp20Utils.hpp"
#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>

AggregationEngine::AggregationEngine(std::chrono::milliseconds statsInterval,
                                     std::chrono::milliseconds rankingsInterval,
                                     std::size_t rankingLimit)
    : m_statsInterval(statsInterval)
    , m_rankingsInterval(rankingsInterval)
    , m_rankingLimit(rankingLimit)
{}

AggregationEngine::TickResult AggregationEngine::tick(const std::vector<Trade>& log, Clock::time_point now) {
    TickResult result;
    if (!m_lastStats || now - *m_lastStats >= m_statsInterval) {
        m_stats = computeStats(log);
        m_lastStats = now;
        result.statsUpdated = true;
    }
    if (!m_lastRankings || now - *m_lastRankings >= m_rankingsInterval) {
        m_topTraders = computeTopTraders(log, m_rankingLimit);
        m_marketVolumes = computeMarketVolumes(log, m_rankingLimit);
        m_lastRankings = now;
        result.rankingsUpdated = true;
    }
    return result;
}

void AggregationEngine::reset() {
    m_lastStats.reset();
    m_lastRankings.reset();
}

AggregateStats AggregationEngine::computeStats(const std::vector<Trade>& log) {
    AggregateStats s;
    for (const auto& t : log) {
        const double n = t.notional();
        s.totalVolume += n;
        if (t.side == TradeSide::Buy) s.buyVolume += n;
        else if (t.side == TradeSide::Sell) s.sellVolume += n;
        s.largestTrade = std::max(s.largestTrade, n);
        if (t.isWhale()) ++s.whaleCount;
    }
    s.tradeCount = log.size();
    s.avgTradeSize = s.tradeCount > 0 ? s.totalVolume / static_cast<double>(s.tradeCount) : 0.0;

    const double flow = s.buyVolume + s.sellVolume;
    if (flow > 0.0) {
        s.buyPressure = s.buyVolume / flow * 100.0;
        s.imbalance = (s.buyVolume - s.sellVolume) / flow * 100.0;
    }
    return s;
}

std::vector<TraderStats> AggregationEngine::computeTopTraders(const std::vector<Trade>& log, std::size_t limit) {
    struct Acc {
        TraderStats stats;
        std::size_t buys = 0;
        std::unordered_set<std::string> markets;
    };
    std::unordered_map<std::string, Acc> byWallet;
    for (const auto& t : log) {
        if (t.user.empty()) continue;
        const std::string key = Cpp20Utils::toLower(t.user);
        auto& acc = byWallet[key];
        acc.stats.wallet = key;
        acc.stats.volume += t.notional();
        ++acc.stats.trades;
        if (t.side == TradeSide::Buy) ++acc.buys;
        if (!t.market_slug.empty()) acc.markets.insert(t.market_slug);
    }

    std::vector<TraderStats> out;
    out.reserve(byWallet.size());
    for (auto& [wallet, acc] : byWallet) {
        acc.stats.markets = acc.markets.size();
        acc.stats.buyPercent = acc.stats.trades > 0
            ? static_cast<double>(acc.buys) / static_cast<double>(acc.stats.trades) * 100.0
            : 0.0;
        out.push_back(std::move(acc.stats));
    }
    std::sort(out.begin(), out.end(), [](const TraderStats& a, const TraderStats& b) {
        if (a.volume != b.volume) return a.volume > b.volume;
        return a.wallet < b.wallet;
    });
    if (out.size() > limit) out.resize(limit);
    return out;
}

std::vector<MarketVolume> AggregationEngine::computeMarketVolumes(const std::vector<Trade>& log, std::size_t limit) {
    std::unordered_map<std::string, MarketVolume> bySlug;
    for (const auto& t : log) {
        if (t.market_slug.empty()) continue;
        auto& mv = bySlug[t.market_slug];
        if (mv.slug.empty()) {
            mv.slug = t.market_slug;
            mv.title = t.title;
        }
        if (!mv.image && t.image) mv.image = t.image;
        mv.volume += t.notional();
        ++mv.trades;
    }

    std::vector<MarketVolume> out;
    out.reserve(bySlug.size());
    for (auto& [slug, mv] : bySlug) out.push_back(std::move(mv));
    std::sort(out.begin(), out.end(), [](const MarketVolume& a, const MarketVolume& b) {
        if (a.volume != b.volume) return a.volume > b.volume;
        return a.slug < b.slug;
    });
    if (out.size() > limit) out.resize(limit);
    return out;
}
