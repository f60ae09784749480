#include "WalletActivityTracker.hpp"
#include "Cpp20Utils.hpp"
#include <algorithm>

WalletActivityTracker::WalletActivityTracker()
    : WalletActivityTracker(Limits{})
{}

WalletActivityTracker::WalletActivityTracker(Limits limits)
    : m_limits(limits)
{}

const WalletProfile* WalletActivityTracker::record(const Trade& trade, Clock::time_point now) {
    if (trade.user.empty()) return nullptr;

    const std::string key = Cpp20Utils::toLower(trade.user);
    auto it = m_profiles.find(key);
    if (it == m_profiles.end()) {
        m_lru.push_front(key);
        Slot slot;
        slot.profile.wallet = key;
        slot.profile.firstSeen = trade.timestamp;
        slot.lruPos = m_lru.begin();
        it = m_profiles.emplace(key, std::move(slot)).first;
    }

    Slot& slot = it->second;
    WalletProfile& p = slot.profile;
    const std::string identity = trade.identity();
    const bool duplicate = std::any_of(p.history.begin(), p.history.end(),
        [&](const WalletTradeEntry& e) { return e.identity == identity; });

    if (!duplicate) {
        const double notional = trade.notional();
        p.history.push_back(WalletTradeEntry{identity, trade.market_slug, notional, trade.timestamp});
        while (p.history.size() > m_limits.historyLimit) {
            p.history.pop_front();
        }
        ++p.tradeCount;
        p.totalVolume += notional;
        ++p.marketEntries[trade.market_slug];
        p.firstSeen = std::min(p.firstSeen, trade.timestamp);
    }
    p.lastUpdated = now;
    touch(slot);
    enforceCapacity();

    // enforceCapacity never evicts the front of the LRU list, so the slot is still valid.
    return &slot.profile;
}

const WalletProfile* WalletActivityTracker::find(std::string_view wallet) const {
    auto it = m_profiles.find(Cpp20Utils::toLower(wallet));
    if (it == m_profiles.end()) return nullptr;
    return &it->second.profile;
}

std::size_t WalletActivityTracker::evictExpired(Clock::time_point now) {
    std::size_t removed = 0;
    while (!m_lru.empty()) {
        auto it = m_profiles.find(m_lru.back());
        if (it == m_profiles.end()) {
            m_lru.pop_back();
            continue;
        }
        if (now - it->second.profile.lastUpdated <= m_limits.ttl) break;
        m_profiles.erase(it);
        m_lru.pop_back();
        ++removed;
    }
    return removed;
}

void WalletActivityTracker::clear() {
    m_profiles.clear();
    m_lru.clear();
}

void WalletActivityTracker::touch(Slot& slot) {
    m_lru.splice(m_lru.begin(), m_lru, slot.lruPos);
    slot.lruPos = m_lru.begin();
}

void WalletActivityTracker::enforceCapacity() {
    while (m_profiles.size() > m_limits.maxProfiles && m_lru.size() > 1) {
        m_profiles.erase(m_lru.back());
        m_lru.pop_back();
    }
}
