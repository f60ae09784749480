#include "SignalRule.h"
#include <algorithm>
#include <format>

ProfileAsOf ProfileAsOf::build(const Trade& trade, const WalletProfile& profile) {
    ProfileAsOf view;
    view.profile = &profile;
    view.historyEnd = profile.history.size();
    view.priorCount = profile.tradeCount;
    view.priorVolume = profile.totalVolume;
    auto market = profile.marketEntries.find(trade.market_slug);
    view.priorMarketEntries = market != profile.marketEntries.end() ? market->second : 0;

    const std::string identity = trade.identity();
    std::size_t pos = profile.history.size();
    for (std::size_t i = 0; i < profile.history.size(); ++i) {
        if (profile.history[i].identity == identity) { pos = i; break; }
    }
    if (pos == profile.history.size()) {
        return view;
    }

    // Roll back the trade and everything recorded after it.
    view.historyEnd = pos;
    for (std::size_t i = pos; i < profile.history.size(); ++i) {
        const auto& e = profile.history[i];
        if (view.priorCount > 0) --view.priorCount;
        view.priorVolume -= e.notional;
        if (e.marketSlug == trade.market_slug && view.priorMarketEntries > 0) {
            --view.priorMarketEntries;
        }
    }
    if (view.priorVolume < 0.0) view.priorVolume = 0.0;
    return view;
}

std::optional<AnomalySignal> FreshWalletRule::check(const Trade& trade, const ProfileAsOf& view) const {
    if (!view.profile) return std::nullopt;
    // A trade older than firstSeen is the wallet's first appearance.
    const int64_t age = std::max<int64_t>(0, trade.timestamp - view.profile->firstSeen);
    if (age >= m_maxAgeSeconds) return std::nullopt;
    if (trade.notional() < m_minNotional) return std::nullopt;

    const std::string detail = age >= 3600
        ? std::format("Wallet age: {}h", age / 3600)
        : std::format("Wallet age: {}m", age / 60);
    return AnomalySignal{SignalType::FreshWallet, detail};
}

std::optional<AnomalySignal> UnusualSizingRule::check(const Trade& trade, const ProfileAsOf& view) const {
    if (view.priorCount < 1) return std::nullopt;
    const double avg = view.priorAverage();
    if (avg <= 0.0) return std::nullopt;
    const double notional = trade.notional();
    if (notional <= m_multiple * avg) return std::nullopt;
    return AnomalySignal{SignalType::UnusualSizing, std::format("{:.1f}x avg size", notional / avg)};
}

std::optional<AnomalySignal> RepeatedEntriesRule::check(const Trade& trade, const ProfileAsOf& view) const {
    if (trade.market_slug.empty()) return std::nullopt;
    if (view.priorMarketEntries < m_priorEntries) return std::nullopt;
    return AnomalySignal{SignalType::RepeatedEntries,
                         std::format("{} entries in this market", view.priorMarketEntries + 1)};
}

std::optional<AnomalySignal> RapidClusteringRule::check(const Trade& trade, const ProfileAsOf& view) const {
    if (!view.profile) return std::nullopt;
    const int64_t windowStart = trade.timestamp - m_windowSeconds;
    std::size_t count = 1;   // the trade itself
    for (std::size_t i = 0; i < view.historyEnd; ++i) {
        const auto ts = view.profile->history[i].timestamp;
        if (ts >= windowStart && ts <= trade.timestamp) ++count;
    }
    if (count < m_minTrades) return std::nullopt;
    return AnomalySignal{SignalType::RapidClustering,
                         std::format("{} trades in {}m", count, m_windowSeconds / 60)};
}
