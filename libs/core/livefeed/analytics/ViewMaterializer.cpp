#include "ViewMaterializer.hpp"
#include "Cpp20Utils.hpp"
#include <algorithm>

using Cpp20Utils::containsIgnoreCase;
using Cpp20Utils::equalsIgnoreCase;

std::vector<Trade> ViewMaterializer::materialize(const std::vector<Trade>& canonicalLog,
                                                 const std::vector<Trade>& whaleBuffer,
                                                 const FilterState& filter,
                                                 const TrackedWallets& tracked,
                                                 const SignalLookup& signals) {
    std::vector<Trade> out;
    if (filter.trackedOnly && tracked.empty()) return out;

    const auto& source = filter.whalesOnly ? whaleBuffer : canonicalLog;
    for (const auto& t : source) {
        if (matches(t, filter, tracked, signals)) out.push_back(t);
    }
    return out;
}

bool ViewMaterializer::matches(const Trade& t,
                               const FilterState& f,
                               const TrackedWallets& tracked,
                               const SignalLookup& signals) {
    if (f.side == SideFilter::Buy && t.side != TradeSide::Buy) return false;
    if (f.side == SideFilter::Sell && t.side != TradeSide::Sell) return false;

    if (f.minVolume > 0.0 && t.notional() < f.minVolume) return false;

    if (f.token == TokenFilter::Yes && !equalsIgnoreCase(t.token_label, "yes")) return false;
    if (f.token == TokenFilter::No && !equalsIgnoreCase(t.token_label, "no")) return false;

    if (!f.marketSlug.empty() && t.market_slug != f.marketSlug) return false;

    if (f.hideNoiseMarkets && isNoiseMarket(t)) return false;

    if (!f.search.empty()) {
        const bool hit = containsIgnoreCase(t.title, f.search)
                      || containsIgnoreCase(t.user, f.search)
                      || containsIgnoreCase(t.market_slug, f.search);
        if (!hit) return false;
    }

    if (f.trackedOnly && !tracked.contains(t.user)) return false;

    if (f.signalOnly) {
        if (!signals || f.enabledSignals.empty()) return false;
        const auto found = signals(t);
        const bool any = std::any_of(found.begin(), found.end(), [&](const AnomalySignal& s) {
            return f.enabledSignals.count(s.type) > 0;
        });
        if (!any) return false;
    }
    return true;
}

bool ViewMaterializer::isNoiseMarket(const Trade& t) {
    return containsIgnoreCase(t.title, "up or down")
        || equalsIgnoreCase(t.token_label, "up")
        || equalsIgnoreCase(t.token_label, "down");
}
