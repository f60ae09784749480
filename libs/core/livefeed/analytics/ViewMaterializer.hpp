/*
Tidewatch — ViewMaterializer
Role: Pure filter from the canonical log (or whale buffer) to the list the user sees.
Inputs/Outputs: Source trades + FilterState + tracked wallets + signal lookup → filtered trades, source order kept.
Threading: Stateless; safe on any thread with its own inputs.
Integration: LiveTradesPipeline::materialize() and the CSV export.
Related: PipelineTypes.h (FilterState), TrackedWallets.hpp, SignalDetector.hpp.
Assumptions: "Noise" markets are the short-horizon up/down series.
*/
#pragma once
#include <functional>
#include <vector>
#include "../model/PipelineTypes.h"
#include "../model/TradeData.h"
#include "TrackedWallets.hpp"

class ViewMaterializer {
public:
    using SignalLookup = std::function<std::vector<AnomalySignal>(const Trade&)>;

    // whalesOnly selects the whale buffer, otherwise the canonical log is filtered.
    static std::vector<Trade> materialize(const std::vector<Trade>& canonicalLog,
                                          const std::vector<Trade>& whaleBuffer,
                                          const FilterState& filter,
                                          const TrackedWallets& tracked,
                                          const SignalLookup& signals);

    // Predicates in order: side, min volume, token, market, noise, search, tracked, signals.
    static bool matches(const Trade& trade,
                        const FilterState& filter,
                        const TrackedWallets& tracked,
                        const SignalLookup& signals);

    static bool isNoiseMarket(const Trade& trade);
};
