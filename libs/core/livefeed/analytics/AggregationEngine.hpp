/*
Tidewatch — AggregationEngine
Role: Rolling statistics, top traders and per-market volumes over the canonical log.
Inputs/Outputs: tick(log, now) recomputes whatever is due; results are replaced wholesale.
Threading: Not thread-safe; ticked on the pipeline strand, which publishes copies.
Performance: Stats at most every 500 ms, rankings at most every 1 s; both O(n) over a ≤200 trade log.
Integration: Driven by LiveTradesPipeline's stats/rankings timers.
Related: AggregationEngine.cpp, PipelineTypes.h.
*/
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>
#include "../model/PipelineTypes.h"
#include "../model/TradeData.h"

class AggregationEngine {
public:
    using Clock = std::chrono::steady_clock;

    struct TickResult {
        bool statsUpdated = false;
        bool rankingsUpdated = false;
    };

    AggregationEngine(std::chrono::milliseconds statsInterval,
                      std::chrono::milliseconds rankingsInterval,
                      std::size_t rankingLimit);

    TickResult tick(const std::vector<Trade>& log, Clock::time_point now = Clock::now());

    [[nodiscard]] const AggregateStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] const std::vector<TraderStats>& topTraders() const noexcept { return m_topTraders; }
    [[nodiscard]] const std::vector<MarketVolume>& marketVolumes() const noexcept { return m_marketVolumes; }

    // Forget throttle state so the next tick recomputes everything.
    void reset();

    static AggregateStats computeStats(const std::vector<Trade>& log);
    static std::vector<TraderStats> computeTopTraders(const std::vector<Trade>& log, std::size_t limit);
    static std::vector<MarketVolume> computeMarketVolumes(const std::vector<Trade>& log, std::size_t limit);

private:
    std::chrono::milliseconds m_statsInterval;
    std::chrono::milliseconds m_rankingsInterval;
    std::size_t m_rankingLimit;

    std::optional<Clock::time_point> m_lastStats;
    std::optional<Clock::time_point> m_lastRankings;

    AggregateStats             m_stats;
    std::vector<TraderStats>   m_topTraders;
    std::vector<MarketVolume>  m_marketVolumes;
};
