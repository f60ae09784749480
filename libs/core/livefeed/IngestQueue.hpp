/*
Tidewatch — IngestQueue
Role: Batches decoded trades between flush ticks and holds them back while the feed is paused.
Inputs/Outputs: enqueue() per trade; flush() returns the pending batch; resume() returns the paused backlog.
Threading: Not thread-safe; owned by LiveTradesPipeline and touched only on its strand.
Performance: Amortizes bursts so downstream work runs once per 50 ms tick instead of per trade.
Integration: The pipeline prepends flush() and resume() results to the canonical TradeLog.
Related: IngestQueue.cpp, TradeLog.hpp, LiveTradesPipeline.hpp.
*/
#pragma once
#include <cstddef>
#include <deque>
#include <vector>
#include "model/TradeData.h"

class IngestQueue {
public:
    // pausedCapacity bounds the paused backlog; anything older could never survive the merge.
    explicit IngestQueue(std::size_t pausedCapacity);

    void enqueue(Trade trade);

    // Pending batch in arrival order; the queue is left empty.
    [[nodiscard]] std::vector<Trade> flush();

    void pause();

    // Paused backlog, newest first; queued count resets to zero.
    [[nodiscard]] std::vector<Trade> resume();

    [[nodiscard]] bool paused() const noexcept { return m_paused; }
    [[nodiscard]] std::size_t queuedCount() const noexcept { return m_queuedCount; }
    [[nodiscard]] std::size_t pendingCount() const noexcept { return m_pending.size(); }

private:
    std::vector<Trade> m_pending;
    std::deque<Trade>  m_pausedTrades;   // newest first
    std::size_t        m_pausedCapacity;
    std::size_t        m_queuedCount = 0;
    bool               m_paused = false;
};
