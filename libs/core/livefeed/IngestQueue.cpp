#include "IngestQueue.hpp"
#include <iterator>
#include <utility>

IngestQueue::IngestQueue(std::size_t pausedCapacity)
    : m_pausedCapacity(pausedCapacity)
{}

void IngestQueue::enqueue(Trade trade) {
    if (m_paused) {
        m_pausedTrades.push_front(std::move(trade));
        if (m_pausedTrades.size() > m_pausedCapacity) {
            m_pausedTrades.pop_back();
        }
        ++m_queuedCount;
        return;
    }
    m_pending.push_back(std::move(trade));
}

std::vector<Trade> IngestQueue::flush() {
    std::vector<Trade> batch;
    batch.swap(m_pending);
    return batch;
}

void IngestQueue::pause() {
    m_paused = true;
}

std::vector<Trade> IngestQueue::resume() {
    m_paused = false;
    std::vector<Trade> backlog(std::make_move_iterator(m_pausedTrades.begin()),
                               std::make_move_iterator(m_pausedTrades.end()));
    m_pausedTrades.clear();
    m_queuedCount = 0;
    return backlog;
}
