/*
Tidewatch — TradeLog
Role: Bounded, newest-first, identity-deduplicated trade list (canonical log and whale buffer).
Inputs/Outputs: prepend() takes a batch in arrival order; snapshot() returns a copy for readers.
Threading: Thread-safe; std::shared_mutex for concurrent snapshots and exclusive prepends.
Performance: prepend is O(size + batch) with one hash set; capacities are a few thousand at most.
Integration: Written on the pipeline strand by the flush tick and the whale path; read by aggregation, the view and the GUI.
Observability: No internal logging; the pipeline logs flush sizes.
Related: TradeLog.cpp, IngestQueue.hpp, MetadataEnricher.hpp.
Assumptions: Trade::identity() is stable for the lifetime of a trade.
*/
#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "../model/TradeData.h"

class TradeLog {
public:
    using ImageLookup = std::function<std::optional<std::string>(const Trade&)>;

    explicit TradeLog(std::size_t capacity);

    // Batch goes in front of the existing log; first occurrence of an identity wins,
    // then the list is cut to capacity.
    void prepend(const std::vector<Trade>& batch);
    void prepend(const Trade& trade);

    // Fill missing images from lookup; returns how many trades were patched.
    std::size_t attachImages(const ImageLookup& lookup);

    [[nodiscard]] std::vector<Trade> snapshot() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] bool empty() const;

    // slug → title of every market present in the log
    [[nodiscard]] std::map<std::string, std::string> availableMarkets() const;

    void clear();

private:
    mutable std::shared_mutex m_mx;
    std::vector<Trade>        m_trades;
    std::size_t               m_capacity;
};
