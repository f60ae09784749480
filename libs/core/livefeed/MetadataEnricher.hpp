/*
Tidewatch — MetadataEnricher
Role: Resolves market imagery for trades through a batched side-channel with a process-lifetime cache.
Inputs/Outputs: resolve(trade) answers from cache and queues unknown keys; batches go to an IMetadataSource.
Threading: Every method runs on the pipeline strand; source completions are posted back onto it.
Performance: At most one request per 20 keys or per 1 s debounce window; no key is ever requested twice.
Integration: LiveTradesPipeline calls resolve() per trade and patches its logs from onBatchComplete().
Observability: Logs batch sizes and failures on tidewatch.data; counters exposed for tests and status.
Related: MetadataEnricher.cpp, provider/IMetadataSource.hpp, cache/TradeLog.hpp.
Assumptions: Cache entries only move absent → present or absent → negative.
*/
#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "model/TradeData.h"
#include "provider/IMetadataSource.hpp"

class MetadataEnricher : public std::enable_shared_from_this<MetadataEnricher> {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    using BatchCompleteCb = std::function<void()>;

    enum class KeyState { Unknown, Pending, InFlight, Present, Negative };

    MetadataEnricher(Strand strand,
                     std::shared_ptr<IMetadataSource> source,
                     std::size_t batchSize,
                     std::chrono::milliseconds debounce);

    // Cached image for the market, if any. Unknown keys are queued for lookup.
    std::optional<std::string> resolve(const std::string& marketSlug, const std::string& conditionId);
    std::optional<std::string> resolve(const Trade& trade) {
        return resolve(trade.market_slug, trade.condition_id);
    }

    // Cache-only lookup; never queues.
    [[nodiscard]] std::optional<std::string> cachedImage(const std::string& marketSlug,
                                                         const std::string& conditionId) const;
    [[nodiscard]] std::optional<std::string> cachedImage(const Trade& trade) const {
        return cachedImage(trade.market_slug, trade.condition_id);
    }

    // Invoked on the strand after every completed batch (success or failure).
    void onBatchComplete(BatchCompleteCb cb) { m_onBatchComplete = std::move(cb); }

    // Re-enables lookups after stop(). The cache survives a stop/start cycle.
    void start();
    // Cancels the debounce timer and drops pending and in-flight keys; completions
    // arriving before the next start() are ignored.
    void stop();

    [[nodiscard]] KeyState state(const std::string& key) const;
    [[nodiscard]] std::size_t requestsSent() const noexcept { return m_requestsSent; }
    [[nodiscard]] std::size_t pendingCount() const noexcept { return m_pending.size(); }
    [[nodiscard]] std::size_t inFlightCount() const noexcept { return m_inFlight.size(); }
    [[nodiscard]] std::size_t cacheSize() const noexcept { return m_cache.size(); }

    static std::string slugKey(const std::string& slug) { return "slug:" + slug; }
    static std::string conditionKey(const std::string& conditionId) { return "cond:" + conditionId; }

private:
    void queueKey(const std::string& key);
    void armDebounce();
    void flushPending();
    void handleResponse(const std::vector<std::string>& keys, const MetadataResponse& response);
    void cacheIfAbsent(const std::string& key, const std::optional<std::string>& image);

    Strand m_strand;
    std::shared_ptr<IMetadataSource> m_source;
    std::size_t m_batchSize;
    std::chrono::milliseconds m_debounce;
    boost::asio::steady_timer m_debounceTimer;
    uint64_t m_timerGeneration = 0;
    bool m_timerArmed = false;
    bool m_stopped = false;

    // key → image; nullopt marks a negative entry
    std::unordered_map<std::string, std::optional<std::string>> m_cache;
    std::vector<std::string> m_pending;
    std::unordered_set<std::string> m_pendingSet;
    std::unordered_set<std::string> m_inFlight;
    std::size_t m_requestsSent = 0;

    BatchCompleteCb m_onBatchComplete;
};
