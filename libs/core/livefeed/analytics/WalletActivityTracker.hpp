/*
Tidewatch — WalletActivityTracker
Role: Rolling per-wallet activity profiles that feed the anomaly signals.
Inputs/Outputs: record() per decoded trade; profile lookups by wallet address (case-insensitive).
Threading: Not thread-safe; mutated on the pipeline strand. The pipeline publishes copies for other threads.
Performance: O(1) average record/lookup; LRU list plus hash map, history bounded per wallet.
Integration: Fed by LiveTradesPipeline before a trade is queued; read by SignalDetector.
Observability: evictExpired() returns the number of dropped profiles for the caller to log.
Related: WalletActivityTracker.cpp, SignalDetector.hpp.
Assumptions: A trade identity is recorded once; resent trades are ignored.
*/
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <list>
#include <string>
#include <string_view>
#include <unordered_map>
#include "../model/TradeData.h"

// Compact view of a trade kept in a wallet's history
struct WalletTradeEntry {
    std::string identity;
    std::string marketSlug;
    double      notional = 0.0;
    int64_t     timestamp = 0;
};

struct WalletProfile {
    using Clock = std::chrono::steady_clock;

    std::string wallet;                  // lower-cased
    int64_t     firstSeen = 0;           // unix seconds of the earliest trade seen
    Clock::time_point lastUpdated{};     // drives eviction
    std::deque<WalletTradeEntry> history;   // chronological by arrival, bounded
    std::size_t tradeCount = 0;          // cumulative, not bounded by history
    double      totalVolume = 0.0;       // cumulative notional
    std::unordered_map<std::string, std::size_t> marketEntries;

    [[nodiscard]] double avgTradeSize() const {
        return tradeCount > 0 ? totalVolume / static_cast<double>(tradeCount) : 0.0;
    }
};

class WalletActivityTracker {
public:
    using Clock = std::chrono::steady_clock;

    struct Limits {
        std::size_t historyLimit = 100;
        std::size_t maxProfiles = 50000;
        std::chrono::seconds ttl{6 * 60 * 60};
    };

    WalletActivityTracker();
    explicit WalletActivityTracker(Limits limits);

    // Creates or updates the trade's wallet profile. Trades without a wallet are ignored
    // and return nullptr.
    const WalletProfile* record(const Trade& trade, Clock::time_point now = Clock::now());

    [[nodiscard]] const WalletProfile* find(std::string_view wallet) const;

    // Drops profiles idle for longer than the TTL; returns how many were removed.
    std::size_t evictExpired(Clock::time_point now = Clock::now());

    [[nodiscard]] std::size_t size() const noexcept { return m_profiles.size(); }
    [[nodiscard]] const Limits& limits() const noexcept { return m_limits; }

    void clear();

private:
    struct Slot {
        WalletProfile profile;
        std::list<std::string>::iterator lruPos;
    };

    void touch(Slot& slot);
    void enforceCapacity();

    Limits m_limits;
    std::unordered_map<std::string, Slot> m_profiles;
    std::list<std::string> m_lru;   // front = most recently updated
};
