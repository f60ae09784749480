/*
Tidewatch — PipelineConfig
Role: Every tunable of the live trade pipeline: endpoints, timers, buffer bounds, detection thresholds.
Inputs/Outputs: Defaults in-code; optionally loaded from a JSON file and overridden by environment variables.
Threading: Plain value type; copied into each component at construction.
Integration: Built once by the application (or tests) and handed to LiveTradesPipeline.
Observability: loadFromFile() logs the path it loaded.
Related: PipelineConfig.cpp, LiveTradesPipeline.hpp.
Assumptions: Durations in the JSON file are given in milliseconds unless the key says otherwise.
*/
#pragma once
#include <chrono>
#include <cstddef>
#include <string>

struct PipelineConfig {
    // Upstream endpoints
    std::string wsUrl;               // fixed stream URL; when empty the URL provider is asked
    std::string urlProviderEndpoint; // https endpoint returning {"wsUrl": "..."}
    std::string metadataEndpoint;    // https endpoint answering {conditionIds, eventSlugs}
    std::string apiToken;            // optional bearer token for both endpoints

    // Subscription control frame
    std::string platform = "polymarket";
    int         protocolVersion = 1;

    // FeedConnection
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds reconnectBackoff{2000};

    // HealthMonitor
    std::chrono::milliseconds watchdogInterval{5000};
    std::chrono::milliseconds staleThreshold{15000};
    std::chrono::milliseconds hardReconnectInterval{5 * 60 * 1000};

    // IngestQueue / buffers
    std::chrono::milliseconds flushInterval{50};
    std::size_t canonicalCapacity = 200;
    std::size_t whaleCapacity = 2000;

    // AggregationEngine
    std::chrono::milliseconds statsInterval{500};
    std::chrono::milliseconds rankingsInterval{1000};
    std::size_t rankingLimit = 10;

    // MetadataEnricher
    std::size_t metadataBatchSize = 20;
    std::chrono::milliseconds metadataDebounce{1000};
    std::chrono::milliseconds httpTimeout{10000};

    // WalletActivityTracker
    std::size_t walletHistoryLimit = 100;
    std::size_t maxWalletProfiles = 50000;
    std::chrono::seconds walletProfileTtl{6 * 60 * 60};
    std::chrono::milliseconds walletSweepInterval{60000};

    // SignalDetector
    int64_t freshWalletMaxAgeSeconds = 24 * 60 * 60;
    double  freshWalletMinNotional = 500.0;
    double  unusualSizingMultiple = 3.0;
    std::size_t repeatedEntriesThreshold = 3;
    std::size_t rapidClusterCount = 3;
    int64_t rapidClusterWindowSeconds = 30 * 60;

    /// Load a JSON config file over the defaults.  Throws std::runtime_error
    /// when the file cannot be opened or parsed.
    static PipelineConfig loadFromFile(const std::string& path);

    /// Apply TIDEWATCH_WS_URL / TIDEWATCH_URL_ENDPOINT / TIDEWATCH_METADATA_ENDPOINT /
    /// TIDEWATCH_API_TOKEN when set.
    void applyEnvironment();
};
