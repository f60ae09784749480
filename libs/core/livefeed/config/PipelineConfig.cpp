/*
Tidewatch — PipelineConfig
Role: Loads pipeline settings from a snake_case JSON file and the environment.
Observability: Logs the loaded path; parse failures are thrown to the caller.
Related: PipelineConfig.hpp.
*/
#include "PipelineConfig.hpp"
#include "TidewatchLogging.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

void readString(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key)) out = j.at(key).get<std::string>();
}

void readMillis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key)) out = std::chrono::milliseconds(j.at(key).get<int64_t>());
}

template <typename T>
void readNumber(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) out = j.at(key).get<T>();
}

void readEnv(const char* name, std::string& out) {
    if (const char* value = std::getenv(name); value && *value) {
        out = value;
    }
}

} // namespace

PipelineConfig PipelineConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("PipelineConfig: failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& ex) {
        throw std::runtime_error("PipelineConfig: failed to parse JSON from " + path + ": " + ex.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("PipelineConfig: top level of " + path + " must be an object");
    }

    PipelineConfig cfg;
    try {
        readString(j, "ws_url", cfg.wsUrl);
        readString(j, "url_provider_endpoint", cfg.urlProviderEndpoint);
        readString(j, "metadata_endpoint", cfg.metadataEndpoint);
        readString(j, "api_token", cfg.apiToken);
        readString(j, "platform", cfg.platform);
        readNumber(j, "protocol_version", cfg.protocolVersion);

        readMillis(j, "connect_timeout_ms", cfg.connectTimeout);
        readMillis(j, "reconnect_backoff_ms", cfg.reconnectBackoff);
        readMillis(j, "watchdog_interval_ms", cfg.watchdogInterval);
        readMillis(j, "stale_threshold_ms", cfg.staleThreshold);
        readMillis(j, "hard_reconnect_interval_ms", cfg.hardReconnectInterval);
        readMillis(j, "flush_interval_ms", cfg.flushInterval);
        readMillis(j, "stats_interval_ms", cfg.statsInterval);
        readMillis(j, "rankings_interval_ms", cfg.rankingsInterval);
        readMillis(j, "metadata_debounce_ms", cfg.metadataDebounce);
        readMillis(j, "http_timeout_ms", cfg.httpTimeout);
        readMillis(j, "wallet_sweep_interval_ms", cfg.walletSweepInterval);

        readNumber(j, "canonical_capacity", cfg.canonicalCapacity);
        readNumber(j, "whale_capacity", cfg.whaleCapacity);
        readNumber(j, "ranking_limit", cfg.rankingLimit);
        readNumber(j, "metadata_batch_size", cfg.metadataBatchSize);
        readNumber(j, "wallet_history_limit", cfg.walletHistoryLimit);
        readNumber(j, "max_wallet_profiles", cfg.maxWalletProfiles);
        if (j.contains("wallet_profile_ttl_s")) {
            cfg.walletProfileTtl = std::chrono::seconds(j.at("wallet_profile_ttl_s").get<int64_t>());
        }

        readNumber(j, "fresh_wallet_max_age_s", cfg.freshWalletMaxAgeSeconds);
        readNumber(j, "fresh_wallet_min_notional", cfg.freshWalletMinNotional);
        readNumber(j, "unusual_sizing_multiple", cfg.unusualSizingMultiple);
        readNumber(j, "repeated_entries_threshold", cfg.repeatedEntriesThreshold);
        readNumber(j, "rapid_cluster_count", cfg.rapidClusterCount);
        readNumber(j, "rapid_cluster_window_s", cfg.rapidClusterWindowSeconds);
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("PipelineConfig: invalid value in " + path + ": " + ex.what());
    }

    if (cfg.canonicalCapacity == 0 || cfg.whaleCapacity == 0 || cfg.metadataBatchSize == 0) {
        throw std::runtime_error("PipelineConfig: buffer capacities and batch size must be positive");
    }

    tLog_App("Loaded pipeline config from" << QString::fromStdString(path));
    return cfg;
}

void PipelineConfig::applyEnvironment() {
    readEnv("TIDEWATCH_WS_URL", wsUrl);
    readEnv("TIDEWATCH_URL_ENDPOINT", urlProviderEndpoint);
    readEnv("TIDEWATCH_METADATA_ENDPOINT", metadataEndpoint);
    readEnv("TIDEWATCH_API_TOKEN", apiToken);
}
