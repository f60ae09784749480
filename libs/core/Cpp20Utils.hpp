#pragma once

// C++20 utilities for the Tidewatch live trade pipeline
// Hot-path helpers: number conversion, side detection, case-insensitive matching, log formatting

#include <string>
#include <string_view>
#include <format>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <cstdint>
#include <chrono>
#include <ctime>
#include "livefeed/model/TradeData.h"

namespace Cpp20Utils {

inline char asciiToLower(unsigned char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (asciiToLower(static_cast<unsigned char>(lhs[i])) != asciiToLower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

inline std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(asciiToLower(static_cast<unsigned char>(c)));
    return out;
}

/**
 * Case-insensitive substring search (ASCII)
 * @param haystack Text to search in
 * @param needle Text to look for; an empty needle always matches
 */
inline bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    if (needle.size() > haystack.size()) return false;
    for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
        if (equalsIgnoreCase(haystack.substr(i, needle.size()), needle)) {
            return true;
        }
    }
    return false;
}

/**
 * Fast string-to-double conversion
 * @return The value when the whole string is a finite number, nullopt otherwise
 */
inline std::optional<double> fastStringToDouble(std::string_view str) {
    if (str.empty()) return std::nullopt;
    // std::strtod needs a terminated buffer
    const std::string buffer(str);
    const char* begin = buffer.c_str();
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end != begin + buffer.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

/**
 * Side detection, case-insensitive ("BUY", "buy", "Sell", ...)
 */
inline TradeSide fastSideDetection(std::string_view side) {
    if (equalsIgnoreCase(side, "BUY")) return TradeSide::Buy;
    if (equalsIgnoreCase(side, "SELL")) return TradeSide::Sell;
    return TradeSide::Unknown;
}

/**
 * Compact dollar formatting used in logs and signal details: $950, $1.2k, $3.40M
 */
inline std::string formatVolume(double volume) {
    if (volume >= 1000000.0) return std::format("${:.2f}M", volume / 1000000.0);
    if (volume >= 1000.0) return std::format("${:.1f}k", volume / 1000.0);
    return std::format("${:.0f}", volume);
}

/**
 * Trade log line
 */
inline std::string formatTradeLog(const Trade& trade, std::size_t logSize) {
    return std::format("{} {} {} @ {:.3f} {} [{}] ({} in log)",
        toString(trade.side), trade.token_label, formatVolume(trade.notional()),
        trade.price, trade.market_slug, toString(trade.whaleTier()), logSize);
}

/**
 * Format throughput metric
 * @param operationName Name of the operation
 * @param perMinute Events per minute
 */
inline std::string formatThroughput(const std::string& operationName, double perMinute) {
    return std::format("{}: {:.0f} events/min", operationName, perMinute);
}

/**
 * Unix seconds → "2025-10-09T12:34:56Z"
 */
inline std::string formatUnixTimestamp(int64_t unixSeconds) {
    const std::time_t t = static_cast<std::time_t>(unixSeconds);
    std::tm utc{};
    gmtime_r(&t, &utc);
    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
        utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
        utc.tm_hour, utc.tm_min, utc.tm_sec);
}

} // namespace Cpp20Utils
