#ifndef TIDEWATCH_PIPELINETYPES_H
#define TIDEWATCH_PIPELINETYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Heuristic anomaly tags attached to a trade from its wallet's rolling profile
enum class SignalType {
    FreshWallet,
    UnusualSizing,
    RepeatedEntries,
    RapidClustering
};

struct AnomalySignal {
    SignalType  type;
    std::string detail;   // e.g. "Wallet age: 4h", "8.0x avg size"
};

inline const char* toString(SignalType type) {
    switch (type) {
        case SignalType::FreshWallet:     return "fresh_wallet";
        case SignalType::UnusualSizing:   return "unusual_sizing";
        case SignalType::RepeatedEntries: return "repeated_entries";
        case SignalType::RapidClustering: return "rapid_clustering";
    }
    return "unknown";
}

inline std::optional<SignalType> signalTypeFromString(const std::string& name) {
    if (name == "fresh_wallet")     return SignalType::FreshWallet;
    if (name == "unusual_sizing")   return SignalType::UnusualSizing;
    if (name == "repeated_entries") return SignalType::RepeatedEntries;
    if (name == "rapid_clustering") return SignalType::RapidClustering;
    return std::nullopt;
}

struct AggregateStats {
    double      totalVolume = 0.0;
    double      buyVolume = 0.0;
    double      sellVolume = 0.0;
    std::size_t tradeCount = 0;
    double      avgTradeSize = 0.0;
    double      largestTrade = 0.0;
    std::size_t whaleCount = 0;
    double      buyPressure = 50.0;   // buy share of buy+sell flow, percent
    double      imbalance = 0.0;      // (buy - sell) / (buy + sell), percent
};

struct TraderStats {
    std::string wallet;
    double      volume = 0.0;
    std::size_t trades = 0;
    std::size_t markets = 0;
    double      buyPercent = 0.0;
};

struct MarketVolume {
    std::string slug;
    std::string title;
    std::optional<std::string> image;
    double      volume = 0.0;
    std::size_t trades = 0;
};

enum class SideFilter { All, Buy, Sell };
enum class TokenFilter { All, Yes, No };

// Active predicate configuration for the materialised view
struct FilterState {
    SideFilter  side = SideFilter::All;
    double      minVolume = 0.0;
    bool        whalesOnly = false;
    TokenFilter token = TokenFilter::All;
    std::string marketSlug;          // empty = all markets
    std::string search;              // title / wallet / slug, case-insensitive
    bool        hideNoiseMarkets = false;
    bool        trackedOnly = false;
    bool        signalOnly = false;
    std::set<SignalType> enabledSignals{SignalType::FreshWallet,
                                        SignalType::UnusualSizing,
                                        SignalType::RepeatedEntries,
                                        SignalType::RapidClustering};
};

#endif // TIDEWATCH_PIPELINETYPES_H
