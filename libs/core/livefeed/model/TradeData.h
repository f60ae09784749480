#ifndef TIDEWATCH_TRADEDATA_H
#define TIDEWATCH_TRADEDATA_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Side of an order-feed fill, as reported by the venue
enum class TradeSide {
    Buy,
    Sell,
    Unknown
};

enum class WhaleTier {
    None,
    Whale,   // notional >= 1,000
    Mega     // notional >= 10,000
};

inline constexpr double kWhaleThreshold     = 1000.0;
inline constexpr double kMegaWhaleThreshold = 10000.0;

// A single fill from the venue's order stream.
// Immutable after ingestion, except that a missing image may be attached later.
struct Trade
{
    std::string token_id;
    std::string token_label;      // outcome label: "Yes", "No", "Up", ...
    TradeSide   side = TradeSide::Unknown;
    std::string market_slug;
    std::string condition_id;
    double      shares = 0.0;             // raw share quantity
    double      shares_normalized = 0.0;  // decimal-adjusted share quantity
    double      price = 0.0;              // 0..1 probability price
    std::string tx_hash;
    std::string order_hash;       // empty when the venue did not supply one
    std::string title;
    std::string user;             // principal wallet
    std::string taker;
    int64_t     timestamp = 0;    // unix seconds
    std::optional<std::string> image;

    // order_hash when present, else "tx_hash-timestamp-token_id"
    [[nodiscard]] std::string identity() const {
        if (!order_hash.empty()) return order_hash;
        return tx_hash + "-" + std::to_string(timestamp) + "-" + token_id;
    }

    // Dollar-equivalent size. Falls back to raw shares when the normalized
    // quantity is missing.
    [[nodiscard]] double notional() const {
        const double qty = shares_normalized != 0.0 ? shares_normalized : shares;
        return price * qty;
    }

    [[nodiscard]] WhaleTier whaleTier() const {
        const double n = notional();
        if (n >= kMegaWhaleThreshold) return WhaleTier::Mega;
        if (n >= kWhaleThreshold) return WhaleTier::Whale;
        return WhaleTier::None;
    }

    [[nodiscard]] bool isWhale() const { return whaleTier() != WhaleTier::None; }
};

inline const char* toString(TradeSide side) {
    switch (side) {
        case TradeSide::Buy:  return "BUY";
        case TradeSide::Sell: return "SELL";
        default:              return "UNKNOWN";
    }
}

inline const char* toString(WhaleTier tier) {
    switch (tier) {
        case WhaleTier::Whale: return "whale";
        case WhaleTier::Mega:  return "mega";
        default:               return "none";
    }
}

/*
Order stream event ("type": "event"), venue = polymarket, stream type = orders:

{
  "type": "event",
  "subscription_id": "sub_9f2c",
  "data": {
    "token_id": "5711...",
    "token_label": "Yes",
    "side": "BUY",
    "market_slug": "will-btc-close-above-100k",
    "condition_id": "0x8a1f...",
    "shares": 1250000000,
    "shares_normalized": 1250.0,
    "price": 0.62,
    "tx_hash": "0x33ab...",
    "title": "Will BTC close above $100k?",
    "timestamp": 1760000000,
    "order_hash": "0x91cd...",
    "user": "0xabc...",
    "taker": "0xdef..."
  }
}

Market imagery is not always present on the event; the pipeline resolves it
through the metadata collaborator (see MetadataEnricher).
*/

#endif // TIDEWATCH_TRADEDATA_H
