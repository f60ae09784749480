#pragma once
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "../model/TradeData.h"
#include "Channels.hpp"
#include "Cpp20Utils.hpp"

struct TradeEvent { Trade trade; };
struct SubscriptionAckEvent { std::string subscriptionId; };
struct ProviderErrorEvent { std::string message; };
struct DecodeFailureEvent { std::string reason; };

using Event = std::variant<TradeEvent, SubscriptionAckEvent, ProviderErrorEvent, DecodeFailureEvent>;

struct DispatchResult { std::vector<Event> events; };

class MessageDispatcher {
public:
    // Raw text frame → events. Malformed JSON yields a single DecodeFailureEvent.
    static DispatchResult parseFrame(std::string_view payload) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(payload);
        } catch (const nlohmann::json::parse_error& e) {
            DispatchResult out;
            out.events.emplace_back(DecodeFailureEvent{std::string("invalid json: ") + e.what()});
            return out;
        }
        return parse(j);
    }

    static DispatchResult parse(const nlohmann::json& j) {
        DispatchResult out;
        if (!j.is_object()) {
            out.events.emplace_back(DecodeFailureEvent{"frame is not an object"});
            return out;
        }

        const std::string type = stringField(j, "type");

        if (type == ch::kEvent) {
            if (!j.contains("data") || !j["data"].is_object()) {
                out.events.emplace_back(DecodeFailureEvent{"event frame without data object"});
                return out;
            }
            std::string reason;
            if (auto trade = decodeTrade(j["data"], reason)) {
                out.events.emplace_back(TradeEvent{std::move(*trade)});
            } else {
                out.events.emplace_back(DecodeFailureEvent{std::move(reason)});
            }
        } else if (type == ch::kAck) {
            out.events.emplace_back(SubscriptionAckEvent{stringField(j, "subscription_id")});
        } else if (type == ch::kError) {
            std::string msg = stringField(j, "message");
            if (msg.empty()) msg = stringField(j, "error");
            if (msg.empty()) msg = "provider error";
            out.events.emplace_back(ProviderErrorEvent{std::move(msg)});
        } else {
            out.events.emplace_back(DecodeFailureEvent{"unknown frame type '" + type + "'"});
        }

        return out;
    }

    // Decode one order-stream record. Returns nullopt (with reason) when the record
    // has no usable identity, price, size or timestamp.
    static std::optional<Trade> decodeTrade(const nlohmann::json& d, std::string& reason) {
        Trade trade;
        trade.token_id     = stringField(d, "token_id");
        trade.token_label  = stringField(d, "token_label");
        trade.side         = Cpp20Utils::fastSideDetection(stringField(d, "side"));
        trade.market_slug  = stringField(d, "market_slug");
        trade.condition_id = stringField(d, "condition_id");
        trade.tx_hash      = stringField(d, "tx_hash");
        trade.order_hash   = stringField(d, "order_hash");
        trade.title        = stringField(d, "title");
        trade.user         = stringField(d, "user");
        trade.taker        = stringField(d, "taker");

        if (trade.order_hash.empty() && trade.tx_hash.empty()) {
            reason = "trade without order_hash or tx_hash";
            return std::nullopt;
        }

        const auto price = numberField(d, "price");
        if (!price) { reason = "trade without numeric price"; return std::nullopt; }
        trade.price = *price;

        const auto shares = numberField(d, "shares");
        const auto normalized = numberField(d, "shares_normalized");
        if (!shares && !normalized) { reason = "trade without share quantity"; return std::nullopt; }
        trade.shares = shares.value_or(0.0);
        trade.shares_normalized = normalized.value_or(0.0);

        const auto ts = numberField(d, "timestamp");
        if (!ts) { reason = "trade without timestamp"; return std::nullopt; }
        // 2^63 is exactly representable; anything at or past it does not fit int64_t.
        constexpr double kInt64Bound = 9223372036854775808.0;
        if (*ts >= kInt64Bound || *ts < -kInt64Bound) {
            reason = "trade timestamp out of range";
            return std::nullopt;
        }
        trade.timestamp = static_cast<int64_t>(*ts);

        for (const char* key : {"image", "market_image", "icon"}) {
            std::string img = stringField(d, key);
            if (!img.empty()) { trade.image = std::move(img); break; }
        }
        return trade;
    }

private:
    static std::string stringField(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) return {};
        return it->get<std::string>();
    }

    // JSON number or numeric string; non-finite values are rejected
    static std::optional<double> numberField(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end()) return std::nullopt;
        if (it->is_number()) {
            const double v = it->get<double>();
            if (!std::isfinite(v)) return std::nullopt;
            return v;
        }
        if (it->is_string()) {
            return Cpp20Utils::fastStringToDouble(it->get_ref<const std::string&>());
        }
        return std::nullopt;
    }
};
