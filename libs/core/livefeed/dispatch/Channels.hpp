#pragma once

// Frame "type" values and control-frame constants of the order stream
namespace ch {
    inline constexpr const char* kAck       = "ack";
    inline constexpr const char* kEvent     = "event";
    inline constexpr const char* kError     = "error";

    inline constexpr const char* kSubscribe = "subscribe";
    inline constexpr const char* kOrders    = "orders";
    inline constexpr const char* kAllUsers  = "*";
}
