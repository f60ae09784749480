#pragma once
#include <functional>
#include <memory>
#include <string>

// Pure transport interface (no provider logic).
// One instance per connection attempt; a closed transport is never reopened.
class WsTransport {
public:
    using MessageCb = std::function<void(std::string)>; // own the data to avoid dangling views
    using OpenCb    = std::function<void()>;
    using CloseCb   = std::function<void(int code, std::string reason)>;
    using ErrorCb   = std::function<void(std::string)>;

    // Standard and application close codes seen by the feed
    static constexpr int kCloseNormal   = 1000;
    static constexpr int kCloseAbnormal = 1006;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    virtual void connect(std::string host, std::string port, std::string target) = 0;
    virtual void close(int code, std::string reason) = 0;
    virtual void send(std::string msg) = 0; // serialized by implementation

    // onOpen after the WebSocket handshake; onError for failures before that point;
    // onClosed exactly once for a connection that had opened.
    virtual void onMessage(MessageCb) = 0;
    virtual void onOpen(OpenCb) = 0;
    virtual void onClosed(CloseCb) = 0;
    virtual void onError(ErrorCb) = 0;
};

using WsTransportFactory = std::function<std::shared_ptr<WsTransport>()>;
