/*
Tidewatch — FeedConnection
Role: Owns the order-stream WebSocket: URL lookup, subscribe, frame decoding, close handling and the single scheduled reconnect.
Inputs/Outputs: Raw frames from a WsTransport in; decoded Trades and state changes out through callbacks.
Threading: All work runs on the pipeline strand; public methods may be called from any thread.
Performance: Decoding is one JSON parse per frame; the hot path allocates only the Trade.
Integration: Owned by LiveTradesPipeline; HealthMonitor drives forceClose() through the session it shares.
Observability: Lifecycle on tidewatch.app, frames and acks on tidewatch.data (throttled), decode failures as warnings.
Related: FeedConnection.cpp, FeedSession.hpp, ws/WsTransport.hpp, dispatch/MessageDispatcher.hpp.
Assumptions: The transport factory returns a fresh transport per attempt; closed transports are never reused.
*/
#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "FeedSession.hpp"
#include "model/TradeData.h"
#include "provider/IUrlProvider.hpp"
#include "ws/SubscriptionManager.hpp"
#include "ws/WsTransport.hpp"

class FeedConnection : public std::enable_shared_from_this<FeedConnection> {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    using Clock = std::chrono::steady_clock;

    using TradeCb         = std::function<void(Trade)>;
    using StateCb         = std::function<void(FeedState)>;
    using ConnectResultCb = std::function<void(ConnectError, std::string)>;
    using ProviderErrorCb = std::function<void(std::string)>;

    struct Options {
        std::chrono::milliseconds connectTimeout{10000};
        std::chrono::milliseconds reconnectBackoff{2000};
        std::string platform = "polymarket";
        int version = 1;
    };

    FeedConnection(Strand strand,
                   std::shared_ptr<IUrlProvider> urlProvider,
                   WsTransportFactory transportFactory,
                   Options options);

    // Starts an attempt unless one is in progress or the feed is open. The result
    // callback fires once per attempt: ConnectError::None on open, otherwise the failure.
    void connect(ConnectResultCb done = {});

    // Closes with 1000; no reconnect follows.
    void disconnect();

    // Drops whatever is in progress and starts a fresh attempt immediately.
    void reconnectNow();

    // Closes an open connection with an application code; anything but 1000 reconnects.
    void forceClose(int code, std::string reason);

    void onTrade(TradeCb cb) { m_onTrade = std::move(cb); }
    void onStateChanged(StateCb cb) { m_onStateChanged = std::move(cb); }
    // Connect-time failures only (URL, timeout, handshake); never retried automatically.
    void onConnectError(ConnectResultCb cb) { m_onConnectError = std::move(cb); }
    void onProviderError(ProviderErrorCb cb) { m_onProviderError = std::move(cb); }

    [[nodiscard]] FeedSession& session() noexcept { return m_session; }
    [[nodiscard]] const FeedSession& session() const noexcept { return m_session; }
    [[nodiscard]] const SubscriptionManager& subscriptions() const noexcept { return m_subscriptions; }

private:
    void startAttempt(ConnectResultCb done);
    void onUrl(uint64_t attempt, UrlResult result);
    void openTransport(uint64_t attempt);
    void onTransportOpen(uint64_t attempt);
    void onTransportError(uint64_t attempt, std::string message);
    void onTransportClosed(uint64_t attempt, int code, std::string reason);
    void onTransportMessage(uint64_t attempt, std::string payload);
    void onConnectTimeout(uint64_t attempt);
    void scheduleReconnect(int code, const std::string& reason);
    void failAttempt(ConnectError error, const std::string& message, FeedState state);
    void dropTransport();
    void setState(FeedState s);
    void finishAttempt(ConnectError error, const std::string& message);

    Strand m_strand;
    FeedSession m_session;
    std::shared_ptr<IUrlProvider> m_urlProvider;
    WsTransportFactory m_transportFactory;
    Options m_options;
    SubscriptionManager m_subscriptions;

    std::shared_ptr<WsTransport> m_transport;
    boost::asio::steady_timer m_connectTimer;
    boost::asio::steady_timer m_reconnectTimer;
    uint64_t m_attempt = 0;        // callbacks from older attempts are ignored
    ConnectResultCb m_attemptDone;

    TradeCb m_onTrade;
    StateCb m_onStateChanged;
    ConnectResultCb m_onConnectError;
    ProviderErrorCb m_onProviderError;
};
