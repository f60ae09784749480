/*
Tidewatch — FeedConnection
Role: Connection lifecycle of the order stream; see FeedConnection.hpp.
Threading: Every handler below runs on m_strand. Transport and provider callbacks are
           re-dispatched onto it and tagged with the attempt that created them.
*/
#include "FeedConnection.hpp"
#include "TidewatchLogging.hpp"
#include "dispatch/MessageDispatcher.hpp"
#include "net/Url.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <type_traits>
#include <variant>

namespace net = boost::asio;

FeedConnection::FeedConnection(Strand strand,
                               std::shared_ptr<IUrlProvider> urlProvider,
                               WsTransportFactory transportFactory,
                               Options options)
    : m_strand(std::move(strand))
    , m_urlProvider(std::move(urlProvider))
    , m_transportFactory(std::move(transportFactory))
    , m_options(std::move(options))
    , m_subscriptions(m_options.platform, m_options.version)
    , m_connectTimer(m_strand)
    , m_reconnectTimer(m_strand)
{}

void FeedConnection::connect(ConnectResultCb done) {
    net::dispatch(m_strand, [self = shared_from_this(), done = std::move(done)]() mutable {
        const auto s = self->m_session.state();
        if (s == FeedState::Connecting || s == FeedState::Open) {
            tLog_Debug("connect() ignored, feed is" << toString(s));
            return;
        }
        self->m_reconnectTimer.cancel();
        self->startAttempt(std::move(done));
    });
}

void FeedConnection::disconnect() {
    net::dispatch(m_strand, [self = shared_from_this()]() {
        ++self->m_attempt;
        self->m_connectTimer.cancel();
        self->m_reconnectTimer.cancel();
        if (self->m_transport) {
            self->m_transport->close(WsTransport::kCloseNormal, "client disconnect");
            self->m_transport.reset();
        }
        self->m_attemptDone = nullptr;
        self->setState(FeedState::Closed);
        tLog_App("Feed disconnected");
    });
}

void FeedConnection::reconnectNow() {
    net::dispatch(m_strand, [self = shared_from_this()]() {
        tLog_App("Manual reconnect requested");
        self->m_reconnectTimer.cancel();
        self->m_session.countReconnect();
        self->dropTransport();
        self->startAttempt({});
    });
}

void FeedConnection::forceClose(int code, std::string reason) {
    net::dispatch(m_strand, [self = shared_from_this(), code, reason = std::move(reason)]() mutable {
        if (!self->m_transport || self->m_session.state() != FeedState::Open) return;
        tLog_Warning("Force-closing feed:" << code << QString::fromStdString(reason));
        self->m_transport->close(code, std::move(reason));
    });
}

void FeedConnection::startAttempt(ConnectResultCb done) {
    dropTransport();
    m_attemptDone = std::move(done);   // a superseded attempt never reports

    const uint64_t attempt = ++m_attempt;
    setState(FeedState::Connecting);

    m_connectTimer.expires_after(m_options.connectTimeout);
    m_connectTimer.async_wait([weak = weak_from_this(), attempt](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) self->onConnectTimeout(attempt);
    });

    if (!m_session.cachedUrl().empty()) {
        openTransport(attempt);
        return;
    }
    if (!m_urlProvider) {
        failAttempt(ConnectError::UrlUnavailable, "no subscription url provider", FeedState::Failed);
        return;
    }

    tLog_App("Requesting subscription url");
    m_urlProvider->fetchUrl([weak = weak_from_this(), strand = m_strand, attempt](UrlResult result) {
        net::post(strand, [weak, attempt, result = std::move(result)]() mutable {
            if (auto self = weak.lock()) self->onUrl(attempt, std::move(result));
        });
    });
}

void FeedConnection::onUrl(uint64_t attempt, UrlResult result) {
    if (attempt != m_attempt || m_session.state() != FeedState::Connecting) return;
    if (!result.ok) {
        failAttempt(ConnectError::UrlUnavailable, result.error, FeedState::Failed);
        return;
    }
    m_session.setCachedUrl(std::move(result.url));
    openTransport(attempt);
}

void FeedConnection::openTransport(uint64_t attempt) {
    const auto endpoint = parseEndpoint(m_session.cachedUrl());
    if (!endpoint || endpoint->scheme != "wss") {
        const std::string bad = m_session.cachedUrl();
        m_session.clearCachedUrl();   // the next attempt asks the provider again
        failAttempt(ConnectError::HandshakeFailed, "invalid stream url: " + bad, FeedState::Failed);
        return;
    }

    m_transport = m_transportFactory ? m_transportFactory() : nullptr;
    if (!m_transport) {
        failAttempt(ConnectError::HandshakeFailed, "no transport available", FeedState::Failed);
        return;
    }

    auto weak = weak_from_this();
    auto strand = m_strand;
    m_transport->onOpen([weak, strand, attempt]() {
        net::dispatch(strand, [weak, attempt]() {
            if (auto self = weak.lock()) self->onTransportOpen(attempt);
        });
    });
    m_transport->onError([weak, strand, attempt](std::string msg) {
        net::dispatch(strand, [weak, attempt, msg = std::move(msg)]() mutable {
            if (auto self = weak.lock()) self->onTransportError(attempt, std::move(msg));
        });
    });
    m_transport->onClosed([weak, strand, attempt](int code, std::string reason) {
        net::dispatch(strand, [weak, attempt, code, reason = std::move(reason)]() mutable {
            if (auto self = weak.lock()) self->onTransportClosed(attempt, code, std::move(reason));
        });
    });
    m_transport->onMessage([weak, strand, attempt](std::string payload) {
        net::dispatch(strand, [weak, attempt, payload = std::move(payload)]() mutable {
            if (auto self = weak.lock()) self->onTransportMessage(attempt, std::move(payload));
        });
    });

    tLog_App("Connecting to" << QString::fromStdString(endpoint->host) << "port"
             << QString::fromStdString(endpoint->port));
    m_transport->connect(endpoint->host, endpoint->port, endpoint->target);
}

void FeedConnection::onTransportOpen(uint64_t attempt) {
    if (attempt != m_attempt || m_session.state() != FeedState::Connecting) return;
    m_connectTimer.cancel();
    m_session.markOpened(Clock::now());
    m_session.setLastError(ConnectError::None, {});

    m_transport->send(m_subscriptions.buildSubscribeMsg());
    tLog_App("Feed open, subscribe frame sent");

    setState(FeedState::Open);
    finishAttempt(ConnectError::None, {});
}

void FeedConnection::onTransportError(uint64_t attempt, std::string message) {
    if (attempt != m_attempt || m_session.state() != FeedState::Connecting) return;
    failAttempt(ConnectError::HandshakeFailed, message, FeedState::Failed);
}

void FeedConnection::onTransportClosed(uint64_t attempt, int code, std::string reason) {
    if (attempt != m_attempt) return;
    m_transport.reset();

    if (code == WsTransport::kCloseNormal) {
        tLog_App("Feed closed normally:" << QString::fromStdString(reason));
        setState(FeedState::Closed);
        return;
    }
    scheduleReconnect(code, reason);
}

void FeedConnection::onTransportMessage(uint64_t attempt, std::string payload) {
    if (attempt != m_attempt) return;
    m_session.countFrame();

    auto result = MessageDispatcher::parseFrame(payload);
    for (auto& evt : result.events) {
        std::visit([this](auto&& ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, TradeEvent>) {
                m_session.markMessage(Clock::now());
                m_session.countTrade();
                if (m_onTrade) m_onTrade(std::move(ev.trade));
            } else if constexpr (std::is_same_v<T, SubscriptionAckEvent>) {
                m_session.markMessage(Clock::now());
                tLog_DataN(1, "Subscription acknowledged:" << QString::fromStdString(ev.subscriptionId));
            } else if constexpr (std::is_same_v<T, ProviderErrorEvent>) {
                m_session.markMessage(Clock::now());
                tLog_Warning("Provider error:" << QString::fromStdString(ev.message));
                if (m_onProviderError) m_onProviderError(ev.message);
            } else if constexpr (std::is_same_v<T, DecodeFailureEvent>) {
                m_session.countDecodeFailure();
                tLog_Warning("Dropped undecodable frame:" << QString::fromStdString(ev.reason)
                             << "(total" << static_cast<qulonglong>(m_session.decodeFailures()) << ")");
            }
        }, evt);
    }
}

void FeedConnection::onConnectTimeout(uint64_t attempt) {
    if (attempt != m_attempt || m_session.state() != FeedState::Connecting) return;
    failAttempt(ConnectError::TimedOut,
                "connect timed out after " + std::to_string(m_options.connectTimeout.count()) + " ms",
                FeedState::TimedOut);
}

void FeedConnection::scheduleReconnect(int code, const std::string& reason) {
    tLog_Warning("Feed closed with code" << code << QString::fromStdString(reason)
                 << "- reconnecting in" << static_cast<qlonglong>(m_options.reconnectBackoff.count()) << "ms");
    setState(FeedState::Reconnecting);
    m_session.countReconnect();

    const uint64_t attempt = m_attempt;
    m_reconnectTimer.expires_after(m_options.reconnectBackoff);
    m_reconnectTimer.async_wait([weak = weak_from_this(), attempt](const boost::system::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || attempt != self->m_attempt || self->m_session.state() != FeedState::Reconnecting) return;
        tLog_App("Reconnecting feed");
        self->startAttempt({});
    });
}

void FeedConnection::failAttempt(ConnectError error, const std::string& message, FeedState state) {
    m_connectTimer.cancel();
    ++m_attempt;   // late callbacks of this attempt are ignored from here on
    dropTransport();
    m_session.setLastError(error, message);
    tLog_Error("Feed connect failed (" << toString(error) << "):" << QString::fromStdString(message));
    setState(state);
    finishAttempt(error, message);
}

void FeedConnection::dropTransport() {
    if (!m_transport) return;
    auto transport = std::move(m_transport);
    transport->onOpen(nullptr);
    transport->onError(nullptr);
    transport->onClosed(nullptr);
    transport->onMessage(nullptr);
    transport->close(WsTransport::kCloseNormal, "superseded");
}

void FeedConnection::setState(FeedState s) {
    if (m_session.state() == s) return;
    m_session.setState(s);
    tLog_DataN(1, "Feed state ->" << toString(s));
    if (m_onStateChanged) m_onStateChanged(s);
}

void FeedConnection::finishAttempt(ConnectError error, const std::string& message) {
    auto done = std::move(m_attemptDone);
    m_attemptDone = nullptr;
    if (error != ConnectError::None && m_onConnectError) m_onConnectError(error, message);
    if (done) done(error, message);
}
