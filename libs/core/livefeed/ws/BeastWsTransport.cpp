#include "BeastWsTransport.hpp"
#include <boost/beast/core.hpp>  // covers buffers, flat_buffer, etc.
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <openssl/err.h>


void BeastWsTransport::connect(std::string host, std::string port, std::string target) {
    net::dispatch(strand_, [self = shared_from_this(), h = std::move(host), p = std::move(port),
                            t = std::move(target)]() mutable {
        self->host_ = std::move(h);
        self->port_ = std::move(p);
        self->target_ = std::move(t);
        self->resolver_.async_resolve(self->host_, self->port_,
            [self](beast::error_code ec, tcp::resolver::results_type results){
                self->onResolve(ec, results);
            });
    });
}

void BeastWsTransport::close(int code, std::string reason) {
    net::dispatch(strand_, [self = shared_from_this(), code, r = std::move(reason)]() mutable {
        if (self->closing_ || self->closedReported_ || self->abandoned_) return;
        self->pingTimer_.cancel();

        if (!self->open_) {
            // Attempt still in progress: tear it down without reporting anything.
            self->abandoned_ = true;
            self->resolver_.cancel();
            beast::get_lowest_layer(self->ws_).close();
            return;
        }

        self->closing_ = true;
        self->closeCode_ = code;
        self->closeReason_ = r;
        websocket::close_reason cr(static_cast<websocket::close_code>(code), r);
        self->ws_.async_close(cr, [self](beast::error_code){
            self->reportClosed(self->closeCode_, self->closeReason_);
        });
    });
}

void BeastWsTransport::send(std::string msg) {
    net::post(strand_, [self = shared_from_this(), m = std::move(msg)]() mutable {
        if (!self->open_ || self->closing_) return;
        self->writeQueue_.emplace_back(std::move(m));
        if (self->writeQueue_.size() == 1) {
            self->doWrite();
        }
    });
}

void BeastWsTransport::failBeforeOpen(const std::string& what, beast::error_code ec) {
    if (abandoned_) return;
    abandoned_ = true;
    if (onError_) onError_(what + ": " + ec.message());
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (abandoned_) return;
    if (ec) return failBeforeOpen("resolve", ec);
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws_).async_connect(results,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type ep){
            self->onConnect(ec, ep);
        });
}

void BeastWsTransport::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (abandoned_) return;
    if (ec) return failBeforeOpen("connect", ec);
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host_.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return failBeforeOpen("sni", ssl_ec);
    }
    if (!SSL_set1_host(ws_.next_layer().native_handle(), host_.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return failBeforeOpen("verify host", ssl_ec);
    }
    ws_.next_layer().set_verify_mode(ssl::verify_peer);
    ws_.next_layer().async_handshake(ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec){ self->onSslHandshake(ec); });
}

void BeastWsTransport::onSslHandshake(beast::error_code ec) {
    if (abandoned_) return;
    if (ec) return failBeforeOpen("tls handshake", ec);
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.async_handshake(host_, target_,
        [self = shared_from_this()](beast::error_code ec){ self->onWsHandshake(ec); });
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (abandoned_) return;
    if (ec) return failBeforeOpen("websocket handshake", ec);
    open_ = true;
    if (onOpen_) onOpen_();
    doRead();
    schedulePing();
}

void BeastWsTransport::doRead() {
    ws_.async_read(buf_, [self = shared_from_this()](beast::error_code ec, std::size_t bytes){
        self->onRead(ec, bytes);
    });
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    if (ec) {
        pingTimer_.cancel();
        if (closing_) {
            reportClosed(closeCode_, closeReason_);
        } else if (ec == websocket::error::closed) {
            const auto& r = ws_.reason();
            reportClosed(static_cast<int>(r.code), std::string(r.reason.data(), r.reason.size()));
        } else {
            reportClosed(kCloseAbnormal, ec.message());
        }
        return;
    }

    if (onMessage_) {
        auto b = buf_.data();
        std::string payload(static_cast<const char*>(b.data()), b.size());
        buf_.consume(buf_.size());
        onMessage_(std::move(payload));
    } else {
        buf_.consume(buf_.size());
    }

    if (!closedReported_) doRead();
}

void BeastWsTransport::doWrite() {
    if (writeQueue_.empty()) return;
    const auto& front = writeQueue_.front();
    ws_.async_write(net::buffer(front), [self = shared_from_this()](beast::error_code ec, std::size_t){
        if (ec) {
            // The pending read observes the broken socket and reports the close.
            self->writeQueue_.clear();
            beast::get_lowest_layer(self->ws_).close();
            return;
        }
        self->writeQueue_.pop_front();
        if (!self->writeQueue_.empty()) self->doWrite();
    });
}

void BeastWsTransport::schedulePing() {
    pingTimer_.expires_after(std::chrono::seconds(25));
    pingTimer_.async_wait([self = shared_from_this()](beast::error_code ec){
        if (ec || self->closing_ || self->closedReported_) return;
        self->ws_.async_ping({}, [self](beast::error_code ec2){
            if (ec2) return;   // the read loop reports the failure
            self->schedulePing();
        });
    });
}

void BeastWsTransport::reportClosed(int code, std::string reason) {
    if (closedReported_) return;
    closedReported_ = true;
    open_ = false;
    if (onClosed_) onClosed_(code, std::move(reason));
}
