#pragma once
#include "WsTransport.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/tcp_stream.hpp>  // ensure tcp_stream is declared
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <deque>
#include <memory>
#include <string>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// wss:// transport over Beast. Shares the caller's strand so that every callback
// runs serialized with the rest of the pipeline.
class BeastWsTransport : public WsTransport,
                         public std::enable_shared_from_this<BeastWsTransport> {
public:
    using Strand = net::strand<net::io_context::executor_type>;

    BeastWsTransport(Strand strand, ssl::context& sslCtx)
        : strand_(std::move(strand))
        , resolver_(strand_)
        , ws_(strand_, sslCtx)
        , pingTimer_(strand_)
    {}

    void connect(std::string host, std::string port, std::string target) override;
    void close(int code, std::string reason) override;
    void send(std::string msg) override;

    void onMessage(MessageCb cb) override { onMessage_ = std::move(cb); }
    void onOpen(OpenCb cb) override { onOpen_ = std::move(cb); }
    void onClosed(CloseCb cb) override { onClosed_ = std::move(cb); }
    void onError(ErrorCb cb) override { onError_ = std::move(cb); }

private:
    // Callbacks
    MessageCb onMessage_;
    OpenCb    onOpen_;
    CloseCb   onClosed_;
    ErrorCb   onError_;

    // Beast state
    Strand strand_;
    tcp::resolver resolver_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    beast::flat_buffer buf_;
    net::steady_timer pingTimer_;
    std::deque<std::string> writeQueue_;

    // State
    std::string host_;
    std::string port_;
    std::string target_;
    bool open_ = false;
    bool closing_ = false;
    bool closedReported_ = false;
    bool abandoned_ = false;   // close() before the handshake finished
    int closeCode_ = kCloseNormal;
    std::string closeReason_;

    // Handlers
    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type);
    void onSslHandshake(beast::error_code ec);
    void onWsHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite();
    void schedulePing();
    void failBeforeOpen(const std::string& what, beast::error_code ec);
    void reportClosed(int code, std::string reason);
};
