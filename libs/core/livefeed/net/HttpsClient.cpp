/*
Tidewatch — HttpsClient
Role: Beast async chain for a single HTTPS request/response.
Related: HttpsClient.hpp.
*/
#include "HttpsClient.hpp"
#include "Url.hpp"
#include <boost/asio/post.hpp>
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

void HttpsClient::send(net::any_io_executor ex, ssl::context& sslCtx,
                       Request request, Completion done) {
    auto client = std::make_shared<HttpsClient>(ex, sslCtx, std::move(request), std::move(done));
    client->run();
}

HttpsClient::HttpsClient(net::any_io_executor ex, ssl::context& sslCtx,
                         Request request, Completion done)
    : resolver_(ex)
    , stream_(ex, sslCtx)
    , request_(std::move(request))
    , done_(std::move(done))
{}

void HttpsClient::run() {
    const auto endpoint = parseEndpoint(request_.url);
    if (!endpoint || endpoint->scheme != "https") {
        HttpResponse response;
        response.error = "invalid https url: " + request_.url;
        // Complete asynchronously so callers never re-enter from send().
        net::post(resolver_.get_executor(), [self = shared_from_this(), response]() mutable {
            self->finish(std::move(response));
        });
        return;
    }
    host_ = endpoint->host;
    port_ = endpoint->port;

    req_.method(request_.method);
    req_.target(endpoint->target);
    req_.version(11);
    req_.set(http::field::host, host_);
    req_.set(http::field::user_agent, "tidewatch/1.0");
    req_.set(http::field::accept, "application/json");
    if (!request_.bearerToken.empty()) {
        req_.set(http::field::authorization, "Bearer " + request_.bearerToken);
    }
    if (!request_.body.empty()) {
        req_.set(http::field::content_type, "application/json");
        req_.body() = request_.body;
    }
    req_.prepare_payload();

    resolver_.async_resolve(host_, port_,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
            self->onResolve(ec, std::move(results));
        });
}

void HttpsClient::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail("resolve", ec);

    // One deadline covers connect, handshake, write and read.
    beast::get_lowest_layer(stream_).expires_after(request_.timeout);
    beast::get_lowest_layer(stream_).async_connect(results,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
            self->onConnect(ec);
        });
}

void HttpsClient::onConnect(beast::error_code ec) {
    if (ec) return fail("connect", ec);

    if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())) {
        beast::error_code sslEc(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return fail("sni", sslEc);
    }
    if (!SSL_set1_host(stream_.native_handle(), host_.c_str())) {
        beast::error_code sslEc(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return fail("verify host", sslEc);
    }
    stream_.set_verify_mode(ssl::verify_peer);
    stream_.async_handshake(ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec) { self->onHandshake(ec); });
}

void HttpsClient::onHandshake(beast::error_code ec) {
    if (ec) return fail("tls handshake", ec);
    http::async_write(stream_, req_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onWrite(ec); });
}

void HttpsClient::onWrite(beast::error_code ec) {
    if (ec) return fail("write", ec);
    http::async_read(stream_, buffer_, res_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onRead(ec); });
}

void HttpsClient::onRead(beast::error_code ec) {
    if (ec) return fail("read", ec);

    HttpResponse response;
    response.status = res_.result_int();
    response.body = std::move(res_.body());
    response.ok = response.status >= 200 && response.status < 300;
    if (!response.ok) {
        response.error = "http status " + std::to_string(response.status);
    }

    beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(5));
    stream_.async_shutdown([self = shared_from_this()](beast::error_code) {
        // Servers commonly drop the connection without close_notify; the response is already complete.
    });
    finish(std::move(response));
}

void HttpsClient::fail(const std::string& what, beast::error_code ec) {
    HttpResponse response;
    response.error = what + ": " + ec.message();
    finish(std::move(response));
}

void HttpsClient::finish(HttpResponse response) {
    if (finished_) return;
    finished_ = true;
    if (done_) done_(std::move(response));
}
