/*
Tidewatch — HttpsClient
Role: One-shot asynchronous HTTPS request (resolve, connect, TLS, write, read) for the side channels of the feed.
Inputs/Outputs: Method, URL, optional JSON body and bearer token; completes with status + body or an error string.
Threading: Runs on the executor it is given; the completion handler is invoked on that executor.
Performance: A fresh connection per request; the side channels are low-volume (URL lookup, batched metadata).
Integration: Used by HttpUrlProvider and HttpMetadataSource.
Observability: Failures are handed to the caller, which decides how to log them.
Related: HttpsClient.cpp, Url.hpp, BeastWsTransport.hpp.
Assumptions: The shared ssl::context outlives every request started with it.
*/
#pragma once
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

struct HttpResponse {
    bool        ok = false;     // transport succeeded and status is 2xx
    unsigned    status = 0;
    std::string body;
    std::string error;          // set when ok == false
};

class HttpsClient : public std::enable_shared_from_this<HttpsClient> {
public:
    using Completion = std::function<void(HttpResponse)>;

    struct Request {
        boost::beast::http::verb method = boost::beast::http::verb::get;
        std::string url;
        std::string body;          // sent as application/json when non-empty
        std::string bearerToken;
        std::chrono::milliseconds timeout{10000};
    };

    // Starts the request; the returned client keeps itself alive until completion.
    static void send(boost::asio::any_io_executor ex,
                     boost::asio::ssl::context& sslCtx,
                     Request request,
                     Completion done);

    HttpsClient(boost::asio::any_io_executor ex, boost::asio::ssl::context& sslCtx,
                Request request, Completion done);

private:
    void run();
    void onResolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
    void onConnect(boost::beast::error_code ec);
    void onHandshake(boost::beast::error_code ec);
    void onWrite(boost::beast::error_code ec);
    void onRead(boost::beast::error_code ec);
    void fail(const std::string& what, boost::beast::error_code ec);
    void finish(HttpResponse response);

    boost::asio::ip::tcp::resolver resolver_;
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> req_;
    boost::beast::http::response<boost::beast::http::string_body> res_;
    Request request_;
    Completion done_;
    std::string host_;
    std::string port_;
    bool finished_ = false;
};
