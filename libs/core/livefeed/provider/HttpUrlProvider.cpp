#include "HttpUrlProvider.hpp"
#include "../net/HttpsClient.hpp"
#include <nlohmann/json.hpp>

HttpUrlProvider::HttpUrlProvider(boost::asio::any_io_executor ex,
                                 boost::asio::ssl::context& sslCtx,
                                 std::string endpoint,
                                 std::string bearerToken,
                                 std::chrono::milliseconds timeout)
    : m_ex(std::move(ex))
    , m_sslCtx(sslCtx)
    , m_endpoint(std::move(endpoint))
    , m_token(std::move(bearerToken))
    , m_timeout(timeout)
{}

void HttpUrlProvider::fetchUrl(Completion done) {
    HttpsClient::Request req;
    req.method = boost::beast::http::verb::post;
    req.url = m_endpoint;
    req.body = "{}";
    req.bearerToken = m_token;
    req.timeout = m_timeout;

    HttpsClient::send(m_ex, m_sslCtx, std::move(req), [done = std::move(done)](HttpResponse res) {
        UrlResult result;
        if (!res.ok) {
            result.error = "url provider: " + res.error;
        } else if (auto url = parseWsUrl(res.body)) {
            result.ok = true;
            result.url = std::move(*url);
        } else {
            result.error = "url provider: response has no wsUrl";
        }
        done(std::move(result));
    });
}

std::optional<std::string> HttpUrlProvider::parseWsUrl(std::string_view body) {
    const auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    auto it = j.find("wsUrl");
    if (it == j.end() || !it->is_string()) return std::nullopt;
    std::string url = it->get<std::string>();
    if (url.empty()) return std::nullopt;
    return url;
}
