#include "HttpMetadataSource.hpp"
#include "../net/HttpsClient.hpp"
#include <nlohmann/json.hpp>

namespace {

std::string stringOrEmpty(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // namespace

HttpMetadataSource::HttpMetadataSource(boost::asio::any_io_executor ex,
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

void HttpMetadataSource::fetch(MetadataRequest request, Completion done) {
    HttpsClient::Request req;
    req.method = boost::beast::http::verb::post;
    req.url = m_endpoint;
    req.body = buildRequestBody(request);
    req.bearerToken = m_token;
    req.timeout = m_timeout;

    HttpsClient::send(m_ex, m_sslCtx, std::move(req), [done = std::move(done)](HttpResponse res) {
        if (!res.ok) {
            MetadataResponse failed;
            failed.error = "metadata: " + res.error;
            done(std::move(failed));
            return;
        }
        done(parseResponse(res.body));
    });
}

std::string HttpMetadataSource::buildRequestBody(const MetadataRequest& request) {
    nlohmann::json body;
    body["conditionIds"] = request.conditionIds;
    body["eventSlugs"] = request.eventSlugs;
    return body.dump();
}

MetadataResponse HttpMetadataSource::parseResponse(std::string_view body) {
    MetadataResponse out;
    const auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        out.error = "metadata: response is not a JSON object";
        return out;
    }
    auto markets = j.find("markets");
    if (markets == j.end() || !markets->is_array()) {
        out.error = "metadata: response has no markets array";
        return out;
    }

    out.ok = true;
    for (const auto& m : *markets) {
        if (!m.is_object()) continue;
        MarketMetadata md;
        md.slug = stringOrEmpty(m, "slug");
        md.conditionId = stringOrEmpty(m, "conditionId");
        md.marketSlug = stringOrEmpty(m, "marketSlug");
        md.eventSlug = stringOrEmpty(m, "eventSlug");
        std::string image = stringOrEmpty(m, "image");
        if (!image.empty()) md.image = std::move(image);
        out.markets.push_back(std::move(md));
    }
    return out;
}
