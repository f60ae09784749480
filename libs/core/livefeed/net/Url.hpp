#pragma once
#include <optional>
#include <string>
#include <string_view>

// Split of a wss:// or https:// URL into the pieces Beast needs.
struct Endpoint {
    std::string scheme;   // "wss" or "https"
    std::string host;
    std::string port;     // defaults to 443
    std::string target;   // path + query, at least "/"
};

// Only TLS schemes are accepted; anything else yields nullopt.
inline std::optional<Endpoint> parseEndpoint(std::string_view url) {
    Endpoint ep;
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos) return std::nullopt;
    ep.scheme = std::string(url.substr(0, schemeEnd));
    if (ep.scheme != "wss" && ep.scheme != "https") return std::nullopt;

    std::string_view rest = url.substr(schemeEnd + 3);
    const auto pathStart = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, pathStart);
    if (pathStart == std::string_view::npos) {
        ep.target = "/";
    } else {
        ep.target = std::string(rest.substr(pathStart));
        if (ep.target.front() == '?') ep.target.insert(ep.target.begin(), '/');
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        ep.host = std::string(authority.substr(0, colon));
        ep.port = std::string(authority.substr(colon + 1));
    } else {
        ep.host = std::string(authority);
        ep.port = "443";
    }
    if (ep.host.empty() || ep.port.empty()) return std::nullopt;
    for (char c : ep.port) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    return ep;
}
