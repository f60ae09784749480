#pragma once
#include "IUrlProvider.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

// Asks an HTTPS endpoint for the stream URL; the endpoint answers {"wsUrl": "wss://..."}.
class HttpUrlProvider : public IUrlProvider {
public:
    HttpUrlProvider(boost::asio::any_io_executor ex,
                    boost::asio::ssl::context& sslCtx,
                    std::string endpoint,
                    std::string bearerToken,
                    std::chrono::milliseconds timeout);

    void fetchUrl(Completion done) override;

    // {"wsUrl": "..."} → url; nullopt when the body is not JSON or lacks the field
    static std::optional<std::string> parseWsUrl(std::string_view body);

private:
    boost::asio::any_io_executor m_ex;
    boost::asio::ssl::context& m_sslCtx;
    std::string m_endpoint;
    std::string m_token;
    std::chrono::milliseconds m_timeout;
};
