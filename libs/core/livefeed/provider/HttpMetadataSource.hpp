#pragma once
#include "IMetadataSource.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <string>
#include <string_view>

// POSTs {"conditionIds":[...],"eventSlugs":[...]} and reads {"markets":[...]}.
class HttpMetadataSource : public IMetadataSource {
public:
    HttpMetadataSource(boost::asio::any_io_executor ex,
                       boost::asio::ssl::context& sslCtx,
                       std::string endpoint,
                       std::string bearerToken,
                       std::chrono::milliseconds timeout);

    void fetch(MetadataRequest request, Completion done) override;

    static std::string buildRequestBody(const MetadataRequest& request);
    static MetadataResponse parseResponse(std::string_view body);

private:
    boost::asio::any_io_executor m_ex;
    boost::asio::ssl::context& m_sslCtx;
    std::string m_endpoint;
    std::string m_token;
    std::chrono::milliseconds m_timeout;
};
