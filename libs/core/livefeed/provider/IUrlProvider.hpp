#pragma once
#include <functional>
#include <string>
#include <utility>

struct UrlResult {
    bool        ok = false;
    std::string url;
    std::string error;
};

// Source of the short-lived subscription URL for the order stream.
class IUrlProvider {
public:
    using Completion = std::function<void(UrlResult)>;
    virtual ~IUrlProvider() = default;

    // Completion may run on any thread of the io_context.
    virtual void fetchUrl(Completion done) = 0;
};

// Fixed URL from configuration.
class StaticUrlProvider : public IUrlProvider {
public:
    explicit StaticUrlProvider(std::string url) : m_url(std::move(url)) {}

    void fetchUrl(Completion done) override {
        UrlResult r;
        r.ok = !m_url.empty();
        r.url = m_url;
        if (!r.ok) r.error = "no stream url configured";
        done(std::move(r));
    }

private:
    std::string m_url;
};
