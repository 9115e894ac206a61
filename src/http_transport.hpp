#pragma once

#include "util.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace asset_upload {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HeaderList  headers;
    std::string body;
    /// Overrides TransportConfig::timeout for this exchange.
    std::optional<std::chrono::milliseconds> timeout;
};

struct HttpResponse {
    unsigned int status = 0;
    std::string  body;
    HeaderList   headers;

    /// Case-insensitive header lookup; empty when absent.
    std::string header(const std::string& name) const;
};

/// Raised when no HTTP response could be obtained at all (DNS, connect,
/// TLS, timeout, malformed response).  An error status is NOT a
/// TransportError.
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& what, bool timedOut = false)
        : std::runtime_error(what)
        , mTimedOut(timedOut) {}

    bool timedOut() const { return mTimedOut; }

private:
    bool mTimedOut;
};

/// Explicitly constructed per-client transport settings.
struct TransportConfig {
    std::chrono::milliseconds timeout{30000};
    std::string               userAgent = "asset_upload/1.0";
    HeaderList                defaultHeaders;
    int                       maxRedirects     = 5;
    std::uint64_t             maxResponseBytes = 256ull * 1024 * 1024;
    bool                      verbose          = false;
};

/// One request/response exchange against a remote endpoint.
class Transport {
public:
    virtual ~Transport() = default;

    /// @throws TransportError when no response was received.
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/// Synchronous HTTP/1.1 transport built on Boost.Beast.  Opens one
/// connection per exchange; HTTPS requires OpenSSL at build time.
class BeastTransport : public Transport {
public:
    explicit BeastTransport(TransportConfig config = TransportConfig{});

    HttpResponse send(const HttpRequest& request) override;

    const TransportConfig& config() const { return mConfig; }

private:
    TransportConfig mConfig;

    HttpResponse sendOnce(const HttpRequest& request, const UrlParts& parts);
    HttpResponse doHttpRequest(const HttpRequest& request,
                               const UrlParts& parts,
                               std::chrono::milliseconds timeout);
    HttpResponse doHttpsRequest(const HttpRequest& request,
                                const UrlParts& parts,
                                std::chrono::milliseconds timeout);

    static bool isRedirectStatus(unsigned int status);
};

/// Resolve a Location header against the URL that produced it.
std::string resolveRedirect(const std::string& currentUrl,
                            const std::string& location);

} // namespace asset_upload
