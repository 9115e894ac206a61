#include "http_transport.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef ASSET_UPLOAD_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace asset_upload {

namespace {

std::string hostHeader(const UrlParts& parts) {
    const bool defaultPort = (parts.scheme == "https" && parts.port == "443") ||
                             (parts.scheme == "http" && parts.port == "80");
    return defaultPort ? parts.host : parts.host + ":" + parts.port;
}

std::string toStdString(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

http::request<http::string_body>
makeRequest(const TransportConfig& config,
            const HttpRequest& request,
            const UrlParts& parts)
{
    const auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " +
                                    request.method);
    }

    http::request<http::string_body> req{verb, parts.target, 11};
    req.set(http::field::host, hostHeader(parts));
    req.set(http::field::user_agent, config.userAgent);
    for (const auto& [name, value] : config.defaultHeaders) {
        req.set(name, value);
    }
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.keep_alive(false);
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

/// Write @p req and read the full response.  @p lowest is the tcp_stream
/// that carries the deadline.
template <class Stream>
HttpResponse exchange(Stream& stream,
                      beast::tcp_stream& lowest,
                      http::request<http::string_body>& req,
                      std::chrono::milliseconds timeout,
                      std::uint64_t maxResponseBytes)
{
    lowest.expires_after(timeout);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(maxResponseBytes);
    if (req.method() == http::verb::head) {
        parser.skip(true);
    }

    lowest.expires_after(timeout);
    http::read(stream, buffer, parser);

    auto& res = parser.get();
    HttpResponse response;
    response.status = res.result_int();
    response.body   = std::move(res.body());
    for (const auto& field : res) {
        response.headers.emplace_back(toStdString(field.name_string()),
                                      toStdString(field.value()));
    }
    return response;
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    const std::string wanted = toLower(name);
    for (const auto& [n, v] : headers) {
        if (toLower(n) == wanted) return v;
    }
    return "";
}

std::string resolveRedirect(const std::string& currentUrl,
                            const std::string& location)
{
    if (location.find("://") != std::string::npos) {
        return location;
    }

    auto parts = parseUrl(currentUrl);
    std::string origin = parts.scheme + "://" + hostHeader(parts);

    if (location.rfind("//", 0) == 0) {
        return parts.scheme + ":" + location;
    }
    if (!location.empty() && location[0] == '/') {
        return origin + location;
    }

    // Relative to the current directory.
    std::string path = stripQuery(parts.target);
    auto slash = path.rfind('/');
    return origin + path.substr(0, slash + 1) + location;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport(TransportConfig config)
    : mConfig(std::move(config)) {}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::send(const HttpRequest& request)
{
    const bool followRedirects =
        request.method == "GET" || request.method == "HEAD";

    HttpRequest current = request;
    for (int hop = 0;; ++hop) {
        UrlParts parts;
        try {
            parts = parseUrl(current.url);
        } catch (const std::invalid_argument& e) {
            throw TransportError(e.what());
        }

        HttpResponse response = sendOnce(current, parts);

        const std::string location = response.header("Location");
        if (!followRedirects || !isRedirectStatus(response.status) ||
            location.empty() || hop >= mConfig.maxRedirects) {
            return response;
        }

        if (mConfig.verbose) {
            std::cerr << "[Transport] HTTP " << response.status
                      << " redirect -> " << location << "\n";
        }
        try {
            current.url = resolveRedirect(current.url, location);
        } catch (const std::invalid_argument& e) {
            throw TransportError(std::string("Bad redirect target: ") + e.what());
        }
    }
}

HttpResponse BeastTransport::sendOnce(const HttpRequest& request,
                                      const UrlParts& parts)
{
    const auto timeout = request.timeout.value_or(mConfig.timeout);

    if (mConfig.verbose) {
        std::cerr << "[Transport] " << request.method << " " << parts.host
                  << ":" << parts.port << parts.target;
        if (!request.body.empty()) {
            std::cerr << " (" << request.body.size() << " bytes)";
        }
        std::cerr << "\n";
    }

    try {
        HttpResponse response = (parts.scheme == "https")
                                    ? doHttpsRequest(request, parts, timeout)
                                    : doHttpRequest(request, parts, timeout);
        if (mConfig.verbose) {
            std::cerr << "[Transport] HTTP " << response.status << "\n";
        }
        return response;
    } catch (const boost::system::system_error& e) {
        const bool timedOut = e.code() == beast::error::timeout;
        throw TransportError(request.method + " " + request.url +
                                 " failed: " + e.what(),
                             timedOut);
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpRequest(const HttpRequest& request,
                                           const UrlParts& parts,
                                           std::chrono::milliseconds timeout)
{
    net::io_context   ioc;
    tcp::resolver     resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(parts.host, parts.port);
    stream.expires_after(timeout);
    stream.connect(results);

    auto req = makeRequest(mConfig, request, parts);
    HttpResponse response =
        exchange(stream, stream, req, timeout, mConfig.maxResponseBytes);

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpsRequest(const HttpRequest& request,
                                            const UrlParts& parts,
                                            std::chrono::milliseconds timeout)
{
#ifdef ASSET_UPLOAD_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
        throw TransportError("Failed to set SNI hostname for " + parts.host);
    }

    auto const results = resolver.resolve(parts.host, parts.port);
    beast::get_lowest_layer(stream).expires_after(timeout);
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = makeRequest(mConfig, request, parts);
    HttpResponse response = exchange(stream,
                                     beast::get_lowest_layer(stream),
                                     req,
                                     timeout,
                                     mConfig.maxResponseBytes);

    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)request;
    (void)parts;
    (void)timeout;
    throw TransportError("HTTPS not supported: built without OpenSSL");
#endif
}

bool BeastTransport::isRedirectStatus(unsigned int status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

} // namespace asset_upload
