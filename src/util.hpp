#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace asset_upload {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path + query (e.g. "/files/a.jpg?v=12")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// The URL with its query string and fragment removed.
std::string stripQuery(const std::string& url);

/// Value of query parameter @p name, if present (first occurrence).
std::optional<std::string> queryParam(const std::string& url,
                                      const std::string& name);

/// Remove every occurrence of query parameter @p name, keeping the others
/// in their original order.  Drops the '?' when nothing is left.
std::string removeQueryParam(const std::string& url, const std::string& name);

/// Replace the value of query parameter @p name, or append it when absent.
std::string setQueryParam(const std::string& url,
                          const std::string& name,
                          const std::string& value);

/// Swap the file extension of the last path segment (query dropped).
/// @p extension includes the dot, e.g. ".png".  A segment without an
/// extension gets one appended.
std::string replaceExtension(const std::string& url,
                             const std::string& extension);

/// Lower-case extension of the last path segment including the dot,
/// or an empty string.
std::string pathExtension(const std::string& urlOrPath);

/// ASCII lower-casing.
std::string toLower(std::string s);

/// True for 2xx statuses.
inline bool isSuccessStatus(unsigned int status) {
    return status >= 200 && status < 300;
}

/// Delay before backoff attempt @p attempt (1-based): 2^attempt seconds.
/// No jitter; the exponent is clamped at 16.
std::chrono::seconds backoffDelay(int attempt);

} // namespace asset_upload
