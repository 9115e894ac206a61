#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace asset_upload {

namespace {

/// URL split at '?' and '#': base, query (without '?'), fragment (with '#').
struct QuerySplit {
    std::string base;
    std::string query;
    std::string fragment;
    bool        hasQuery = false;
};

QuerySplit splitQuery(const std::string& url) {
    QuerySplit s;
    std::string rest = url;

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        s.fragment = rest.substr(hash);
        rest       = rest.substr(0, hash);
    }

    auto q = rest.find('?');
    if (q == std::string::npos) {
        s.base = rest;
    } else {
        s.base     = rest.substr(0, q);
        s.query    = rest.substr(q + 1);
        s.hasQuery = true;
    }
    return s;
}

std::vector<std::string> splitPairs(const std::string& query) {
    std::vector<std::string> pairs;
    std::size_t start = 0;
    while (start <= query.size()) {
        auto amp = query.find('&', start);
        if (amp == std::string::npos) amp = query.size();
        if (amp > start) {
            pairs.push_back(query.substr(start, amp - start));
        }
        start = amp + 1;
    }
    return pairs;
}

std::string pairName(const std::string& pair) {
    auto eq = pair.find('=');
    return eq == std::string::npos ? pair : pair.substr(0, eq);
}

std::string joinQuery(const std::string& base,
                      const std::vector<std::string>& pairs,
                      const std::string& fragment) {
    std::string out = base;
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        out += (i == 0) ? '?' : '&';
        out += pairs[i];
    }
    return out + fragment;
}

} // namespace

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = toLower(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?#", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target[0] != '/') {
            parts.target.insert(0, "/");
        }
    }

    // Fragments never go on the wire.
    auto hash = parts.target.find('#');
    if (hash != std::string::npos) {
        parts.target.erase(hash);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string stripQuery(const std::string& url) {
    return splitQuery(url).base;
}

std::optional<std::string> queryParam(const std::string& url,
                                      const std::string& name) {
    for (const auto& pair : splitPairs(splitQuery(url).query)) {
        if (pairName(pair) == name) {
            auto eq = pair.find('=');
            return eq == std::string::npos ? std::string() : pair.substr(eq + 1);
        }
    }
    return std::nullopt;
}

std::string removeQueryParam(const std::string& url, const std::string& name) {
    auto split = splitQuery(url);
    if (!split.hasQuery) return url;

    std::vector<std::string> kept;
    for (auto& pair : splitPairs(split.query)) {
        if (pairName(pair) != name) kept.push_back(std::move(pair));
    }
    return joinQuery(split.base, kept, split.fragment);
}

std::string setQueryParam(const std::string& url,
                          const std::string& name,
                          const std::string& value) {
    auto split = splitQuery(url);
    auto pairs = splitPairs(split.query);

    bool replaced = false;
    std::vector<std::string> out;
    for (auto& pair : pairs) {
        if (pairName(pair) == name) {
            if (!replaced) {
                out.push_back(name + "=" + value);
                replaced = true;
            }
            continue;
        }
        out.push_back(std::move(pair));
    }
    if (!replaced) {
        out.push_back(name + "=" + value);
    }
    return joinQuery(split.base, out, split.fragment);
}

std::string pathExtension(const std::string& urlOrPath) {
    std::string base = stripQuery(urlOrPath);
    auto schemeEnd = base.find("://");
    if (schemeEnd != std::string::npos &&
        base.find('/', schemeEnd + 3) == std::string::npos) {
        return "";
    }
    auto slash = base.find_last_of("/\\");
    auto dot   = base.rfind('.');
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash)) {
        return "";
    }
    return toLower(base.substr(dot));
}

std::string replaceExtension(const std::string& url,
                             const std::string& extension) {
    std::string base = stripQuery(url);
    auto slash = base.rfind('/');
    auto dot   = base.rfind('.');

    // A dot inside the host part ("https://cdn.example.com") is not an
    // extension.
    auto schemeEnd  = base.find("://");
    auto pathStart  = (schemeEnd == std::string::npos)
                          ? std::string::npos
                          : base.find('/', schemeEnd + 3);
    bool hasPath    = schemeEnd == std::string::npos ||
                      pathStart != std::string::npos;
    bool dotInPath  = hasPath && dot != std::string::npos &&
                      (slash == std::string::npos || dot > slash) &&
                      (pathStart == std::string::npos || dot > pathStart);

    if (!dotInPath) {
        return base + extension;
    }
    return base.substr(0, dot) + extension;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::chrono::seconds backoffDelay(int attempt) {
    int exponent = std::max(0, std::min(attempt, 16));
    return std::chrono::seconds(int64_t{1} << exponent);
}

} // namespace asset_upload
