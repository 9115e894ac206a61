#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace asset_upload {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

const char* envValue(const char* name) {
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? v : nullptr;
}

} // namespace

bool ClientConfig::isValid() const {
    return !isBlank(shopDomain) && !isBlank(accessToken);
}

std::string ClientConfig::graphqlEndpoint() const {
    std::string domain = shopDomain;
    while (!domain.empty() && domain.back() == '/') {
        domain.pop_back();
    }

    std::string base = (domain.find("://") == std::string::npos)
                           ? "https://" + domain
                           : domain;
    return base + "/admin/api/" + apiVersion + "/graphql.json";
}

int parsePositiveInt(const std::string& name, const std::string& value) {
    if (value.empty() ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        throw ConfigError(name + " must be a positive integer, got '" +
                          value + "'");
    }

    long parsed = std::strtol(value.c_str(), nullptr, 10);
    if (parsed <= 0 || parsed > 1000000) {
        throw ConfigError(name + " out of range: " + value);
    }
    return static_cast<int>(parsed);
}

ClientConfig loadConfigFromEnv(ClientConfig base) {
    if (const char* v = envValue("SHOPIFY_SHOP_DOMAIN"))  base.shopDomain  = v;
    if (const char* v = envValue("SHOPIFY_ACCESS_TOKEN")) base.accessToken = v;
    if (const char* v = envValue("SHOPIFY_API_VERSION"))  base.apiVersion  = v;

    if (const char* v = envValue("SHOPIFY_TIMEOUT_SECONDS")) {
        base.timeoutSeconds = parsePositiveInt("SHOPIFY_TIMEOUT_SECONDS", v);
    }
    if (const char* v = envValue("SHOPIFY_PROBE_TIMEOUT_SECONDS")) {
        base.probeTimeoutSeconds =
            parsePositiveInt("SHOPIFY_PROBE_TIMEOUT_SECONDS", v);
    }
    if (const char* v = envValue("SHOPIFY_MAX_RETRIES")) {
        base.maxResolveRetries = parsePositiveInt("SHOPIFY_MAX_RETRIES", v);
    }
    return base;
}

void validateConfig(const ClientConfig& config) {
    std::vector<std::string> problems;
    if (isBlank(config.shopDomain))  problems.push_back("shop domain is required");
    if (isBlank(config.accessToken)) problems.push_back("access token is required");
    if (isBlank(config.apiVersion))  problems.push_back("API version is required");
    if (config.timeoutSeconds <= 0)  problems.push_back("timeout must be positive");
    if (config.probeTimeoutSeconds <= 0) {
        problems.push_back("probe timeout must be positive");
    }
    if (config.maxResolveRetries < 0) {
        problems.push_back("max retries must not be negative");
    }

    if (!problems.empty()) {
        std::string msg = "Invalid configuration:";
        for (const auto& p : problems) msg += " " + p + ";";
        throw ConfigError(msg);
    }
}

} // namespace asset_upload
