#pragma once

#include <stdexcept>
#include <string>

namespace asset_upload {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Connection settings for the platform Admin API.
struct ClientConfig {
    std::string shopDomain;             // e.g. "my-shop.myshopify.com"
    std::string accessToken;            // sent as X-Shopify-Access-Token
    std::string apiVersion          = "2024-01";
    int         timeoutSeconds      = 30;
    int         probeTimeoutSeconds = 10;
    int         maxResolveRetries   = 3;
    std::string userAgent           = "asset_upload/1.0";
    bool        verbose             = false;

    /// True when the domain and the token are both non-blank.
    bool isValid() const;

    /// "https://{shopDomain}/admin/api/{apiVersion}/graphql.json".
    /// A domain that already carries a scheme is used as given.
    std::string graphqlEndpoint() const;
};

/// Read SHOPIFY_* environment variables on top of @p base.
/// @throws ConfigError when a numeric variable is not a positive integer.
ClientConfig loadConfigFromEnv(ClientConfig base = ClientConfig{});

/// @throws ConfigError naming every missing or out-of-range field.
void validateConfig(const ClientConfig& config);

/// Parse a strictly positive decimal integer.
/// @throws ConfigError mentioning @p name on failure.
int parsePositiveInt(const std::string& name, const std::string& value);

} // namespace asset_upload
