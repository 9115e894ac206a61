#pragma once

#include "http_transport.hpp"

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace asset_upload {

/// Low-level GraphQL client for the platform Admin API.
/// Sends a JSON-encoded POST through a Transport and returns the parsed reply.
class GraphQLClient {
public:
    struct Response {
        unsigned int httpStatus = 0;
        nlohmann::json body;
    };

    /// @param transport    Exchange used for every request (not owned)
    /// @param endpoint     Full URL, e.g. "https://shop.myshopify.com/admin/api/2024-01/graphql.json"
    /// @param accessToken  Optional access token (sent as X-Shopify-Access-Token)
    /// @param timeout      Per-request timeout
    GraphQLClient(Transport& transport,
                  const std::string& endpoint,
                  const std::string& accessToken = "",
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    /// Execute a GraphQL query/mutation.
    /// @throws TransportError on network / timeout errors.
    /// @throws std::runtime_error when the body is not JSON.
    Response execute(const std::string& query,
                     const nlohmann::json& variables = nlohmann::json::object());

    const std::string& endpoint() const { return mEndpoint; }

    void setVerbose(bool v) { mVerbose = v; }

private:
    Transport&                mTransport;
    std::string               mEndpoint;
    std::string               mAccessToken;
    std::chrono::milliseconds mTimeout;
    bool                      mVerbose = false;
};

} // namespace asset_upload
