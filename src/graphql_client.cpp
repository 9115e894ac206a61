#include "graphql_client.hpp"

#include <iostream>
#include <stdexcept>

namespace asset_upload {

GraphQLClient::GraphQLClient(Transport& transport,
                             const std::string& endpoint,
                             const std::string& accessToken,
                             std::chrono::milliseconds timeout)
    : mTransport(transport)
    , mEndpoint(endpoint)
    , mAccessToken(accessToken)
    , mTimeout(timeout)
{
    // Fail early on a malformed endpoint.
    (void)parseUrl(endpoint);
}

GraphQLClient::Response
GraphQLClient::execute(const std::string& query,
                       const nlohmann::json& variables)
{
    nlohmann::json payload;
    payload["query"] = query;
    if (!variables.empty()) {
        payload["variables"] = variables;
    }

    HttpRequest request;
    request.method  = "POST";
    request.url     = mEndpoint;
    request.body    = payload.dump();
    request.timeout = mTimeout;
    request.headers = {
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
    };
    if (!mAccessToken.empty()) {
        request.headers.emplace_back("X-Shopify-Access-Token", mAccessToken);
    }

    if (mVerbose) {
        std::cerr << "[GraphQLClient] POST " << mEndpoint << "\n";
        if (request.body.size() <= 300) {
            std::cerr << "[GraphQLClient] Body: " << request.body << "\n";
        } else {
            std::cerr << "[GraphQLClient] Body: " << request.body.substr(0, 300)
                      << " ...(truncated)\n";
        }
    }

    const HttpResponse res = mTransport.send(request);

    Response response;
    response.httpStatus = res.status;
    try {
        response.body = nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            "Failed to parse JSON response (HTTP " +
            std::to_string(res.status) + "): " + e.what());
    }

    if (mVerbose) {
        std::cerr << "[GraphQLClient] HTTP " << response.httpStatus << "\n";
    }

    return response;
}

} // namespace asset_upload
