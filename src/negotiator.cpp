#include "negotiator.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "queries.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

namespace asset_upload {

StagedTransferNegotiator::StagedTransferNegotiator(GraphQLClient& client,
                                                   std::string httpMethod,
                                                   bool verbose)
    : mClient(client)
    , mHttpMethod(std::move(httpMethod))
    , mVerbose(verbose) {}

StagedTarget
StagedTransferNegotiator::negotiate(const FileDescriptor& descriptor,
                                    const CancellationToken* cancel)
{
    throwIfCancelled(cancel);

    nlohmann::json variables;
    variables["input"] = nlohmann::json::array(
        {makeStagedUploadInput(descriptor, mHttpMethod)});

    if (mVerbose) {
        std::cerr << "[Negotiator] Requesting target for " << descriptor.name
                  << " (" << descriptor.mimeType << ", "
                  << descriptor.byteLength << " bytes, "
                  << resourceClassInfo(descriptor.resourceClass).stagedResource
                  << ")\n";
    }

    GraphQLClient::Response resp;
    try {
        resp = mClient.execute(queries::kStagedUploadsCreate, variables);
    } catch (const TransportError& e) {
        throw NegotiationError(
            "Staged upload request failed for " + descriptor.name + ": " + e.what(),
            {e.what()});
    } catch (const std::runtime_error& e) {
        throw NegotiationError(
            "Staged upload reply unreadable for " + descriptor.name + ": " + e.what(),
            {e.what()});
    }

    const auto errors = extractGraphqlErrors(resp.body);

    if (!isSuccessStatus(resp.httpStatus)) {
        std::vector<std::string> messages = errors;
        messages.insert(messages.begin(),
                        "HTTP " + std::to_string(resp.httpStatus));
        throw NegotiationError("Staged upload rejected for " + descriptor.name +
                                   ": " + joinMessages(messages),
                               messages);
    }

    if (!errors.empty()) {
        throw NegotiationError("GraphQL errors: " + joinMessages(errors), errors);
    }

    const nlohmann::json* payload = nullptr;
    if (resp.body.contains("data") && resp.body["data"].is_object() &&
        resp.body["data"].contains("stagedUploadsCreate") &&
        resp.body["data"]["stagedUploadsCreate"].is_object()) {
        payload = &resp.body["data"]["stagedUploadsCreate"];
    }
    if (payload == nullptr) {
        throw NegotiationError("Staged upload reply for " + descriptor.name +
                                   " has no data",
                               {});
    }

    const auto userErrors = extractUserErrors(*payload);
    if (!userErrors.empty()) {
        std::vector<std::string> messages;
        for (const auto& ue : userErrors) {
            messages.push_back(formatUserError(ue));
        }
        throw NegotiationError("User errors: " + joinMessages(messages), messages);
    }

    if (!payload->contains("stagedTargets") ||
        !(*payload)["stagedTargets"].is_array() ||
        (*payload)["stagedTargets"].empty()) {
        throw NegotiationError("No staged target returned for " + descriptor.name,
                               {});
    }

    StagedTarget target;
    try {
        target = parseStagedTarget((*payload)["stagedTargets"][0]);
    } catch (const std::runtime_error& e) {
        throw NegotiationError(std::string("Malformed staged target: ") + e.what(),
                               {e.what()});
    }

    if (mVerbose) {
        std::cerr << "[Negotiator] Target " << target.uploadUrl << " with "
                  << target.parameters.size() << " parameters:";
        for (const auto& p : target.parameters) {
            std::cerr << " " << p.name;
        }
        std::cerr << "\n";
    }

    return target;
}

} // namespace asset_upload
