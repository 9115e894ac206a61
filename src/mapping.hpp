#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace asset_upload {

/// A mutation-level validation error ("userErrors" entry).
struct UserError {
    std::vector<std::string> field;
    std::string              message;
};

/// Return human-readable error messages from a GraphQL response (may be empty).
std::vector<std::string> extractGraphqlErrors(const nlohmann::json& responseBody);

/// userErrors of a mutation payload such as data.fileCreate (may be empty).
std::vector<UserError> extractUserErrors(const nlohmann::json& payload);

/// "files.1.alt: message", or just the message when no field is given.
std::string formatUserError(const UserError& error);

/// Input index named by a field path like ["files", "2", "alt"].
std::optional<std::size_t> userErrorIndex(const UserError& error);

/// One StagedUploadInput object for stagedUploadsCreate.
nlohmann::json makeStagedUploadInput(const FileDescriptor& descriptor,
                                     const std::string& httpMethod);

/// One FileCreateInput object for fileCreate.
nlohmann::json makeFileCreateInput(const std::string& originalSource,
                                   ResourceClass resourceClass,
                                   const std::optional<std::string>& alt);

/// Map a stagedTargets[] node into a StagedTarget.
/// Throws std::runtime_error when url or resourceUrl is missing.
StagedTarget parseStagedTarget(const nlohmann::json& node);

/// Map a fileCreate files[] node into a CreatedResource.
/// Throws std::runtime_error on a missing id or unknown fileStatus.
CreatedResource parseCreatedResource(const nlohmann::json& node);

/// Best delivery URL of a file node: image.url, image.src,
/// image.originalSrc, image.transformedSrc, then the file's own url.
std::optional<std::string> parseDeliveryUrl(const nlohmann::json& node);

} // namespace asset_upload
