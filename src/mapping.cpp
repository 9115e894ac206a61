#include "mapping.hpp"

#include <cctype>
#include <stdexcept>

namespace asset_upload {

namespace {

/// String member of @p node, or nullopt when missing, null or not a string.
std::optional<std::string> optionalString(const nlohmann::json& node,
                                          const char* key) {
    if (!node.is_object()) return std::nullopt;
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<std::string> nonEmpty(std::optional<std::string> s) {
    if (s && s->empty()) return std::nullopt;
    return s;
}

} // namespace

std::vector<std::string>
extractGraphqlErrors(const nlohmann::json& responseBody) {
    std::vector<std::string> errors;

    if (responseBody.contains("errors") &&
        responseBody["errors"].is_array()) {
        for (const auto& err : responseBody["errors"]) {
            errors.push_back(
                optionalString(err, "message").value_or("Unknown GraphQL error"));
        }
    }
    return errors;
}

std::vector<UserError> extractUserErrors(const nlohmann::json& payload) {
    std::vector<UserError> errors;

    if (!payload.is_object() || !payload.contains("userErrors") ||
        !payload["userErrors"].is_array()) {
        return errors;
    }

    for (const auto& node : payload["userErrors"]) {
        UserError err;
        err.message = optionalString(node, "message").value_or("Unknown user error");
        if (node.contains("field") && node["field"].is_array()) {
            for (const auto& part : node["field"]) {
                if (part.is_string()) {
                    err.field.push_back(part.get<std::string>());
                } else if (part.is_number_integer()) {
                    err.field.push_back(std::to_string(part.get<long long>()));
                }
            }
        }
        errors.push_back(std::move(err));
    }
    return errors;
}

std::string formatUserError(const UserError& error) {
    if (error.field.empty()) return error.message;

    std::string path;
    for (const auto& part : error.field) {
        if (!path.empty()) path += '.';
        path += part;
    }
    return path + ": " + error.message;
}

std::optional<std::size_t> userErrorIndex(const UserError& error) {
    if (error.field.size() < 2) return std::nullopt;

    const std::string& idx = error.field[1];
    if (idx.empty() || idx.size() > 9) return std::nullopt;
    for (unsigned char c : idx) {
        if (!std::isdigit(c)) return std::nullopt;
    }
    return static_cast<std::size_t>(std::stoul(idx));
}

nlohmann::json makeStagedUploadInput(const FileDescriptor& descriptor,
                                     const std::string& httpMethod) {
    return {
        {"filename",   descriptor.name},
        {"mimeType",   descriptor.mimeType},
        {"resource",   resourceClassInfo(descriptor.resourceClass).stagedResource},
        {"fileSize",   std::to_string(descriptor.byteLength)},
        {"httpMethod", httpMethod},
    };
}

nlohmann::json makeFileCreateInput(const std::string& originalSource,
                                   ResourceClass resourceClass,
                                   const std::optional<std::string>& alt) {
    nlohmann::json input = {
        {"originalSource", originalSource},
        {"contentType",    resourceClassInfo(resourceClass).contentType},
    };
    if (alt) {
        input["alt"] = *alt;
    }
    return input;
}

StagedTarget parseStagedTarget(const nlohmann::json& node) {
    StagedTarget target;

    auto url         = nonEmpty(optionalString(node, "url"));
    auto resourceUrl = nonEmpty(optionalString(node, "resourceUrl"));
    if (!url) {
        throw std::runtime_error("Staged target missing 'url'");
    }
    if (!resourceUrl) {
        throw std::runtime_error("Staged target missing 'resourceUrl'");
    }
    target.uploadUrl   = *url;
    target.resourceUrl = *resourceUrl;

    // --- parameters, order preserved ---
    if (node.contains("parameters") && node["parameters"].is_array()) {
        for (const auto& p : node["parameters"]) {
            StagedParameter param;
            param.name  = optionalString(p, "name").value_or("");
            param.value = optionalString(p, "value").value_or("");
            if (param.name.empty()) {
                throw std::runtime_error("Staged target parameter without a name");
            }
            target.parameters.push_back(std::move(param));
        }
    }

    return target;
}

std::optional<std::string> parseDeliveryUrl(const nlohmann::json& node) {
    if (!node.is_object()) return std::nullopt;

    if (node.contains("image") && node["image"].is_object()) {
        const auto& image = node["image"];
        for (const char* key : {"url", "src", "originalSrc", "transformedSrc"}) {
            if (auto v = nonEmpty(optionalString(image, key))) return v;
        }
    }
    return nonEmpty(optionalString(node, "url"));
}

CreatedResource parseCreatedResource(const nlohmann::json& node) {
    CreatedResource r;

    auto id = nonEmpty(optionalString(node, "id"));
    if (!id) {
        throw std::runtime_error("Created file missing 'id'");
    }
    r.id = *id;

    const auto statusText = optionalString(node, "fileStatus").value_or("");
    auto status = parseResourceStatus(statusText);
    if (!status) {
        throw std::runtime_error("Unknown fileStatus '" + statusText +
                                 "' for " + r.id);
    }
    r.status = *status;

    r.alt         = optionalString(node, "alt");
    r.createdAt   = optionalString(node, "createdAt").value_or("");
    r.deliveryUrl = parseDeliveryUrl(node);

    // --- dimensions (MediaImage only) ---
    if (node.contains("image") && node["image"].is_object()) {
        const auto& image = node["image"];
        if (image.contains("width") && image["width"].is_number_integer() &&
            image.contains("height") && image["height"].is_number_integer()) {
            r.dimensions = Dimensions{image["width"].get<int>(),
                                      image["height"].get<int>()};
        }
    }

    return r;
}

} // namespace asset_upload
