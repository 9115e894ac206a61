#include "multipart.hpp"
#include "errors.hpp"

#include <cstdint>
#include <random>

namespace asset_upload {

namespace {

constexpr const char* kCrlf = "\r\n";

void requireHeaderSafe(const std::string& what, const std::string& token) {
    if (token.find_first_of("\r\n\"") != std::string::npos) {
        throw ValidationError(what + " contains a forbidden character "
                              "(CR, LF or quote): " + token);
    }
}

std::string textPartHeader(const std::string& boundary, const std::string& name) {
    return "--" + boundary + kCrlf +
           "Content-Disposition: form-data; name=\"" + name + "\"" + kCrlf +
           kCrlf;
}

std::string filePartHeader(const std::string& boundary, const Attachment& a) {
    return "--" + boundary + kCrlf +
           "Content-Disposition: form-data; name=\"file\"; filename=\"" +
           a.filename + "\"" + kCrlf +
           "Content-Type: " + a.mimeType + kCrlf +
           kCrlf;
}

std::string closingDelimiter(const std::string& boundary) {
    return std::string(kCrlf) + "--" + boundary + "--" + kCrlf;
}

} // namespace

std::string generateBoundary() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char kHex[] = "0123456789abcdef";

    std::string boundary = "----WebKitFormBoundary";
    std::uint64_t bits = rng();
    for (int i = 0; i < 16; ++i) {
        boundary += kHex[bits & 0xF];
        bits >>= 4;
    }
    return boundary;
}

bool boundaryCollides(const std::string& boundary,
                      const std::vector<StagedParameter>& parameters,
                      const Attachment& attachment) {
    auto contains = [&boundary](const std::string& s) {
        return s.find(boundary) != std::string::npos;
    };

    for (const auto& p : parameters) {
        if (contains(p.name) || contains(p.value)) return true;
    }
    return contains(attachment.filename) || contains(attachment.mimeType) ||
           contains(attachment.bytes);
}

std::size_t expectedMultipartSize(const std::string& boundary,
                                  const std::vector<StagedParameter>& parameters,
                                  const Attachment& attachment) {
    std::size_t size = 0;
    for (const auto& p : parameters) {
        size += textPartHeader(boundary, p.name).size() + p.value.size() + 2;
    }
    size += filePartHeader(boundary, attachment).size();
    size += attachment.bytes.size();
    size += closingDelimiter(boundary).size();
    return size;
}

std::string buildMultipartBody(const std::string& boundary,
                               const std::vector<StagedParameter>& parameters,
                               const Attachment& attachment,
                               bool requireParameters) {
    if (attachment.bytes.empty()) {
        throw ValidationError("Attachment '" + attachment.filename + "' is empty");
    }
    if (requireParameters && parameters.empty()) {
        throw ValidationError("Staged upload requires at least one policy parameter");
    }
    if (boundary.empty()) {
        throw ValidationError("Multipart boundary is empty");
    }
    requireHeaderSafe("Boundary", boundary);
    requireHeaderSafe("File name", attachment.filename);
    requireHeaderSafe("MIME type", attachment.mimeType);
    for (const auto& p : parameters) {
        requireHeaderSafe("Parameter name", p.name);
    }
    if (boundaryCollides(boundary, parameters, attachment)) {
        throw ValidationError("Multipart boundary collides with content: " + boundary);
    }

    std::string body;
    body.reserve(expectedMultipartSize(boundary, parameters, attachment));

    // --- policy fields, in the order the platform issued them ---
    for (const auto& p : parameters) {
        body += textPartHeader(boundary, p.name);
        body += p.value;
        body += kCrlf;
    }

    // --- file part last ---
    body += filePartHeader(boundary, attachment);
    body.append(attachment.bytes.data(), attachment.bytes.size());
    body += closingDelimiter(boundary);

    return body;
}

MultipartBody buildMultipart(const std::vector<StagedParameter>& parameters,
                             const Attachment& attachment,
                             bool requireParameters,
                             const BoundaryGenerator& nextBoundary) {
    for (int attempt = 0; attempt < kMaxBoundaryAttempts; ++attempt) {
        std::string boundary = nextBoundary ? nextBoundary() : generateBoundary();
        if (boundary.empty() ||
            boundaryCollides(boundary, parameters, attachment)) {
            continue;
        }

        MultipartBody body;
        body.bytes    = buildMultipartBody(boundary, parameters, attachment,
                                           requireParameters);
        body.boundary = std::move(boundary);
        return body;
    }

    throw ValidationError("Could not find a multipart boundary absent from the "
                          "content after " +
                          std::to_string(kMaxBoundaryAttempts) + " attempts");
}

} // namespace asset_upload
