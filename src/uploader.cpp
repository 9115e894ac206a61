#include "uploader.hpp"
#include "errors.hpp"
#include "multipart.hpp"
#include "queries.hpp"
#include "util.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace asset_upload {

namespace {

std::string truncated(const std::string& s, std::size_t limit = 300) {
    return s.size() <= limit ? s : s.substr(0, limit) + " ...(truncated)";
}

void markFailed(BatchEntry& entry,
                UploadPhase phase,
                ErrorKind kind,
                const std::string& message) {
    entry.resource.reset();
    entry.failedPhase  = phase;
    entry.errorKind    = kind;
    entry.errorMessage = message;

    std::cerr << "[Uploader] " << entry.filename << " failed at "
              << toString(phase) << ": " << message << "\n";
}

} // namespace

std::string baseName(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

UploadFile loadUploadFile(const std::string& path,
                          const std::optional<std::string>& altText)
{
    UploadFile file;
    file.filename = baseName(path);
    file.mimeType = mimeTypeForFilename(file.filename);
    file.altText  = altText;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        file.readError = "Cannot open file: " + path;
        return file;
    }
    file.bytes.assign(std::istreambuf_iterator<char>(in),
                      std::istreambuf_iterator<char>());
    if (in.bad()) {
        file.bytes.clear();
        file.readError = "Failed to read file: " + path;
    }
    return file;
}

StagedUploader::StagedUploader(GraphQLClient& platform,
                               Transport& storage,
                               UploaderOptions options)
    : mPlatform(platform)
    , mStorage(storage)
    , mOptions(std::move(options))
    , mNegotiator(platform, mOptions.transferMethod, mOptions.verbose) {}

// ---------------------------------------------------------------------------
// Single file
// ---------------------------------------------------------------------------

CreatedResource StagedUploader::upload(std::string bytes,
                                       const std::string& filename,
                                       const std::string& mimeType,
                                       const std::optional<std::string>& altText,
                                       const CancellationToken* cancel)
{
    validateInput(bytes, filename, mimeType);

    const FileDescriptor descriptor = describeFile(filename, mimeType, bytes.size());

    // --- phase 1: negotiate ---
    if (mOptions.verbose) {
        std::cerr << "[Uploader] 1/3 negotiate " << filename << "\n";
    }
    const StagedTarget target = mNegotiator.negotiate(descriptor, cancel);

    // --- phase 2: transfer ---
    if (mOptions.verbose) {
        std::cerr << "[Uploader] 2/3 transfer " << bytes.size() << " bytes to "
                  << target.uploadUrl << "\n";
    }
    Attachment attachment{std::move(bytes), filename, mimeType};
    transfer(target, attachment, cancel);

    // --- phase 3: register ---
    if (mOptions.verbose) {
        std::cerr << "[Uploader] 3/3 register " << target.resourceUrl << "\n";
    }
    const auto inputs = nlohmann::json::array(
        {makeFileCreateInput(target.resourceUrl, descriptor.resourceClass, altText)});
    const RegistrationReply reply = sendRegistration(inputs, cancel);

    if (!reply.userErrors.empty()) {
        std::vector<std::string> messages;
        for (const auto& ue : reply.userErrors) {
            messages.push_back(formatUserError(ue));
        }
        throw RegistrationError("User errors: " + joinMessages(messages), messages);
    }
    if (reply.files.empty()) {
        throw RegistrationError("fileCreate returned no file for " + filename, {});
    }

    try {
        return parseCreatedResource(reply.files.front());
    } catch (const std::runtime_error& e) {
        throw RegistrationError(std::string("Malformed fileCreate reply: ") + e.what(),
                                {e.what()});
    }
}

CreatedResource StagedUploader::upload(std::istream& source,
                                       const std::string& filename,
                                       const std::string& mimeType,
                                       const std::optional<std::string>& altText,
                                       const CancellationToken* cancel)
{
    if (!source) {
        throw ValidationError("Cannot read stream for " + filename);
    }
    std::ostringstream buffer;
    buffer << source.rdbuf();
    if (source.bad()) {
        throw ValidationError("Failed to read stream for " + filename);
    }
    return upload(buffer.str(), filename, mimeType, altText, cancel);
}

// ---------------------------------------------------------------------------
// Batch
// ---------------------------------------------------------------------------

BatchUploadResult StagedUploader::uploadBatch(const std::vector<UploadFile>& files,
                                              const CancellationToken* cancel)
{
    BatchUploadResult result;
    result.entries.resize(files.size());

    std::vector<std::size_t> pendingIndex;
    nlohmann::json           inputs = nlohmann::json::array();

    for (std::size_t i = 0; i < files.size(); ++i) {
        const UploadFile& file  = files[i];
        BatchEntry&       entry = result.entries[i];
        entry.filename = file.filename;

        throwIfCancelled(cancel);

        UploadPhase phase = UploadPhase::Validation;
        try {
            if (!file.readError.empty()) {
                throw ValidationError(file.readError);
            }
            validateInput(file.bytes, file.filename, file.mimeType);
            const FileDescriptor descriptor =
                describeFile(file.filename, file.mimeType, file.bytes.size());

            phase = UploadPhase::Negotiate;
            const StagedTarget target = mNegotiator.negotiate(descriptor, cancel);

            phase = UploadPhase::Transfer;
            transfer(target, Attachment{file.bytes, file.filename, file.mimeType},
                     cancel);

            pendingIndex.push_back(i);
            inputs.push_back(makeFileCreateInput(
                target.resourceUrl, descriptor.resourceClass, file.altText));
        } catch (const ValidationError& e) {
            markFailed(entry, phase, ErrorKind::Validation, e.what());
        } catch (const NegotiationError& e) {
            markFailed(entry, phase, ErrorKind::Negotiation, e.what());
        } catch (const TransferError& e) {
            markFailed(entry, phase, ErrorKind::Transfer, e.what());
        }
    }

    if (!pendingIndex.empty()) {
        if (mOptions.batchRegistration) {
            registerBatch(result, pendingIndex, inputs, cancel);
        } else {
            for (std::size_t k = 0; k < pendingIndex.size(); ++k) {
                registerBatch(result, {pendingIndex[k]},
                              nlohmann::json::array({inputs[k]}), cancel);
            }
        }
    }

    result.summary.total = static_cast<int>(result.entries.size());
    for (const auto& e : result.entries) {
        if (e.ok()) {
            ++result.summary.succeeded;
        } else {
            ++result.summary.failed;
        }
    }

    if (mOptions.verbose) {
        std::cerr << "[Uploader] Batch done: " << result.summary.succeeded << "/"
                  << result.summary.total << " succeeded\n";
    }
    return result;
}

void StagedUploader::registerBatch(BatchUploadResult& result,
                                   const std::vector<std::size_t>& pendingIndex,
                                   const nlohmann::json& inputs,
                                   const CancellationToken* cancel)
{
    RegistrationReply reply;
    try {
        reply = sendRegistration(inputs, cancel);
    } catch (const RegistrationError& e) {
        for (auto idx : pendingIndex) {
            markFailed(result.entries[idx], UploadPhase::Register,
                       ErrorKind::Registration, e.what());
        }
        return;
    }

    if (!reply.userErrors.empty()) {
        std::vector<std::vector<std::string>> perEntry(pendingIndex.size());
        std::vector<std::string>              general;
        for (const auto& ue : reply.userErrors) {
            auto idx = userErrorIndex(ue);
            if (idx && *idx < pendingIndex.size()) {
                perEntry[*idx].push_back(formatUserError(ue));
            } else {
                general.push_back(formatUserError(ue));
            }
        }

        // Errors not tied to an input reject the whole submission.
        if (!general.empty()) {
            const std::string msg = "User errors: " + joinMessages(general);
            for (std::size_t k = 0; k < pendingIndex.size(); ++k) {
                std::string entryMsg = msg;
                if (!perEntry[k].empty()) {
                    entryMsg = "User errors: " + joinMessages(perEntry[k]) + "; " +
                               joinMessages(general);
                }
                markFailed(result.entries[pendingIndex[k]], UploadPhase::Register,
                           ErrorKind::Registration, entryMsg);
            }
            return;
        }

        // Fail the named inputs and resubmit the rest, which were transferred
        // but never registered.
        std::vector<std::size_t> retryIndex;
        nlohmann::json           retryInputs = nlohmann::json::array();
        for (std::size_t k = 0; k < pendingIndex.size(); ++k) {
            if (perEntry[k].empty()) {
                retryIndex.push_back(pendingIndex[k]);
                retryInputs.push_back(inputs[k]);
            } else {
                markFailed(result.entries[pendingIndex[k]], UploadPhase::Register,
                           ErrorKind::Registration,
                           "User errors: " + joinMessages(perEntry[k]));
            }
        }
        if (!retryIndex.empty()) {
            if (mOptions.verbose) {
                std::cerr << "[Uploader] Re-registering " << retryIndex.size()
                          << " file(s) rejected with the batch\n";
            }
            registerBatch(result, retryIndex, retryInputs, cancel);
        }
        return;
    }

    if (reply.files.size() != pendingIndex.size()) {
        const std::string msg = "fileCreate returned " +
                                std::to_string(reply.files.size()) + " files for " +
                                std::to_string(pendingIndex.size()) + " inputs";
        for (auto idx : pendingIndex) {
            markFailed(result.entries[idx], UploadPhase::Register,
                       ErrorKind::Registration, msg);
        }
        return;
    }

    for (std::size_t k = 0; k < pendingIndex.size(); ++k) {
        BatchEntry& entry = result.entries[pendingIndex[k]];
        try {
            entry.resource = parseCreatedResource(reply.files[k]);
        } catch (const std::runtime_error& e) {
            markFailed(entry, UploadPhase::Register, ErrorKind::Registration,
                       std::string("Malformed fileCreate reply: ") + e.what());
        }
    }
}

// ---------------------------------------------------------------------------
// Convenience sources
// ---------------------------------------------------------------------------

CreatedResource StagedUploader::uploadFile(const std::string& path,
                                           const std::optional<std::string>& altText,
                                           const CancellationToken* cancel)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ValidationError("Cannot open file: " + path);
    }

    const std::string filename = baseName(path);
    return upload(in, filename, mimeTypeForFilename(filename), altText, cancel);
}

CreatedResource StagedUploader::uploadFromUrl(const std::string& sourceUrl,
                                              const std::string& filename,
                                              const std::string& mimeType,
                                              const std::optional<std::string>& altText,
                                              const std::optional<std::string>& userAgent,
                                              const CancellationToken* cancel)
{
    throwIfCancelled(cancel);

    HttpRequest request;
    request.method  = "GET";
    request.url     = sourceUrl;
    request.timeout = mOptions.transferTimeout;
    if (userAgent) {
        request.headers.emplace_back("User-Agent", *userAgent);
    }

    HttpResponse response;
    try {
        response = mStorage.send(request);
    } catch (const TransportError& e) {
        throw ValidationError("Failed to download " + sourceUrl + ": " + e.what());
    }
    if (!isSuccessStatus(response.status)) {
        throw ValidationError("Failed to download " + sourceUrl + ": HTTP " +
                              std::to_string(response.status));
    }

    if (mOptions.verbose) {
        std::cerr << "[Uploader] Downloaded " << response.body.size()
                  << " bytes from " << sourceUrl << "\n";
    }
    return upload(std::move(response.body), filename, mimeType, altText, cancel);
}

// ---------------------------------------------------------------------------
// Private: phases
// ---------------------------------------------------------------------------

void StagedUploader::validateInput(const std::string& bytes,
                                   const std::string& filename,
                                   const std::string& mimeType)
{
    if (bytes.empty()) {
        throw ValidationError("File bytes cannot be empty: " + filename);
    }
    if (filename.empty()) {
        throw ValidationError("Filename cannot be empty");
    }
    if (mimeType.empty()) {
        throw ValidationError("Content type cannot be empty: " + filename);
    }
}

void StagedUploader::transfer(const StagedTarget& target,
                              const Attachment& attachment,
                              const CancellationToken* cancel)
{
    throwIfCancelled(cancel);

    // Fresh boundary per attempt.
    MultipartBody body = buildMultipart(target.parameters, attachment,
                                        mOptions.requirePolicyParameters);

    HttpRequest request;
    request.method  = mOptions.transferMethod;
    request.url     = target.uploadUrl;
    request.timeout = mOptions.transferTimeout;
    request.headers.emplace_back("Content-Type", body.contentType());
    request.body    = std::move(body.bytes);

    HttpResponse response;
    try {
        response = mStorage.send(request);
    } catch (const TransportError& e) {
        throw TransferError("Upload to " + target.uploadUrl + " failed: " + e.what(),
                            0);
    }

    if (!isSuccessStatus(response.status)) {
        throw TransferError("Storage endpoint rejected " + attachment.filename +
                                ": HTTP " + std::to_string(response.status) +
                                " - " + truncated(response.body),
                            response.status,
                            response.body);
    }

    if (mOptions.verbose) {
        std::cerr << "[Uploader] Transfer accepted: HTTP " << response.status << "\n";
    }
}

StagedUploader::RegistrationReply
StagedUploader::sendRegistration(const nlohmann::json& inputs,
                                 const CancellationToken* cancel)
{
    throwIfCancelled(cancel);

    nlohmann::json variables;
    variables["files"] = inputs;

    GraphQLClient::Response resp;
    try {
        resp = mPlatform.execute(queries::kFileCreate, variables);
    } catch (const TransportError& e) {
        throw RegistrationError(std::string("fileCreate request failed: ") + e.what(),
                                {e.what()});
    } catch (const std::runtime_error& e) {
        throw RegistrationError(std::string("fileCreate reply unreadable: ") + e.what(),
                                {e.what()});
    }

    const auto errors = extractGraphqlErrors(resp.body);
    if (!isSuccessStatus(resp.httpStatus)) {
        std::vector<std::string> messages = errors;
        messages.insert(messages.begin(), "HTTP " + std::to_string(resp.httpStatus));
        throw RegistrationError("fileCreate rejected: " + joinMessages(messages),
                                messages);
    }
    if (!errors.empty()) {
        throw RegistrationError("GraphQL errors: " + joinMessages(errors), errors);
    }

    if (!resp.body.contains("data") || !resp.body["data"].is_object() ||
        !resp.body["data"].contains("fileCreate") ||
        !resp.body["data"]["fileCreate"].is_object()) {
        throw RegistrationError("fileCreate reply has no data", {});
    }
    const auto& payload = resp.body["data"]["fileCreate"];

    RegistrationReply reply;
    reply.userErrors = extractUserErrors(payload);
    if (payload.contains("files") && payload["files"].is_array()) {
        for (const auto& f : payload["files"]) {
            reply.files.push_back(f);
        }
    }
    return reply;
}

} // namespace asset_upload
