#pragma once

#include "cancellation.hpp"
#include "graphql_client.hpp"
#include "http_transport.hpp"
#include "mapping.hpp"
#include "models.hpp"
#include "negotiator.hpp"

#include <chrono>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace asset_upload {

struct UploaderOptions {
    std::string               transferMethod          = "POST";  // or "PUT"
    bool                      batchRegistration       = true;
    bool                      requirePolicyParameters = true;
    std::chrono::milliseconds transferTimeout{120000};
    bool                      verbose                 = false;
};

/// Drives the staged-transfer protocol: negotiate -> transfer -> register.
///
/// Phases are strictly ordered and nothing is retried; a caller that wants
/// to retry re-invokes upload(), which negotiates a fresh target.
class StagedUploader {
public:
    /// @param platform  Admin GraphQL client (negotiate + register)
    /// @param storage   Transport used for the storage endpoint and downloads
    StagedUploader(GraphQLClient& platform,
                   Transport& storage,
                   UploaderOptions options = UploaderOptions{});

    /// Upload one file.
    /// @throws ValidationError, NegotiationError, TransferError,
    ///         RegistrationError, OperationCancelled
    CreatedResource upload(std::string bytes,
                           const std::string& filename,
                           const std::string& mimeType,
                           const std::optional<std::string>& altText = std::nullopt,
                           const CancellationToken* cancel = nullptr);

    /// Read @p source to the end and upload its bytes.
    /// @throws ValidationError when the stream fails or yields nothing.
    CreatedResource upload(std::istream& source,
                           const std::string& filename,
                           const std::string& mimeType,
                           const std::optional<std::string>& altText = std::nullopt,
                           const CancellationToken* cancel = nullptr);

    /// Upload several files; per-file failures are reported in the result
    /// and never abort the siblings.
    /// @throws OperationCancelled only.
    BatchUploadResult uploadBatch(const std::vector<UploadFile>& files,
                                  const CancellationToken* cancel = nullptr);

    /// Read a local file and upload it; the MIME type comes from the
    /// extension.
    CreatedResource uploadFile(const std::string& path,
                               const std::optional<std::string>& altText = std::nullopt,
                               const CancellationToken* cancel = nullptr);

    /// Download @p sourceUrl and upload the bytes through the staged path.
    CreatedResource uploadFromUrl(const std::string& sourceUrl,
                                  const std::string& filename,
                                  const std::string& mimeType,
                                  const std::optional<std::string>& altText = std::nullopt,
                                  const std::optional<std::string>& userAgent = std::nullopt,
                                  const CancellationToken* cancel = nullptr);

private:
    struct RegistrationReply {
        std::vector<nlohmann::json> files;
        std::vector<UserError>      userErrors;
    };

    GraphQLClient&           mPlatform;
    Transport&               mStorage;
    UploaderOptions          mOptions;
    StagedTransferNegotiator mNegotiator;

    static void validateInput(const std::string& bytes,
                              const std::string& filename,
                              const std::string& mimeType);

    void transfer(const StagedTarget& target,
                  const Attachment& attachment,
                  const CancellationToken* cancel);

    RegistrationReply sendRegistration(const nlohmann::json& inputs,
                                       const CancellationToken* cancel);

    void registerBatch(BatchUploadResult& result,
                       const std::vector<std::size_t>& pendingIndex,
                       const nlohmann::json& inputs,
                       const CancellationToken* cancel);
};

/// Batch entry for a local file. An unreadable path yields an entry whose
/// readError is reported by uploadBatch instead of the bytes.
UploadFile loadUploadFile(const std::string& path,
                          const std::optional<std::string>& altText = std::nullopt);

/// File name part of a path ("dir/a.jpg" -> "a.jpg").
std::string baseName(const std::string& path);

} // namespace asset_upload
