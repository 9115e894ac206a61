#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace asset_upload {

/// Coarse content category used by the platform to pick a processing
/// pipeline.
enum class ResourceClass { Image, Video, GenericFile };

/// Per-class platform vocabulary.
struct ResourceClassInfo {
    ResourceClass cls;
    const char*   mimePrefix;      // "" for the catch-all class
    const char*   stagedResource;  // stagedUploadsCreate `resource`
    const char*   contentType;     // fileCreate `contentType`
};

inline constexpr ResourceClassInfo kResourceClasses[] = {
    {ResourceClass::Image,       "image/", "IMAGE", "IMAGE"},
    {ResourceClass::Video,       "video/", "VIDEO", "VIDEO"},
    {ResourceClass::GenericFile, "",       "FILE",  "FILE"},
};

const ResourceClassInfo& resourceClassInfo(ResourceClass cls);

/// Classify a MIME type by prefix (case-insensitive).  Anything that is
/// neither image/ nor video/ is a generic file.
ResourceClass resourceClassForMime(const std::string& mimeType);

/// MIME type guessed from a file name's extension.
std::string mimeTypeForFilename(const std::string& filename);

struct FileDescriptor {
    std::string   name;
    std::string   mimeType;
    std::uint64_t byteLength = 0;
    ResourceClass resourceClass = ResourceClass::GenericFile;
};

/// Build a descriptor for @p byteLength bytes named @p name.
FileDescriptor describeFile(const std::string& name,
                            const std::string& mimeType,
                            std::uint64_t byteLength);

struct StagedParameter {
    std::string name;
    std::string value;
};

/// Single-use signed upload destination returned by negotiation.
/// Parameter order is exactly as issued by the platform.
struct StagedTarget {
    std::string                  uploadUrl;
    std::string                  resourceUrl;
    std::vector<StagedParameter> parameters;
};

/// One binary file part.  Bytes are raw octets, never transcoded.
struct Attachment {
    std::string bytes;
    std::string filename;
    std::string mimeType;
};

enum class ResourceStatus { Uploaded, Processing, Ready, Failed };

const char* toString(ResourceStatus status);

/// Parse the platform's fileStatus ("UPLOADED", "READY", ...).
std::optional<ResourceStatus> parseResourceStatus(const std::string& value);

struct Dimensions {
    int width  = 0;
    int height = 0;
};

/// Mirrors a platform File (MediaImage / Video / GenericFile subset).
struct CreatedResource {
    std::string                id;          // e.g. "gid://shopify/MediaImage/1042"
    ResourceStatus             status = ResourceStatus::Uploaded;
    std::optional<std::string> deliveryUrl;
    std::optional<Dimensions>  dimensions;
    std::optional<std::string> alt;
    std::string                createdAt;   // ISO-8601
};

/// One file of a batch upload request.
struct UploadFile {
    std::string                bytes;
    std::string                filename;
    std::string                mimeType;
    std::optional<std::string> altText;
    std::string                readError;  // set when the source could not be read
};

enum class UploadPhase { Validation, Negotiate, Transfer, Register };

const char* toString(UploadPhase phase);

enum class ErrorKind { None, Validation, Negotiation, Transfer, Registration };

const char* toString(ErrorKind kind);

/// Per-file outcome of a batch upload.
struct BatchEntry {
    std::string                    filename;
    std::optional<CreatedResource> resource;
    std::optional<UploadPhase>     failedPhase;
    ErrorKind                      errorKind = ErrorKind::None;
    std::string                    errorMessage;

    bool ok() const { return resource.has_value(); }
};

struct BatchUploadResult {
    struct Summary {
        int total     = 0;
        int succeeded = 0;
        int failed    = 0;
    };

    std::vector<BatchEntry> entries;   // same order as the input files
    Summary                 summary;
};

enum class ProbeOutcome { Accessible, Unreachable, Error };

const char* toString(ProbeOutcome outcome);

/// Diagnostic record of one candidate probed by the resolver.
struct ResolutionAttempt {
    std::string  candidateUrl;
    std::string  strategyName;
    ProbeOutcome outcome = ProbeOutcome::Unreachable;
};

} // namespace asset_upload
