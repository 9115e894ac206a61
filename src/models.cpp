#include "models.hpp"
#include "util.hpp"

#include <utility>

namespace asset_upload {

const ResourceClassInfo& resourceClassInfo(ResourceClass cls) {
    for (const auto& info : kResourceClasses) {
        if (info.cls == cls) return info;
    }
    return kResourceClasses[2];
}

ResourceClass resourceClassForMime(const std::string& mimeType) {
    const std::string mime = toLower(mimeType);
    for (const auto& info : kResourceClasses) {
        std::string prefix = info.mimePrefix;
        if (!prefix.empty() && mime.compare(0, prefix.size(), prefix) == 0) {
            return info.cls;
        }
    }
    return ResourceClass::GenericFile;
}

std::string mimeTypeForFilename(const std::string& filename) {
    static const std::pair<const char*, const char*> kTypes[] = {
        {".jpg",  "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png",  "image/png"},
        {".gif",  "image/gif"},
        {".webp", "image/webp"},
        {".svg",  "image/svg+xml"},
        {".mp4",  "video/mp4"},
        {".mov",  "video/quicktime"},
        {".webm", "video/webm"},
        {".pdf",  "application/pdf"},
        {".txt",  "text/plain"},
        {".csv",  "text/csv"},
        {".json", "application/json"},
    };

    const std::string ext = pathExtension(filename);
    for (const auto& [e, type] : kTypes) {
        if (ext == e) return type;
    }
    return "application/octet-stream";
}

FileDescriptor describeFile(const std::string& name,
                            const std::string& mimeType,
                            std::uint64_t byteLength) {
    FileDescriptor d;
    d.name          = name;
    d.mimeType      = mimeType;
    d.byteLength    = byteLength;
    d.resourceClass = resourceClassForMime(mimeType);
    return d;
}

const char* toString(ResourceStatus status) {
    switch (status) {
        case ResourceStatus::Uploaded:   return "UPLOADED";
        case ResourceStatus::Processing: return "PROCESSING";
        case ResourceStatus::Ready:      return "READY";
        case ResourceStatus::Failed:     return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<ResourceStatus> parseResourceStatus(const std::string& value) {
    if (value == "UPLOADED")   return ResourceStatus::Uploaded;
    if (value == "PROCESSING") return ResourceStatus::Processing;
    if (value == "READY")      return ResourceStatus::Ready;
    if (value == "FAILED")     return ResourceStatus::Failed;
    return std::nullopt;
}

const char* toString(UploadPhase phase) {
    switch (phase) {
        case UploadPhase::Validation: return "validation";
        case UploadPhase::Negotiate:  return "negotiate";
        case UploadPhase::Transfer:   return "transfer";
        case UploadPhase::Register:   return "register";
    }
    return "unknown";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:         return "none";
        case ErrorKind::Validation:   return "ValidationError";
        case ErrorKind::Negotiation:  return "NegotiationError";
        case ErrorKind::Transfer:     return "TransferError";
        case ErrorKind::Registration: return "RegistrationError";
    }
    return "unknown";
}

const char* toString(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Accessible:  return "accessible";
        case ProbeOutcome::Unreachable: return "unreachable";
        case ProbeOutcome::Error:       return "error";
    }
    return "unknown";
}

} // namespace asset_upload
