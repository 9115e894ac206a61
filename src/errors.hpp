#pragma once

#include "models.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace asset_upload {

/// Base of every error raised by the upload and resolution paths.
class UploadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed local input (empty attachment, empty parameter list, ...).
class ValidationError : public UploadError {
public:
    using UploadError::UploadError;
};

/// Errors that carry the platform's own messages.
class PlatformError : public UploadError {
public:
    PlatformError(const std::string& what, std::vector<std::string> messages)
        : UploadError(what)
        , mMessages(std::move(messages)) {}

    const std::vector<std::string>& messages() const { return mMessages; }

private:
    std::vector<std::string> mMessages;
};

/// The platform rejected the staged-upload request.
class NegotiationError : public PlatformError {
public:
    using PlatformError::PlatformError;
};

/// The platform rejected resource creation.
class RegistrationError : public PlatformError {
public:
    using PlatformError::PlatformError;
};

/// The storage endpoint rejected or failed the multipart upload.
/// httpStatus is 0 when no response was received.
class TransferError : public UploadError {
public:
    TransferError(const std::string& what,
                  unsigned int httpStatus,
                  std::string responseBody = "")
        : UploadError(what)
        , mHttpStatus(httpStatus)
        , mResponseBody(std::move(responseBody)) {}

    unsigned int       httpStatus()   const { return mHttpStatus; }
    const std::string& responseBody() const { return mResponseBody; }

private:
    unsigned int mHttpStatus;
    std::string  mResponseBody;
};

/// URL resolution ran every strategy and every retry without success.
class ResolutionExhausted : public UploadError {
public:
    ResolutionExhausted(const std::string& url,
                        std::vector<ResolutionAttempt> attempts)
        : UploadError("Delivery URL could not be resolved: " + url)
        , mUrl(url)
        , mAttempts(std::move(attempts)) {}

    const std::string&                    url()      const { return mUrl; }
    const std::vector<ResolutionAttempt>& attempts() const { return mAttempts; }

private:
    std::string                    mUrl;
    std::vector<ResolutionAttempt> mAttempts;
};

/// The caller's CancellationToken was triggered.
class OperationCancelled : public UploadError {
public:
    OperationCancelled() : UploadError("Operation cancelled") {}
};

/// Join platform messages with "; " for exception text.
inline std::string joinMessages(const std::vector<std::string>& messages) {
    std::string out;
    for (const auto& m : messages) {
        if (!out.empty()) out += "; ";
        out += m;
    }
    return out;
}

} // namespace asset_upload
