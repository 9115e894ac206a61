#pragma once

#include "models.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace asset_upload {

/// A complete multipart/form-data request body.
struct MultipartBody {
    std::string boundary;
    std::string bytes;

    std::string contentType() const {
        return "multipart/form-data; boundary=" + boundary;
    }
};

using BoundaryGenerator = std::function<std::string()>;

/// Emit the ordered text parts followed by the file part:
///
///   --B\r\nContent-Disposition: form-data; name="N"\r\n\r\nV\r\n   (per parameter)
///   --B\r\nContent-Disposition: form-data; name="file"; filename="F"\r\n
///   Content-Type: M\r\n\r\n<attachment bytes>\r\n--B--\r\n
///
/// Text is copied byte for byte (UTF-8, no byte-order mark); the attachment
/// is never transcoded.
///
/// @throws ValidationError on an empty attachment, an empty parameter list
///         (when @p requireParameters), an empty or colliding boundary, or
///         a header token (name, filename, MIME type) containing CR, LF
///         or '"'.
std::string buildMultipartBody(const std::string& boundary,
                               const std::vector<StagedParameter>& parameters,
                               const Attachment& attachment,
                               bool requireParameters = true);

/// Build with a fresh boundary, regenerating it while it collides with
/// the content.
/// @throws ValidationError after kMaxBoundaryAttempts collisions, or for
///         any reason buildMultipartBody would.
MultipartBody buildMultipart(const std::vector<StagedParameter>& parameters,
                             const Attachment& attachment,
                             bool requireParameters = true,
                             const BoundaryGenerator& nextBoundary = {});

inline constexpr int kMaxBoundaryAttempts = 8;

/// "----WebKitFormBoundary" followed by 16 random hex digits.
std::string generateBoundary();

/// True when @p boundary occurs in a parameter name or value, the filename,
/// the MIME type, or the attachment bytes.
bool boundaryCollides(const std::string& boundary,
                      const std::vector<StagedParameter>& parameters,
                      const Attachment& attachment);

/// Exact byte length buildMultipartBody would produce.
std::size_t expectedMultipartSize(const std::string& boundary,
                                  const std::vector<StagedParameter>& parameters,
                                  const Attachment& attachment);

} // namespace asset_upload
