#pragma once

#include <string>

namespace asset_upload {
namespace queries {

/// Request a signed, single-use upload target.
/// Variables: $input ([StagedUploadInput!]!).
inline const std::string kStagedUploadsCreate = R"(
mutation stagedUploadsCreate($input: [StagedUploadInput!]!) {
  stagedUploadsCreate(input: $input) {
    stagedTargets {
      url
      resourceUrl
      parameters {
        name
        value
      }
    }
    userErrors {
      field
      message
    }
  }
}
)";

/// Register uploaded resources by origin reference.
/// Variables: $files ([FileCreateInput!]!).
inline const std::string kFileCreate = R"(
mutation fileCreate($files: [FileCreateInput!]!) {
  fileCreate(files: $files) {
    files {
      id
      fileStatus
      alt
      createdAt
      ... on MediaImage {
        image {
          width
          height
          url
        }
      }
      ... on GenericFile {
        url
      }
    }
    userErrors {
      field
      message
    }
  }
}
)";

/// Current delivery URL of a file.
/// Variables: $id (ID!).
inline const std::string kFileById = R"(
query fileById($id: ID!) {
  node(id: $id) {
    id
    ... on MediaImage {
      fileStatus
      image {
        url
        src
        originalSrc
        transformedSrc
      }
    }
    ... on GenericFile {
      fileStatus
      url
    }
  }
}
)";

} // namespace queries
} // namespace asset_upload
