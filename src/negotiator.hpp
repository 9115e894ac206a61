#pragma once

#include "cancellation.hpp"
#include "graphql_client.hpp"
#include "models.hpp"

#include <string>

namespace asset_upload {

/// Requests single-use, policy-signed upload targets (stagedUploadsCreate).
class StagedTransferNegotiator {
public:
    /// @param httpMethod  Method the storage endpoint will receive ("POST" or "PUT").
    explicit StagedTransferNegotiator(GraphQLClient& client,
                                      std::string httpMethod = "POST",
                                      bool verbose = false);

    /// Allocate a new target for @p descriptor.  Every call allocates a
    /// distinct target.
    /// @throws NegotiationError carrying the platform messages.
    /// @throws OperationCancelled if @p cancel fires before the request.
    StagedTarget negotiate(const FileDescriptor& descriptor,
                           const CancellationToken* cancel = nullptr);

private:
    GraphQLClient& mClient;
    std::string    mHttpMethod;
    bool           mVerbose;
};

} // namespace asset_upload
