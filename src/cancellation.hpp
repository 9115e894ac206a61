#pragma once

#include "errors.hpp"

#include <atomic>

namespace asset_upload {

/// Caller-owned flag checked at every suspension point (network round-trip
/// or backoff wait).  Safe to trigger from another thread.
class CancellationToken {
public:
    void cancel() { mCancelled.store(true, std::memory_order_relaxed); }

    bool isCancelled() const {
        return mCancelled.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> mCancelled{false};
};

/// @throws OperationCancelled if @p token is set and cancelled.
inline void throwIfCancelled(const CancellationToken* token) {
    if (token != nullptr && token->isCancelled()) {
        throw OperationCancelled();
    }
}

} // namespace asset_upload
