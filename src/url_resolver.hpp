#pragma once

#include "cancellation.hpp"
#include "graphql_client.hpp"
#include "models.hpp"
#include "probe.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace asset_upload {

/// Authoritative source of a resource's current delivery URL.
class DeliveryUrlLookup {
public:
    virtual ~DeliveryUrlLookup() = default;

    /// @throws std::runtime_error when the lookup itself fails.
    virtual std::optional<std::string>
    currentDeliveryUrl(const std::string& resourceId) = 0;
};

/// Looks the URL up with a node(id:) query.
class GraphQLDeliveryUrlLookup : public DeliveryUrlLookup {
public:
    explicit GraphQLDeliveryUrlLookup(GraphQLClient& client);

    std::optional<std::string>
    currentDeliveryUrl(const std::string& resourceId) override;

private:
    GraphQLClient& mClient;
};

enum class ResolutionState {
    Start,
    TryVersionless,
    TryAltVersions,
    TryAltPatterns,
    Requery,
    BackoffRetry,
    Resolved,
    Failed,
};

const char* toString(ResolutionState state);

struct ResolutionResult {
    ResolutionState                state = ResolutionState::Failed;
    std::string                    url;       // resolved URL, or the original on failure
    std::string                    strategy;  // strategy that succeeded
    std::vector<ResolutionAttempt> attempts;

    bool resolved() const { return state == ResolutionState::Resolved; }
};

struct ResolverOptions {
    int  maxRetries = 3;
    bool verbose    = false;
};

/// Turns a stale or not-yet-propagated delivery URL into one that answers
/// 2xx, trying in order: the URL itself, without its version parameter,
/// alternate versions, alternate URL shapes, a fresh platform lookup, and
/// finally the original URL again on an exponential backoff schedule.
///
/// Alternate shapes and the lookup need a resource id.  A candidate is
/// probed at most once per run except during backoff.
class DeliveryUrlResolver {
public:
    /// @param lookup  Optional; without it the Requery step is skipped.
    DeliveryUrlResolver(UrlProber& prober,
                        Sleeper& sleeper,
                        const Clock& clock,
                        DeliveryUrlLookup* lookup = nullptr,
                        ResolverOptions options = ResolverOptions{});

    ResolutionResult resolve(const std::string& url,
                             const std::optional<std::string>& resourceId = std::nullopt,
                             const CancellationToken* cancel = nullptr);

    /// @throws ResolutionExhausted when every avenue fails.
    std::string resolveOrThrow(const std::string& url,
                               const std::optional<std::string>& resourceId = std::nullopt,
                               const CancellationToken* cancel = nullptr);

    /// @p fallbackUrl when resolution fails; never throws for reachability.
    std::string resolveWithFallback(const std::string& candidateUrl,
                                    const std::string& fallbackUrl,
                                    const std::optional<std::string>& resourceId = std::nullopt,
                                    const CancellationToken* cancel = nullptr);

    /// Resolve each URL independently.  @p resourceIds pair positionally;
    /// an empty id means none.  Failed entries map to themselves.
    std::map<std::string, std::string>
    resolveMany(const std::vector<std::string>& urls,
                const std::vector<std::string>& resourceIds = {},
                const CancellationToken* cancel = nullptr);

    /// One probe.
    bool isAccessible(const std::string& url);

    /// Version-parameter variants: now, now-300, now+300, "1", "0".
    static std::vector<std::string> alternativeVersions(const std::string& url,
                                                        std::int64_t nowUnixSeconds);

    /// Base URL, id-qualified query variants, then extension swaps.
    static std::vector<std::string> alternativePatterns(const std::string& url,
                                                        const std::string& resourceId);

private:
    UrlProber&         mProber;
    Sleeper&           mSleeper;
    const Clock&       mClock;
    DeliveryUrlLookup* mLookup;
    ResolverOptions    mOptions;
};

} // namespace asset_upload
