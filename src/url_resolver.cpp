#include "url_resolver.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "queries.hpp"
#include "util.hpp"

#include <iostream>
#include <set>
#include <stdexcept>

namespace asset_upload {

namespace {

const char* const kVersionParam = "v";

/// Bookkeeping for one resolve() call.
class ResolutionRun {
public:
    ResolutionRun(UrlProber& prober,
                  const CancellationToken* cancel,
                  bool verbose,
                  ResolutionResult& result)
        : mProber(prober)
        , mCancel(cancel)
        , mVerbose(verbose)
        , mResult(result) {}

    /// Probe @p candidate unless it was already probed (or @p repeat).
    /// On success records the candidate as the resolved URL.
    bool tryCandidate(const std::string& candidate,
                      const char* strategy,
                      bool repeat = false)
    {
        if (candidate.empty()) return false;
        if (!mTried.insert(candidate).second && !repeat) return false;

        throwIfCancelled(mCancel);
        const ProbeResult probe = mProber.probe(candidate);

        ResolutionAttempt attempt;
        attempt.candidateUrl = candidate;
        attempt.strategyName = strategy;
        attempt.outcome      = probe.reachable        ? ProbeOutcome::Accessible
                               : probe.error.empty()  ? ProbeOutcome::Unreachable
                                                      : ProbeOutcome::Error;
        mResult.attempts.push_back(attempt);

        if (mVerbose) {
            std::cerr << "[Resolver] " << strategy << " " << candidate << " -> "
                      << toString(attempt.outcome);
            if (probe.status != 0) std::cerr << " (HTTP " << probe.status << ")";
            std::cerr << "\n";
        }

        if (probe.reachable) {
            mResult.state    = ResolutionState::Resolved;
            mResult.url      = candidate;
            mResult.strategy = strategy;
        }
        return probe.reachable;
    }

private:
    UrlProber&               mProber;
    const CancellationToken* mCancel;
    bool                     mVerbose;
    ResolutionResult&        mResult;
    std::set<std::string>    mTried;
};

} // namespace

const char* toString(ResolutionState state) {
    switch (state) {
        case ResolutionState::Start:          return "Start";
        case ResolutionState::TryVersionless: return "TryVersionless";
        case ResolutionState::TryAltVersions: return "TryAltVersions";
        case ResolutionState::TryAltPatterns: return "TryAltPatterns";
        case ResolutionState::Requery:        return "Requery";
        case ResolutionState::BackoffRetry:   return "BackoffRetry";
        case ResolutionState::Resolved:       return "Resolved";
        case ResolutionState::Failed:         return "Failed";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// GraphQLDeliveryUrlLookup
// ---------------------------------------------------------------------------

GraphQLDeliveryUrlLookup::GraphQLDeliveryUrlLookup(GraphQLClient& client)
    : mClient(client) {}

std::optional<std::string>
GraphQLDeliveryUrlLookup::currentDeliveryUrl(const std::string& resourceId)
{
    const auto resp = mClient.execute(queries::kFileById, {{"id", resourceId}});

    if (!isSuccessStatus(resp.httpStatus)) {
        throw std::runtime_error("File query failed: HTTP " +
                                 std::to_string(resp.httpStatus));
    }
    const auto errors = extractGraphqlErrors(resp.body);
    if (!errors.empty()) {
        throw std::runtime_error("File query failed: " + joinMessages(errors));
    }

    if (!resp.body.contains("data") || !resp.body["data"].is_object() ||
        !resp.body["data"].contains("node")) {
        return std::nullopt;
    }
    return parseDeliveryUrl(resp.body["data"]["node"]);
}

// ---------------------------------------------------------------------------
// DeliveryUrlResolver
// ---------------------------------------------------------------------------

DeliveryUrlResolver::DeliveryUrlResolver(UrlProber& prober,
                                         Sleeper& sleeper,
                                         const Clock& clock,
                                         DeliveryUrlLookup* lookup,
                                         ResolverOptions options)
    : mProber(prober)
    , mSleeper(sleeper)
    , mClock(clock)
    , mLookup(lookup)
    , mOptions(options) {}

ResolutionResult
DeliveryUrlResolver::resolve(const std::string& url,
                             const std::optional<std::string>& resourceId,
                             const CancellationToken* cancel)
{
    ResolutionResult result;
    result.url = url;

    if (url.empty()) {
        result.state = ResolutionState::Resolved;
        return result;
    }

    const bool hasId = resourceId.has_value() && !resourceId->empty();
    ResolutionRun run(mProber, cancel, mOptions.verbose, result);

    ResolutionState state = ResolutionState::Start;
    for (;;) {
        switch (state) {
        case ResolutionState::Start:
            if (run.tryCandidate(url, "original")) return result;
            std::cerr << "[Resolver] Delivery URL not reachable, attempting "
                         "recovery: " << url << "\n";
            state = ResolutionState::TryVersionless;
            break;

        case ResolutionState::TryVersionless:
            if (run.tryCandidate(removeQueryParam(url, kVersionParam),
                                 "versionless")) {
                return result;
            }
            state = ResolutionState::TryAltVersions;
            break;

        case ResolutionState::TryAltVersions:
            for (const auto& candidate :
                 alternativeVersions(url, mClock.nowUnixSeconds())) {
                if (run.tryCandidate(candidate, "alt-version")) return result;
            }
            state = hasId ? ResolutionState::TryAltPatterns
                          : ResolutionState::BackoffRetry;
            break;

        case ResolutionState::TryAltPatterns:
            for (const auto& candidate : alternativePatterns(url, *resourceId)) {
                if (run.tryCandidate(candidate, "alt-pattern")) return result;
            }
            state = ResolutionState::Requery;
            break;

        case ResolutionState::Requery:
            if (mLookup != nullptr) {
                throwIfCancelled(cancel);
                std::optional<std::string> fresh;
                try {
                    fresh = mLookup->currentDeliveryUrl(*resourceId);
                } catch (const std::runtime_error& e) {
                    std::cerr << "[Resolver] Lookup for " << *resourceId
                              << " failed: " << e.what() << "\n";
                }
                // The platform's answer is probed even if an earlier step
                // already tried the same URL.
                if (fresh && run.tryCandidate(*fresh, "requery", /*repeat=*/true)) {
                    return result;
                }
            }
            state = ResolutionState::BackoffRetry;
            break;

        case ResolutionState::BackoffRetry:
            for (int attempt = 1; attempt <= mOptions.maxRetries; ++attempt) {
                const auto delay = backoffDelay(attempt);
                if (mOptions.verbose) {
                    std::cerr << "[Resolver] Retry " << attempt << "/"
                              << mOptions.maxRetries << " in " << delay.count()
                              << "s\n";
                }
                throwIfCancelled(cancel);
                mSleeper.sleepFor(delay);
                if (run.tryCandidate(url, "backoff", /*repeat=*/true)) {
                    return result;
                }
            }
            state = ResolutionState::Failed;
            break;

        case ResolutionState::Resolved:
            return result;

        case ResolutionState::Failed:
            result.state    = ResolutionState::Failed;
            result.url      = url;
            result.strategy.clear();
            std::cerr << "[Resolver] All recovery strategies failed for " << url
                      << " (" << result.attempts.size() << " probes)\n";
            return result;
        }
    }
}

std::string
DeliveryUrlResolver::resolveOrThrow(const std::string& url,
                                    const std::optional<std::string>& resourceId,
                                    const CancellationToken* cancel)
{
    ResolutionResult result = resolve(url, resourceId, cancel);
    if (!result.resolved()) {
        throw ResolutionExhausted(url, std::move(result.attempts));
    }
    return result.url;
}

std::string
DeliveryUrlResolver::resolveWithFallback(const std::string& candidateUrl,
                                         const std::string& fallbackUrl,
                                         const std::optional<std::string>& resourceId,
                                         const CancellationToken* cancel)
{
    const ResolutionResult result = resolve(candidateUrl, resourceId, cancel);
    if (result.resolved()) {
        return result.url;
    }

    std::cerr << "[Resolver] Using fallback URL: " << fallbackUrl << "\n";
    return fallbackUrl;
}

std::map<std::string, std::string>
DeliveryUrlResolver::resolveMany(const std::vector<std::string>& urls,
                                 const std::vector<std::string>& resourceIds,
                                 const CancellationToken* cancel)
{
    std::map<std::string, std::string> resolved;

    for (std::size_t i = 0; i < urls.size(); ++i) {
        const std::string& url = urls[i];
        if (resolved.count(url) != 0) continue;

        std::optional<std::string> id;
        if (i < resourceIds.size() && !resourceIds[i].empty()) {
            id = resourceIds[i];
        }
        resolved[url] = resolve(url, id, cancel).url;
    }
    return resolved;
}

bool DeliveryUrlResolver::isAccessible(const std::string& url) {
    return !url.empty() && mProber.probe(url).reachable;
}

std::vector<std::string>
DeliveryUrlResolver::alternativeVersions(const std::string& url,
                                         std::int64_t nowUnixSeconds)
{
    const std::string values[] = {
        std::to_string(nowUnixSeconds),
        std::to_string(nowUnixSeconds - 300),
        std::to_string(nowUnixSeconds + 300),
        "1",
        "0",
    };

    std::vector<std::string> candidates;
    for (const auto& v : values) {
        candidates.push_back(setQueryParam(url, kVersionParam, v));
    }
    return candidates;
}

std::vector<std::string>
DeliveryUrlResolver::alternativePatterns(const std::string& url,
                                         const std::string& resourceId)
{
    const std::string base = stripQuery(url);

    std::vector<std::string> candidates;
    candidates.push_back(base);
    candidates.push_back(base + "?id=" + resourceId);
    candidates.push_back(base + "?image_id=" + resourceId);

    const std::string current = pathExtension(base);
    if (!current.empty()) {
        for (const char* ext : {".jpg", ".jpeg", ".png", ".webp"}) {
            if (current != ext) {
                candidates.push_back(replaceExtension(base, ext));
            }
        }
    }
    return candidates;
}

} // namespace asset_upload
