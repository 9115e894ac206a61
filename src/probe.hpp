#pragma once

#include "http_transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace asset_upload {

/// Outcome of one reachability check.  Unreachable is a normal value,
/// never an exception.
struct ProbeResult {
    bool         reachable = false;
    unsigned int status    = 0;      // 0 when no response was received
    bool         timedOut  = false;
    std::string  error;              // transport failure text, if any
};

class UrlProber {
public:
    virtual ~UrlProber() = default;
    virtual ProbeResult probe(const std::string& url) = 0;
};

/// Probes with a single GET; reachable iff the final status is 2xx.
class HttpUrlProber : public UrlProber {
public:
    explicit HttpUrlProber(Transport& transport,
                           std::chrono::milliseconds timeout = std::chrono::seconds(10));

    ProbeResult probe(const std::string& url) override;

private:
    Transport&                mTransport;
    std::chrono::milliseconds mTimeout;
};

/// Wall-clock source for version timestamps.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::int64_t nowUnixSeconds() const = 0;
};

class SystemClock : public Clock {
public:
    std::int64_t nowUnixSeconds() const override;
};

/// Blocking wait used between backoff attempts.
class Sleeper {
public:
    virtual ~Sleeper() = default;
    virtual void sleepFor(std::chrono::seconds delay) = 0;
};

class ThreadSleeper : public Sleeper {
public:
    void sleepFor(std::chrono::seconds delay) override;
};

} // namespace asset_upload
