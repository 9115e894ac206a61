#include "probe.hpp"

#include <thread>

namespace asset_upload {

HttpUrlProber::HttpUrlProber(Transport& transport,
                             std::chrono::milliseconds timeout)
    : mTransport(transport)
    , mTimeout(timeout) {}

ProbeResult HttpUrlProber::probe(const std::string& url) {
    ProbeResult result;
    if (url.empty()) {
        result.error = "empty URL";
        return result;
    }

    HttpRequest request;
    request.method  = "GET";
    request.url     = url;
    request.timeout = mTimeout;
    request.headers = {
        {"Accept", "image/webp,image/apng,image/*,*/*;q=0.8"},
    };

    try {
        const HttpResponse response = mTransport.send(request);
        result.status    = response.status;
        result.reachable = isSuccessStatus(response.status);
    } catch (const TransportError& e) {
        result.timedOut = e.timedOut();
        result.error    = e.what();
    }
    return result;
}

std::int64_t SystemClock::nowUnixSeconds() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void ThreadSleeper::sleepFor(std::chrono::seconds delay) {
    std::this_thread::sleep_for(delay);
}

} // namespace asset_upload
