#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>

/**
 * Token bucket per client address. Each bucket holds up to `burst` tokens and
 * refills at requestsPerMinute / 60 tokens per second.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(int requestsPerMinute, int burst);

    // Takes a token for `client` if one is available.
    bool allow(const std::string& client);
    bool allow(const std::string& client, Clock::time_point now);

private:
    struct Bucket {
        double tokens;
        Clock::time_point last;
    };

    void evictIdle(Clock::time_point now);

    const double ratePerSec_;
    const double capacity_;

    std::mutex mtx_;
    std::map<std::string, Bucket> buckets_;
    Clock::time_point lastEviction_{};
};
