#include "api/RateLimiter.hpp"
#include <algorithm>

RateLimiter::RateLimiter(int requestsPerMinute, int burst)
    : ratePerSec_(requestsPerMinute / 60.0), capacity_(static_cast<double>(burst)) {}

bool RateLimiter::allow(const std::string& client) {
    return allow(client, Clock::now());
}

bool RateLimiter::allow(const std::string& client, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mtx_);
    evictIdle(now);

    auto it = buckets_.find(client);
    if (it == buckets_.end()) {
        it = buckets_.emplace(client, Bucket{capacity_, now}).first;
    }

    auto& b = it->second;
    const double elapsed = std::chrono::duration<double>(now - b.last).count();
    if (elapsed > 0.0) {
        b.tokens = std::min(capacity_, b.tokens + elapsed * ratePerSec_);
        b.last = now;
    }
    if (b.tokens < 1.0) return false;
    b.tokens -= 1.0;
    return true;
}

// A bucket idle long enough to have refilled completely carries no state.
void RateLimiter::evictIdle(Clock::time_point now) {
    if (now - lastEviction_ < std::chrono::minutes(1)) return;
    lastEviction_ = now;

    const double refillSec = capacity_ / ratePerSec_;
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (std::chrono::duration<double>(now - it->second.last).count() >= refillSec) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
}
