#include "core/rate_limiter.hpp"
#include <algorithm>
#include <stdexcept>

namespace voicebridge {
namespace core {

RateLimiter::RateLimiter(double ratePerSecond, double burst, Clock clock)
    : ratePerSecond_(ratePerSecond), burst_(burst), clock_(std::move(clock)) {
    if (ratePerSecond_ <= 0.0 || burst_ < 1.0) {
        throw std::invalid_argument("RateLimiter needs a positive rate and a burst of at least one");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

bool RateLimiter::allow(const std::string& key) {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    Bucket& bucket = bucketFor(key, now);
    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return true;
    }
    return false;
}

double RateLimiter::getTokens(const std::string& key) {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    return bucketFor(key, now).tokens;
}

void RateLimiter::reset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_.erase(key);
}

size_t RateLimiter::purgeIdle(std::chrono::steady_clock::duration maxIdle) {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = 0;
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        auto idle = now - it->second.lastRefill;
        refill(it->second, now);
        // refill() moved lastRefill, so judge idleness on the value before it
        if (idle >= maxIdle && it->second.tokens >= burst_) {
            it = buckets_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

size_t RateLimiter::getBucketCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

RateLimiter::Bucket& RateLimiter::bucketFor(const std::string& key, std::chrono::steady_clock::time_point now) {
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        it = buckets_.emplace(key, Bucket{burst_, now}).first;
        return it->second;
    }
    refill(it->second, now);
    return it->second;
}

void RateLimiter::refill(Bucket& bucket, std::chrono::steady_clock::time_point now) const {
    if (now <= bucket.lastRefill) {
        return;
    }
    double elapsed = std::chrono::duration<double>(now - bucket.lastRefill).count();
    bucket.tokens = std::min(burst_, bucket.tokens + elapsed * ratePerSecond_);
    bucket.lastRefill = now;
}

} // namespace core
} // namespace voicebridge
