#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace voicebridge {
namespace core {

/**
 * Token bucket per key. Each bucket holds up to `burst` tokens and refills
 * continuously at `ratePerSecond`.
 */
class RateLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    RateLimiter(double ratePerSecond, double burst, Clock clock = nullptr);

    // Consume one token if available
    bool allow(const std::string& key);

    double getTokens(const std::string& key);
    void reset(const std::string& key);

    // Drop full buckets untouched for at least maxIdle; returns the number dropped
    size_t purgeIdle(std::chrono::steady_clock::duration maxIdle);

    size_t getBucketCount() const;
    double getRate() const { return ratePerSecond_; }
    double getBurst() const { return burst_; }

private:
    struct Bucket {
        double tokens;
        std::chrono::steady_clock::time_point lastRefill;
    };

    Bucket& bucketFor(const std::string& key, std::chrono::steady_clock::time_point now);
    void refill(Bucket& bucket, std::chrono::steady_clock::time_point now) const;

    double ratePerSecond_;
    double burst_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, Bucket> buckets_;
};

} // namespace core
} // namespace voicebridge
