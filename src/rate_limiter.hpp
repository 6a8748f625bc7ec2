#pragma once
#include "clock.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

struct BucketSettings {
    double capacity = 100000.0;        // tokens
    double refill_per_second = 2000.0; // tokens per second
    double requests_per_minute = 0.0;  // second bucket counting calls; 0 = off
};

struct RateLimiterConfig {
    BucketSettings defaults;
    std::unordered_map<std::string, BucketSettings> per_provider;
    Duration idle_timeout = std::chrono::minutes(10);
};

struct AcquireResult {
    bool allowed = false;
    Duration retry_after{0};       // zero when allowed
    bool exceeds_capacity = false; // request can never fit this bucket
    bool request_limited = false;  // the request-count bucket said no
    double remaining = 0.0;        // tokens left after the call

    explicit operator bool() const { return allowed; }
};

struct BucketOccupancy {
    std::string caller;
    std::string provider;
    double tokens = 0.0;
    double capacity = 0.0;
    double refill_per_second = 0.0;
    double requests = 0.0;
    double requests_per_minute = 0.0;
};

// Token-bucket admission per (caller, provider). Never blocks; callers
// decide whether to wait, re-route or reject. Buckets live in fixed shards
// so unrelated pairs never contend on one lock.
//
// A pair may also carry a request-count bucket (requests_per_minute). A
// call is admitted only when both buckets can pay, and then both pay.
class RateLimiter {
public:
    RateLimiter(RateLimiterConfig config, const Clock& clock);

    AcquireResult try_acquire(const std::string& caller, const std::string& provider,
                              uint32_t tokens);

    // Same decision as try_acquire, but spends nothing and creates no bucket.
    AcquireResult would_allow(const std::string& caller, const std::string& provider,
                              uint32_t tokens) const;

    // Drop buckets untouched for longer than idle_timeout. Returns count removed.
    size_t evict_idle();

    void reset(const std::string& caller, const std::string& provider);

    std::vector<BucketOccupancy> occupancy() const;
    size_t bucket_count() const;
    nlohmann::json snapshot() const;

    const BucketSettings& settings_for(const std::string& provider) const;

private:
    struct Bucket {
        std::string caller;
        std::string provider;
        double capacity = 0.0;
        double refill_per_second = 0.0;
        double tokens = 0.0;
        double requests_per_minute = 0.0;
        double requests = 0.0;
        TimePoint last_refill{};
        TimePoint last_used{};
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Bucket> buckets;
    };

    static constexpr size_t kShardCount = 16;

    static std::string bucket_key(const std::string& caller, const std::string& provider);
    Shard& shard_for(const std::string& key);
    const Shard& shard_for(const std::string& key) const;

    Bucket fresh_bucket(const std::string& caller, const std::string& provider,
                        TimePoint now) const;

    // Tokens the bucket would hold at `now` (capped at capacity)
    static double refilled(const Bucket& b, TimePoint now);
    static double requests_refilled(const Bucket& b, TimePoint now);
    static AcquireResult decide(double available, double requests, const Bucket& b,
                                uint32_t tokens);

    RateLimiterConfig config_;
    const Clock& clock_;
    std::array<Shard, kShardCount> shards_;
};

} // namespace modelgate
