#include "rate_limiter.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>

namespace modelgate {

namespace {

// Effectively "never" for a bucket that does not refill.
constexpr Duration kNeverRetry = std::chrono::hours(24 * 365);

Duration seconds_ceil(double secs) {
    if (!std::isfinite(secs)) return kNeverRetry;
    auto ms = static_cast<int64_t>(std::ceil(secs * 1000.0));
    return Duration(std::max<int64_t>(ms, 1));
}

} // namespace

RateLimiter::RateLimiter(RateLimiterConfig config, const Clock& clock)
    : config_(std::move(config)), clock_(clock) {}

std::string RateLimiter::bucket_key(const std::string& caller, const std::string& provider) {
    // Unit separator cannot appear in ids we accept from config or callers
    return caller + '\x1f' + provider;
}

RateLimiter::Shard& RateLimiter::shard_for(const std::string& key) {
    return shards_[std::hash<std::string>{}(key) % kShardCount];
}

const RateLimiter::Shard& RateLimiter::shard_for(const std::string& key) const {
    return shards_[std::hash<std::string>{}(key) % kShardCount];
}

const BucketSettings& RateLimiter::settings_for(const std::string& provider) const {
    auto it = config_.per_provider.find(provider);
    if (it != config_.per_provider.end()) return it->second;
    return config_.defaults;
}

RateLimiter::Bucket RateLimiter::fresh_bucket(const std::string& caller,
                                              const std::string& provider,
                                              TimePoint now) const {
    const auto& s = settings_for(provider);
    Bucket b;
    b.caller = caller;
    b.provider = provider;
    b.capacity = s.capacity;
    b.refill_per_second = s.refill_per_second;
    b.tokens = s.capacity;
    b.requests_per_minute = s.requests_per_minute;
    b.requests = s.requests_per_minute;
    b.last_refill = now;
    b.last_used = now;
    return b;
}

double RateLimiter::refilled(const Bucket& b, TimePoint now) {
    if (now <= b.last_refill) return b.tokens;
    double elapsed = std::chrono::duration<double>(now - b.last_refill).count();
    return std::min(b.capacity, b.tokens + elapsed * b.refill_per_second);
}

double RateLimiter::requests_refilled(const Bucket& b, TimePoint now) {
    if (now <= b.last_refill) return b.requests;
    double elapsed = std::chrono::duration<double>(now - b.last_refill).count();
    return std::min(b.requests_per_minute,
                    b.requests + elapsed * b.requests_per_minute / 60.0);
}

AcquireResult RateLimiter::decide(double available, double requests, const Bucket& b,
                                  uint32_t tokens) {
    AcquireResult r;
    double need = static_cast<double>(tokens);

    if (b.requests_per_minute > 0.0 && requests < 1.0) {
        r.request_limited = true;
        r.remaining = available;
        r.retry_after = seconds_ceil((1.0 - requests) * 60.0 / b.requests_per_minute);
        if (need > available && b.refill_per_second > 0.0 && need <= b.capacity) {
            r.retry_after = std::max(r.retry_after,
                                     seconds_ceil((need - available) / b.refill_per_second));
        }
        r.exceeds_capacity = need > b.capacity;
        return r;
    }

    if (need <= available) {
        r.allowed = true;
        r.remaining = available - need;
        return r;
    }

    r.remaining = available;
    if (b.refill_per_second <= 0.0) {
        r.retry_after = kNeverRetry;
        r.exceeds_capacity = need > b.capacity;
        return r;
    }
    if (need > b.capacity) {
        // Never satisfiable; report the time to a full bucket
        r.exceeds_capacity = true;
        r.retry_after = seconds_ceil((b.capacity - available) / b.refill_per_second);
        return r;
    }
    r.retry_after = seconds_ceil((need - available) / b.refill_per_second);
    return r;
}

AcquireResult RateLimiter::try_acquire(const std::string& caller, const std::string& provider,
                                       uint32_t tokens) {
    std::string key = bucket_key(caller, provider);
    auto& shard = shard_for(key);
    TimePoint now = clock_.now();

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.buckets.find(key);
    if (it == shard.buckets.end()) {
        it = shard.buckets.emplace(key, fresh_bucket(caller, provider, now)).first;
    }

    Bucket& b = it->second;
    b.tokens = refilled(b, now);
    b.requests = requests_refilled(b, now);
    b.last_refill = now;
    b.last_used = now;

    AcquireResult r = decide(b.tokens, b.requests, b, tokens);
    if (r.allowed) {
        b.tokens -= static_cast<double>(tokens);
        if (b.requests_per_minute > 0.0) b.requests -= 1.0;
    }
    return r;
}

AcquireResult RateLimiter::would_allow(const std::string& caller, const std::string& provider,
                                       uint32_t tokens) const {
    std::string key = bucket_key(caller, provider);
    const auto& shard = shard_for(key);
    TimePoint now = clock_.now();

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.buckets.find(key);
    if (it == shard.buckets.end()) {
        Bucket fresh = fresh_bucket(caller, provider, now);
        return decide(fresh.tokens, fresh.requests, fresh, tokens);
    }
    const Bucket& b = it->second;
    return decide(refilled(b, now), requests_refilled(b, now), b, tokens);
}

size_t RateLimiter::evict_idle() {
    TimePoint now = clock_.now();
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.buckets.begin(); it != shard.buckets.end(); ) {
            if (now - it->second.last_used > config_.idle_timeout) {
                it = shard.buckets.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        std::cerr << "[ratelimit] Evicted " << removed << " idle buckets\n";
    }
    return removed;
}

void RateLimiter::reset(const std::string& caller, const std::string& provider) {
    std::string key = bucket_key(caller, provider);
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.buckets.erase(key);
}

std::vector<BucketOccupancy> RateLimiter::occupancy() const {
    TimePoint now = clock_.now();
    std::vector<BucketOccupancy> out;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [key, b] : shard.buckets) {
            (void)key;
            out.push_back({b.caller, b.provider, refilled(b, now), b.capacity,
                           b.refill_per_second, requests_refilled(b, now),
                           b.requests_per_minute});
        }
    }
    std::sort(out.begin(), out.end(), [](const BucketOccupancy& a, const BucketOccupancy& b) {
        if (a.caller != b.caller) return a.caller < b.caller;
        return a.provider < b.provider;
    });
    return out;
}

size_t RateLimiter::bucket_count() const {
    size_t n = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        n += shard.buckets.size();
    }
    return n;
}

nlohmann::json RateLimiter::snapshot() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& o : occupancy()) {
        double used = o.capacity > 0.0 ? 1.0 - o.tokens / o.capacity : 0.0;
        arr.push_back({
            {"caller", o.caller},
            {"provider", o.provider},
            {"tokens", o.tokens},
            {"capacity", o.capacity},
            {"refill_per_second", o.refill_per_second},
            {"utilization", used}
        });
        if (o.requests_per_minute > 0.0) {
            arr.back()["requests"] = o.requests;
            arr.back()["requests_per_minute"] = o.requests_per_minute;
        }
    }
    return arr;
}

} // namespace modelgate
