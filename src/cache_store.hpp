#pragma once
#include "embedder.hpp"
#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace modelgate {

struct CacheEntry {
    Embedding embedding;          // empty for exact-only entries
    std::string fingerprint;      // SHA-256 hex
    InferenceResult result;
    TimePoint created_at{};
    uint64_t created_epoch = 0;   // wall clock, for persistence
    Duration ttl{0};
    uint64_t hit_count = 0;
    std::string capability_key;   // partition: capabilities, plus region scope if any
    PayloadKind kind = PayloadKind::Chat;

    bool expired(TimePoint now) const { return now - created_at >= ttl; }
};

// Persistent backing for the semantic cache. Entries survive restarts so a
// fresh gateway starts warm. All failures are reported by throwing
// std::runtime_error; the cache logs them and carries on in memory.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual void put(const CacheEntry& entry) = 0;
    virtual void remove(const std::string& fingerprint) = 0;

    // Entries whose TTL has not passed (by wall clock)
    virtual std::vector<CacheEntry> load_live(uint64_t now_epoch) = 0;

    // Delete rows whose TTL has passed. Returns count removed.
    virtual size_t purge_expired(uint64_t now_epoch) = 0;

    virtual void clear() = 0;
    virtual size_t count() = 0;
    virtual std::string store_name() const = 0;
};

} // namespace modelgate
