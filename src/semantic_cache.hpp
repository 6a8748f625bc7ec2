#pragma once
#include "cache_store.hpp"
#include "clock.hpp"
#include "embedder.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace modelgate {

struct SemanticCacheConfig {
    bool enabled = true;
    double similarity_threshold = 0.85;
    // Per payload kind ("chat", "embedding", "vision"); falls back to
    // similarity_threshold
    std::unordered_map<std::string, double> thresholds;
    Duration default_ttl = std::chrono::seconds(3600);
    std::unordered_map<std::string, Duration> ttl_by_volatility;
    size_t max_entries = 10000;
};

struct CacheHit {
    CacheEntry entry;
    double similarity = 0.0;
    bool exact = false;

    // The cached result re-addressed to a new request
    InferenceResult to_result(const std::string& request_id) const;
};

// Approximate-match response cache. An exact fingerprint match is tried
// first; otherwise the request's embedding is compared against entries with
// the same capability set and payload kind. Embedding failures degrade to
// exact-match only.
class SemanticCache {
public:
    SemanticCache(SemanticCacheConfig config, Embedder* embedder, const Clock& clock,
                  std::shared_ptr<CacheStore> store = nullptr);

    // If embedding_out is given it receives the request's embedding (empty if
    // none was computed) so a later store() need not embed again.
    std::optional<CacheHit> lookup(const InferenceRequest& request,
                                   Embedding* embedding_out = nullptr);

    void store(const InferenceRequest& request, const InferenceResult& result,
               const Embedding* embedding = nullptr);

    size_t sweep_expired();
    void clear();
    size_t size() const;

    // Load live entries from the backing store. Returns count loaded.
    size_t warm_start();

    nlohmann::json stats() const;

    double threshold_for(PayloadKind kind) const;
    Duration ttl_for(const std::string& volatility) const;

    static std::string fingerprint(const InferenceRequest& request);

    // Requests pinned to regions only share answers with the same pinning
    static std::string partition_key(const InferenceRequest& request);

private:
    struct Partition {
        std::mutex mutex;
        std::unordered_map<std::string, CacheEntry> entries; // by fingerprint
    };

    Partition* find_partition(const std::string& key) const;
    Partition& partition_for(const std::string& key);

    // Embedding or empty; never throws.
    Embedding safe_embed(const std::string& text);

    void insert(CacheEntry entry);
    void enforce_capacity();
    void store_put(const CacheEntry& entry);
    void store_remove(const std::string& fingerprint);

    SemanticCacheConfig config_;
    Embedder* embedder_;
    const Clock& clock_;
    std::shared_ptr<CacheStore> store_;

    mutable std::shared_mutex partitions_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Partition>> partitions_;
    std::mutex evict_mutex_;
    std::atomic<size_t> size_{0};

    std::atomic<uint64_t> exact_hits_{0};
    std::atomic<uint64_t> semantic_hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
    std::atomic<uint64_t> embedding_errors_{0};
};

} // namespace modelgate
