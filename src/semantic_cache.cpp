#include "semantic_cache.hpp"
#include "util.hpp"
#include <iostream>
#include <set>
#include <vector>

namespace modelgate {

InferenceResult CacheHit::to_result(const std::string& request_id) const {
    InferenceResult r = entry.result;
    r.request_id = request_id;
    r.cache_hit = true;
    r.similarity = similarity;
    r.cost = 0.0;
    r.latency = Duration{0};
    return r;
}

SemanticCache::SemanticCache(SemanticCacheConfig config, Embedder* embedder, const Clock& clock,
                             std::shared_ptr<CacheStore> store)
    : config_(std::move(config)), embedder_(embedder), clock_(clock), store_(std::move(store)) {}

std::string SemanticCache::fingerprint(const InferenceRequest& request) {
    std::string material = payload_kind_to_string(payload_kind(request.payload));
    material += '\n';
    material += partition_key(request);
    material += '\n';
    material += normalized_payload_text(request.payload);
    return sha256_hex(material);
}

std::string SemanticCache::partition_key(const InferenceRequest& request) {
    std::string key = capability_key(request.required_capabilities);
    if (request.allowed_regions.empty()) return key;

    std::set<std::string> regions(request.allowed_regions.begin(),
                                  request.allowed_regions.end());
    key += '@';
    bool first = true;
    for (const auto& r : regions) {
        if (!first) key += ',';
        key += r;
        first = false;
    }
    return key;
}

double SemanticCache::threshold_for(PayloadKind kind) const {
    auto it = config_.thresholds.find(payload_kind_to_string(kind));
    if (it != config_.thresholds.end()) return it->second;
    return config_.similarity_threshold;
}

Duration SemanticCache::ttl_for(const std::string& volatility) const {
    auto it = config_.ttl_by_volatility.find(volatility);
    if (it != config_.ttl_by_volatility.end()) return it->second;
    return config_.default_ttl;
}

SemanticCache::Partition* SemanticCache::find_partition(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
    auto it = partitions_.find(key);
    return it == partitions_.end() ? nullptr : it->second.get();
}

SemanticCache::Partition& SemanticCache::partition_for(const std::string& key) {
    if (auto* p = find_partition(key)) return *p;
    std::unique_lock<std::shared_mutex> lock(partitions_mutex_);
    auto& slot = partitions_[key];
    if (!slot) slot = std::make_unique<Partition>();
    return *slot;
}

Embedding SemanticCache::safe_embed(const std::string& text) {
    if (!embedder_) return {};
    try {
        Embedding e = embedder_->embed(text);
        if (e.empty()) {
            embedding_errors_++;
            std::cerr << "[cache] Embedder " << embedder_->embedder_name()
                      << " returned no vector; exact match only\n";
        }
        return e;
    } catch (const std::exception& e) {
        embedding_errors_++;
        std::cerr << "[cache] Embedding failed (" << e.what() << "); exact match only\n";
        return {};
    }
}

void SemanticCache::store_put(const CacheEntry& entry) {
    if (!store_) return;
    try {
        store_->put(entry);
    } catch (const std::exception& e) {
        std::cerr << "[cache] " << store_->store_name() << " write failed: " << e.what() << "\n";
    }
}

void SemanticCache::store_remove(const std::string& fingerprint) {
    if (!store_) return;
    try {
        store_->remove(fingerprint);
    } catch (const std::exception& e) {
        std::cerr << "[cache] " << store_->store_name() << " delete failed: " << e.what() << "\n";
    }
}

std::optional<CacheHit> SemanticCache::lookup(const InferenceRequest& request,
                                              Embedding* embedding_out) {
    if (embedding_out) embedding_out->clear();
    if (!config_.enabled || !request.enable_cache) return std::nullopt;

    PayloadKind kind = payload_kind(request.payload);
    std::string cap_key = partition_key(request);
    std::string fp = fingerprint(request);
    TimePoint now = clock_.now();
    std::vector<std::string> expired;

    Partition* part = find_partition(cap_key);
    if (part) {
        std::lock_guard<std::mutex> lock(part->mutex);
        auto it = part->entries.find(fp);
        if (it != part->entries.end()) {
            if (it->second.expired(now)) {
                part->entries.erase(it);
                size_--;
                expirations_++;
                expired.push_back(fp);
            } else {
                it->second.hit_count++;
                exact_hits_++;
                return CacheHit{it->second, 1.0, true};
            }
        }
    }
    for (const auto& e : expired) store_remove(e);
    expired.clear();

    // Opaque bytes have no meaningful neighbourhood
    if (kind == PayloadKind::Opaque || !embedder_) {
        misses_++;
        return std::nullopt;
    }

    Embedding query = safe_embed(normalized_payload_text(request.payload));
    if (embedding_out) *embedding_out = query;
    if (query.empty() || !part) {
        misses_++;
        return std::nullopt;
    }

    std::optional<CacheHit> hit;
    {
        std::lock_guard<std::mutex> lock(part->mutex);
        double threshold = threshold_for(kind);
        CacheEntry* best = nullptr;
        double best_sim = -2.0;

        for (auto it = part->entries.begin(); it != part->entries.end(); ) {
            if (it->second.expired(now)) {
                expired.push_back(it->first);
                it = part->entries.erase(it);
                size_--;
                expirations_++;
                continue;
            }
            CacheEntry& e = it->second;
            if (e.kind == kind && !e.embedding.empty()) {
                double sim = cosine_similarity(query, e.embedding);
                if (sim > best_sim) {
                    best_sim = sim;
                    best = &e;
                }
            }
            ++it;
        }

        if (best && best_sim >= threshold) {
            best->hit_count++;
            hit = CacheHit{*best, best_sim, false};
        }
    }
    for (const auto& e : expired) store_remove(e);

    if (hit) {
        semantic_hits_++;
    } else {
        misses_++;
    }
    return hit;
}

void SemanticCache::store(const InferenceRequest& request, const InferenceResult& result,
                          const Embedding* embedding) {
    if (!config_.enabled || !request.enable_cache || result.cache_hit) return;

    CacheEntry entry;
    entry.kind = payload_kind(request.payload);
    entry.fingerprint = fingerprint(request);
    entry.capability_key = partition_key(request);
    entry.result = result;
    entry.created_at = clock_.now();
    entry.created_epoch = epoch_seconds();
    entry.ttl = ttl_for(request.volatility);

    if (entry.kind != PayloadKind::Opaque) {
        if (embedding) {
            entry.embedding = *embedding;
        } else {
            entry.embedding = safe_embed(normalized_payload_text(request.payload));
        }
    }

    store_put(entry);
    insert(std::move(entry));
    writes_++;
    enforce_capacity();
}

void SemanticCache::insert(CacheEntry entry) {
    auto& part = partition_for(entry.capability_key);
    std::lock_guard<std::mutex> lock(part.mutex);
    std::string fp = entry.fingerprint;
    auto result = part.entries.insert_or_assign(std::move(fp), std::move(entry));
    if (result.second) size_++;
}

void SemanticCache::enforce_capacity() {
    if (size_.load() <= config_.max_entries) return;

    std::lock_guard<std::mutex> evict_lock(evict_mutex_);
    while (size_.load() > config_.max_entries) {
        Partition* victim_part = nullptr;
        std::string victim_fp;
        uint64_t victim_hits = 0;
        TimePoint victim_created{};

        {
            std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
            for (const auto& [key, part] : partitions_) {
                (void)key;
                std::lock_guard<std::mutex> plock(part->mutex);
                for (const auto& [fp, e] : part->entries) {
                    bool better = !victim_part ||
                        e.hit_count < victim_hits ||
                        (e.hit_count == victim_hits && e.created_at < victim_created);
                    if (better) {
                        victim_part = part.get();
                        victim_fp = fp;
                        victim_hits = e.hit_count;
                        victim_created = e.created_at;
                    }
                }
            }
        }
        if (!victim_part) break;

        {
            std::lock_guard<std::mutex> plock(victim_part->mutex);
            if (victim_part->entries.erase(victim_fp) > 0) {
                size_--;
                evictions_++;
            }
        }
        store_remove(victim_fp);
    }
}

size_t SemanticCache::sweep_expired() {
    TimePoint now = clock_.now();
    std::vector<std::string> removed;
    {
        std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
        for (const auto& [key, part] : partitions_) {
            (void)key;
            std::lock_guard<std::mutex> plock(part->mutex);
            for (auto it = part->entries.begin(); it != part->entries.end(); ) {
                if (it->second.expired(now)) {
                    removed.push_back(it->first);
                    it = part->entries.erase(it);
                    size_--;
                    expirations_++;
                } else {
                    ++it;
                }
            }
        }
    }

    if (store_) {
        try {
            store_->purge_expired(epoch_seconds());
        } catch (const std::exception& e) {
            std::cerr << "[cache] " << store_->store_name() << " purge failed: " << e.what() << "\n";
        }
    }
    if (!removed.empty()) {
        std::cerr << "[cache] Swept " << removed.size() << " expired entries\n";
    }
    return removed.size();
}

void SemanticCache::clear() {
    size_t dropped = 0;
    {
        std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
        for (const auto& [key, part] : partitions_) {
            (void)key;
            std::lock_guard<std::mutex> plock(part->mutex);
            dropped += part->entries.size();
            size_ -= part->entries.size();
            part->entries.clear();
        }
    }
    if (store_) {
        try {
            store_->clear();
        } catch (const std::exception& e) {
            std::cerr << "[cache] " << store_->store_name() << " clear failed: " << e.what() << "\n";
        }
    }
    std::cerr << "[cache] Cleared " << dropped << " entries\n";
}

size_t SemanticCache::size() const {
    return size_.load();
}

size_t SemanticCache::warm_start() {
    if (!store_) return 0;

    uint64_t now_epoch = epoch_seconds();
    std::vector<CacheEntry> entries;
    try {
        entries = store_->load_live(now_epoch);
    } catch (const std::exception& e) {
        std::cerr << "[cache] " << store_->store_name() << " load failed: " << e.what() << "\n";
        return 0;
    }

    TimePoint now = clock_.now();
    size_t loaded = 0;
    for (auto& entry : entries) {
        uint64_t age = now_epoch > entry.created_epoch ? now_epoch - entry.created_epoch : 0;
        entry.created_at = now - std::chrono::seconds(age);
        if (entry.expired(now)) continue;
        insert(std::move(entry));
        ++loaded;
    }
    enforce_capacity();

    std::cerr << "[cache] Warm start: " << loaded << " entries from "
              << store_->store_name() << "\n";
    return loaded;
}

nlohmann::json SemanticCache::stats() const {
    uint64_t exact = exact_hits_.load();
    uint64_t semantic = semantic_hits_.load();
    uint64_t misses = misses_.load();
    uint64_t hits = exact + semantic;
    uint64_t lookups = hits + misses;

    return {
        {"enabled", config_.enabled},
        {"semantic", embedder_ != nullptr},
        {"size", size_.load()},
        {"max_entries", config_.max_entries},
        {"hits", hits},
        {"exact_hits", exact},
        {"semantic_hits", semantic},
        {"misses", misses},
        {"hit_rate", lookups > 0 ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0},
        {"writes", writes_.load()},
        {"evictions", evictions_.load()},
        {"expirations", expirations_.load()},
        {"embedding_errors", embedding_errors_.load()}
    };
}

} // namespace modelgate
