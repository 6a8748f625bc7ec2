#pragma once
#include "cache_store.hpp"
#include "catalog.hpp"
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "model_registry.hpp"
#include "provider_adapter.hpp"
#include "rate_limiter.hpp"
#include "request_queue.hpp"
#include "router.hpp"
#include "semantic_cache.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace modelgate {

class HttpClient;

// Collaborators a Gateway runs with. Anything left empty is built from the
// config (clock: system clock; catalog: config file or inline models).
struct GatewayParts {
    std::unique_ptr<CatalogSource> catalog;
    AdapterSet adapters;
    std::unique_ptr<Embedder> embedder;      // null = exact-match cache only
    std::shared_ptr<CacheStore> cache_store; // null = memory only
    const Clock* clock = nullptr;            // must outlive the gateway
};

// The inference entry point. Requests go cache -> queue -> worker pool ->
// router -> adapter; outcomes flow back into breaker, limiter and cache.
class Gateway {
public:
    Gateway(GatewayConfig config, GatewayParts parts);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Adapters, embedder and cache store built from config over `http`.
    static std::unique_ptr<Gateway> from_config(const GatewayConfig& config, HttpClient& http);

    // Spawn workers and the maintenance thread. Idempotent.
    void start();

    // Stop accepting work, finish what is queued, join all threads.
    void stop();

    bool running() const { return running_.load(); }

    // Blocking inference. Throws GatewayError; QueueRejected if the
    // gateway has not been started or is stopped.
    InferenceResult infer(InferenceRequest request);

    // Cache hits complete immediately. Admission failures throw
    // GatewayError (QueueRejected) here; everything later is delivered
    // through the future. Before start() accepted requests wait in the
    // queue; stop() or the destructor fails whatever is left.
    std::future<InferenceResult> submit(InferenceRequest request);

    // One pass of the periodic sweeps (cache TTL, queue expiry, idle buckets)
    void run_maintenance();

    // ── Administrative surface ──────────────────────────────────
    nlohmann::json stats() const;
    void clear_cache();
    // Re-pull the catalog source. Throws GatewayError (ConfigurationError)
    // and keeps the previous catalog if the new one is invalid.
    void reload_registry();
    void reset_provider(const std::string& provider);

    // Ask every adapter whether its provider answers, alongside the
    // provider's circuit state. Calls go out one at a time, each bounded
    // by gateway.health_timeout. Does not touch the breaker.
    nlohmann::json health_check();

    const ModelRegistry& registry() const { return registry_; }
    const CircuitBreaker& breaker() const { return breaker_; }
    const GatewayConfig& config() const { return config_; }
    size_t in_flight() const;

private:
    struct Pending {
        std::promise<InferenceResult> promise;
        InferenceRequest request;
        Embedding embedding; // from the cache lookup, reused on store
    };

    void worker_loop();
    void maintenance_loop();
    void process(InferenceRequest request);
    void fail_pending(const std::string& request_id, std::exception_ptr error);
    std::unique_ptr<Pending> take_pending(const std::string& request_id);

    GatewayConfig config_;
    std::unique_ptr<SystemClock> owned_clock_;
    const Clock& clock_;
    std::unique_ptr<CatalogSource> catalog_;
    ModelRegistry registry_;
    RateLimiter limiter_;
    CircuitBreaker breaker_;
    std::unique_ptr<Embedder> embedder_;
    SemanticCache cache_;
    RequestQueue queue_;
    Router router_;
    AdapterSet adapters_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Pending>> pending_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;
    std::thread maintenance_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
    bool stopping_ = false; // guarded by maintenance_mutex_

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> cache_served_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> late_results_{0};
};

} // namespace modelgate
