#pragma once
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "model_registry.hpp"
#include "provider_adapter.hpp"
#include "rate_limiter.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <map>
#include <vector>

namespace modelgate {

struct RouterConfig {
    uint32_t max_failover = 2; // extra candidates after the first
    // Expected response time per latency class; compared with max_latency
    std::map<LatencyClass, Duration> latency_budgets = {
        {LatencyClass::Fast, std::chrono::seconds(2)},
        {LatencyClass::Standard, std::chrono::seconds(10)},
        {LatencyClass::Slow, std::chrono::seconds(30)},
    };
    // Per-call adapter timeout per latency class
    std::map<LatencyClass, Duration> timeouts = {
        {LatencyClass::Fast, std::chrono::seconds(15)},
        {LatencyClass::Standard, std::chrono::seconds(60)},
        {LatencyClass::Slow, std::chrono::seconds(180)},
    };
};

// Picks the model for a request and runs bounded failover across the
// ranked candidates. Routing decisions read the registry snapshot, breaker
// and limiter without consuming anything; only dispatch() spends tokens
// and claims trials.
class Router {
public:
    Router(const ModelRegistry& registry, CircuitBreaker& breaker, RateLimiter& limiter,
           RouterConfig config, const Clock& clock);

    // All eligible candidates, best first. Throws GatewayError
    // (CapabilityUnavailable, ConstraintsUnsatisfiable, AllProvidersUnavailable).
    //
    // Without `adapters` the ranking ignores whether anything can actually
    // call a provider. With it, candidates whose provider has no adapter or
    // whose adapter cannot take the payload kind are left out, so the
    // result is exactly the order dispatch() walks.
    std::vector<ModelDescriptor> rank(const InferenceRequest& request,
                                      const AdapterSet* adapters = nullptr) const;

    // The top-ranked candidate.
    ModelDescriptor route(const InferenceRequest& request,
                          const AdapterSet* adapters = nullptr) const;

    // Invoke candidates in rank order, at most 1 + max_failover attempts.
    // Throws GatewayError on exhaustion, permanent error or expiry.
    InferenceResult dispatch(const InferenceRequest& request, const AdapterSet& adapters);

    Duration latency_budget(LatencyClass lc) const;
    Duration timeout_for(LatencyClass lc) const;

    nlohmann::json stats() const;

private:
    const ModelRegistry& registry_;
    CircuitBreaker& breaker_;
    RateLimiter& limiter_;
    RouterConfig config_;
    const Clock& clock_;

    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> failovers_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> permanent_errors_{0};
    std::atomic<uint64_t> exhausted_{0};
    std::atomic<uint64_t> unavailable_{0};
};

} // namespace modelgate
