#include "router.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>

namespace modelgate {

namespace {

// Hint used when everything is excluded but nothing reports a wait time
// (a half-open trial is already in flight).
constexpr Duration kDefaultRetryHint = std::chrono::seconds(1);

struct Ranked {
    ModelDescriptor model;
    double cost;
};

} // namespace

Router::Router(const ModelRegistry& registry, CircuitBreaker& breaker, RateLimiter& limiter,
               RouterConfig config, const Clock& clock)
    : registry_(registry), breaker_(breaker), limiter_(limiter),
      config_(std::move(config)), clock_(clock) {}

Duration Router::latency_budget(LatencyClass lc) const {
    auto it = config_.latency_budgets.find(lc);
    return it == config_.latency_budgets.end() ? std::chrono::seconds(10) : it->second;
}

Duration Router::timeout_for(LatencyClass lc) const {
    auto it = config_.timeouts.find(lc);
    return it == config_.timeouts.end() ? std::chrono::seconds(60) : it->second;
}

std::vector<ModelDescriptor> Router::rank(const InferenceRequest& request,
                                          const AdapterSet* adapters) const {
    auto snapshot = registry_.snapshot();
    auto matching = snapshot->matching(request.required_capabilities);
    if (matching.empty()) {
        throw GatewayError(ErrorKind::CapabilityUnavailable,
                           "No enabled model offers [" +
                           capability_key(request.required_capabilities) + "]");
    }

    uint32_t input_tokens = request.estimated_input_tokens();
    uint32_t total_tokens = input_tokens + request.max_output_tokens;

    // Hard constraints from the request itself
    std::vector<Ranked> fits;
    size_t over_cost = 0, over_context = 0, too_slow = 0, off_region = 0;
    for (auto& m : matching) {
        if (!m.hosted_in(request.allowed_regions)) {
            off_region++;
            continue;
        }
        double cost = m.estimate_cost(input_tokens, request.max_output_tokens);
        if (request.max_cost && cost > *request.max_cost) {
            over_cost++;
            continue;
        }
        if (total_tokens > m.max_context_tokens) {
            over_context++;
            continue;
        }
        if (request.max_latency && latency_budget(m.latency_class) > *request.max_latency) {
            too_slow++;
            continue;
        }
        fits.push_back({std::move(m), cost});
    }
    if (fits.empty()) {
        throw GatewayError(ErrorKind::ConstraintsUnsatisfiable,
                           "No model satisfies the request constraints (" +
                           std::to_string(over_cost) + " over cost, " +
                           std::to_string(over_context) + " over context, " +
                           std::to_string(too_slow) + " too slow, " +
                           std::to_string(off_region) + " outside allowed regions)");
    }

    // Live availability: adapter, breaker state, then caller quota
    const PayloadKind kind = payload_kind(request.payload);
    std::vector<Ranked> available;
    Duration shortest = Duration::max();
    for (auto& r : fits) {
        const std::string& provider = r.model.provider;
        if (adapters) {
            ProviderAdapter* adapter = adapters->find(provider);
            if (!adapter || !adapter->supports(kind)) continue;
        }
        if (!breaker_.is_available(provider)) {
            shortest = std::min(shortest, breaker_.time_until_retry(provider));
            continue;
        }
        auto admit = limiter_.would_allow(request.caller_id, provider, total_tokens);
        if (!admit) {
            shortest = std::min(shortest, admit.retry_after);
            continue;
        }
        available.push_back(std::move(r));
    }
    if (available.empty()) {
        if (shortest == Duration::max() || shortest <= Duration{0}) shortest = kDefaultRetryHint;
        throw GatewayError(ErrorKind::AllProvidersUnavailable,
                           "All " + std::to_string(fits.size()) +
                           " candidates are circuit-open, rate limited or have no adapter",
                           shortest);
    }

    // Preferred providers narrow the field, unless that would leave nothing
    if (!request.preferred_providers.empty()) {
        std::vector<Ranked> preferred;
        for (auto& r : available) {
            const auto& wanted = request.preferred_providers;
            if (std::find(wanted.begin(), wanted.end(), r.model.provider) != wanted.end()) {
                preferred.push_back(r);
            }
        }
        if (!preferred.empty()) available = std::move(preferred);
    }

    std::sort(available.begin(), available.end(), [](const Ranked& a, const Ranked& b) {
        if (a.cost != b.cost) return a.cost < b.cost;
        if (a.model.latency_class != b.model.latency_class) {
            return a.model.latency_class < b.model.latency_class;
        }
        if (a.model.provider != b.model.provider) return a.model.provider < b.model.provider;
        return a.model.id < b.model.id;
    });

    std::vector<ModelDescriptor> out;
    out.reserve(available.size());
    for (auto& r : available) out.push_back(std::move(r.model));
    return out;
}

ModelDescriptor Router::route(const InferenceRequest& request,
                              const AdapterSet* adapters) const {
    return rank(request, adapters).front();
}

InferenceResult Router::dispatch(const InferenceRequest& request, const AdapterSet& adapters) {
    dispatched_++;
    std::vector<ModelDescriptor> ranked;
    try {
        ranked = rank(request, &adapters);
    } catch (const GatewayError& e) {
        if (e.kind() == ErrorKind::AllProvidersUnavailable) unavailable_++;
        throw;
    }

    const uint32_t max_attempts = 1 + config_.max_failover;
    const uint32_t tokens = request.estimated_total_tokens();
    uint32_t attempts = 0;
    std::string last_error;
    Duration shortest = Duration::max();

    for (const auto& model : ranked) {
        if (attempts >= max_attempts) break;

        ProviderAdapter* adapter = adapters.find(model.provider);

        TimePoint now = clock_.now();
        if (request.expired(now)) {
            throw GatewayError(ErrorKind::RequestExpired,
                               "Request " + request.request_id + " expired during failover");
        }

        // Availability may have changed since rank()
        CallPermit permit = breaker_.acquire(model.provider);
        if (!permit) {
            shortest = std::min(shortest, breaker_.time_until_retry(model.provider));
            continue;
        }
        auto admit = limiter_.try_acquire(request.caller_id, model.provider, tokens);
        if (!admit) {
            breaker_.release(model.provider, permit);
            shortest = std::min(shortest, admit.retry_after);
            continue;
        }

        attempts++;
        attempts_++;
        if (attempts > 1) failovers_++;

        Duration timeout = timeout_for(model.latency_class);
        if (request.deadline) {
            auto left = std::chrono::duration_cast<Duration>(*request.deadline - now);
            timeout = std::max(std::min(timeout, left), Duration{1});
        }

        TimePoint started = clock_.now();
        try {
            InferenceResult result = adapter->invoke(model, request.payload, timeout,
                                                     request.max_output_tokens);
            breaker_.record_outcome(model.provider, permit, true);

            result.request_id = request.request_id;
            result.model_id = model.id;
            result.provider = model.provider;
            result.cost = model.estimate_cost(result.input_tokens, result.output_tokens);
            result.latency = std::chrono::duration_cast<Duration>(clock_.now() - started);
            result.cache_hit = false;
            result.similarity = 0.0;
            succeeded_++;
            return result;
        } catch (const ProviderError& e) {
            if (!e.transient()) {
                breaker_.release(model.provider, permit);
                permanent_errors_++;
                std::cerr << "[router] " << model.provider << "/" << model.id
                          << " permanent error: " << e.what() << "\n";
                throw GatewayError(ErrorKind::ProviderPermanentError, e.what());
            }
            breaker_.record_outcome(model.provider, permit, false);
            last_error = e.what();
        } catch (const std::exception& e) {
            // Adapter bug or unexpected response shape: the provider's fault
            breaker_.record_outcome(model.provider, permit, false);
            last_error = e.what();
        }
        std::cerr << "[router] " << model.provider << "/" << model.id
                  << " attempt " << attempts << "/" << max_attempts
                  << " failed: " << last_error << "\n";
    }

    if (attempts == 0) {
        unavailable_++;
        if (shortest == Duration::max() || shortest <= Duration{0}) shortest = kDefaultRetryHint;
        throw GatewayError(ErrorKind::AllProvidersUnavailable,
                           "No candidate could be called for request " + request.request_id,
                           shortest);
    }

    exhausted_++;
    throw GatewayError(ErrorKind::ProviderTransientError,
                       "All " + std::to_string(attempts) + " attempts failed. Last error: " +
                       last_error);
}

nlohmann::json Router::stats() const {
    return {
        {"dispatched", dispatched_.load()},
        {"attempts", attempts_.load()},
        {"failovers", failovers_.load()},
        {"succeeded", succeeded_.load()},
        {"permanent_errors", permanent_errors_.load()},
        {"exhausted", exhausted_.load()},
        {"unavailable", unavailable_.load()},
        {"max_failover", config_.max_failover}
    };
}

} // namespace modelgate
