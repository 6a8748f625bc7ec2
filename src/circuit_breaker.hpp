#pragma once
#include "clock.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace modelgate {

enum class CircuitState { Closed, Open, HalfOpen, Recovering };

inline const char* circuit_state_to_string(CircuitState s) {
    switch (s) {
        case CircuitState::Closed: return "CLOSED";
        case CircuitState::Open: return "OPEN";
        case CircuitState::HalfOpen: return "HALF_OPEN";
        case CircuitState::Recovering: return "RECOVERING";
    }
    return "CLOSED";
}

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;
    Duration failure_window = std::chrono::seconds(60);
    Duration cooldown = std::chrono::seconds(30);
    double backoff_multiplier = 2.0;
    Duration max_cooldown = std::chrono::seconds(300);
    Duration recovery_window = std::chrono::seconds(60);
    uint32_t recovery_min_successes = 3;
    double recovery_failure_rate = 0.1;
};

struct ProviderState {
    CircuitState circuit_state = CircuitState::Closed;
    uint32_t consecutive_failures = 0;
    uint32_t consecutive_successes = 0;
    TimePoint last_transition{};
    TimePoint next_trial_eligible{};
    Duration current_cooldown{0};
    uint64_t total_successes = 0;
    uint64_t total_failures = 0;
    uint64_t rejected_calls = 0;
    bool trial_in_flight = false;
    uint64_t generation = 0; // bumped on every trip and reset
    std::deque<TimePoint> recent_failures; // within failure_window, CLOSED only
    uint32_t recovery_successes = 0;
    uint32_t recovery_failures = 0;
};

// Returned by CircuitBreaker::acquire. The generation ties an outcome to
// the circuit period the call was admitted in; outcomes from an older
// period are counted but never move the state machine.
struct CallPermit {
    bool granted = false;
    bool trial = false;
    uint64_t generation = 0;

    explicit operator bool() const { return granted; }
};

// Per-provider failure isolation. Records outcomes and answers whether a
// provider may be called; it never retries anything itself.
//
//   CLOSED --(threshold failures)--> OPEN --(cooldown)--> HALF_OPEN
//   HALF_OPEN --(trial ok)--> RECOVERING --(window clean)--> CLOSED
//   HALF_OPEN/RECOVERING --(failure)--> OPEN (cooldown backs off)
class CircuitBreaker {
public:
    CircuitBreaker(CircuitBreakerConfig config, const Clock& clock);

    // Outcome of a call made under `permit`. Only the trial permit can
    // decide a HALF_OPEN transition.
    void record_outcome(const std::string& provider, const CallPermit& permit, bool success);

    // Outcome of an untracked, non-trial call in the current period.
    void record_outcome(const std::string& provider, bool success);

    // Would a call be permitted right now? Does not reserve the trial.
    bool is_available(const std::string& provider) const;

    // Permission to call. In HALF_OPEN this claims the single trial slot;
    // a granted permit must come back through record_outcome or release.
    CallPermit acquire(const std::string& provider);

    // Give back a claimed trial without recording an outcome.
    void release(const std::string& provider, const CallPermit& permit);

    // Zero unless OPEN
    Duration time_until_retry(const std::string& provider) const;

    CircuitState state(const std::string& provider) const;
    ProviderState provider_state(const std::string& provider) const;

    void reset(const std::string& provider);

    nlohmann::json snapshot() const;

    const CircuitBreakerConfig& config() const { return config_; }

private:
    struct Entry {
        std::mutex mutex;
        ProviderState state;
    };

    Entry& entry_for(const std::string& provider) const;

    void record(const std::string& provider, const CallPermit* permit, bool success);

    // Apply time-driven transitions (OPEN -> HALF_OPEN, RECOVERING -> CLOSED).
    // Caller holds the entry mutex.
    void advance(const std::string& provider, ProviderState& s, TimePoint now) const;
    void transition(const std::string& provider, ProviderState& s, CircuitState to,
                    TimePoint now, const std::string& reason) const;
    void trip(const std::string& provider, ProviderState& s, TimePoint now, bool backoff,
              const std::string& reason) const;
    bool recovery_complete(const ProviderState& s, TimePoint now) const;

    CircuitBreakerConfig config_;
    const Clock& clock_;
    mutable std::shared_mutex map_mutex_;
    mutable std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace modelgate
