#include "circuit_breaker.hpp"
#include <algorithm>
#include <iostream>
#include <vector>

namespace modelgate {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, const Clock& clock)
    : config_(std::move(config)), clock_(clock) {
    if (config_.failure_threshold == 0) config_.failure_threshold = 1;
    if (config_.backoff_multiplier < 1.0) config_.backoff_multiplier = 1.0;
    if (config_.max_cooldown < config_.cooldown) config_.max_cooldown = config_.cooldown;
}

CircuitBreaker::Entry& CircuitBreaker::entry_for(const std::string& provider) const {
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = entries_.find(provider);
        if (it != entries_.end()) return *it->second;
    }
    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    auto it = entries_.find(provider);
    if (it != entries_.end()) return *it->second;

    auto entry = std::make_unique<Entry>();
    entry->state.current_cooldown = config_.cooldown;
    entry->state.last_transition = clock_.now();
    auto& ref = *entry;
    entries_.emplace(provider, std::move(entry));
    return ref;
}

void CircuitBreaker::transition(const std::string& provider, ProviderState& s, CircuitState to,
                                TimePoint now, const std::string& reason) const {
    std::cerr << "[breaker] provider " << provider << ": "
              << circuit_state_to_string(s.circuit_state) << " -> "
              << circuit_state_to_string(to);
    if (!reason.empty()) std::cerr << " (" << reason << ")";
    std::cerr << "\n";

    s.circuit_state = to;
    s.last_transition = now;
    s.trial_in_flight = false;
    s.consecutive_successes = 0;
    s.consecutive_failures = 0;
    s.recovery_successes = 0;
    s.recovery_failures = 0;
    s.recent_failures.clear();
}

void CircuitBreaker::trip(const std::string& provider, ProviderState& s, TimePoint now,
                          bool backoff, const std::string& reason) const {
    if (backoff) {
        auto next = std::chrono::duration_cast<Duration>(
            s.current_cooldown * config_.backoff_multiplier);
        s.current_cooldown = std::min(next, config_.max_cooldown);
    }
    transition(provider, s, CircuitState::Open, now, reason);
    s.generation++;
    s.next_trial_eligible = now + s.current_cooldown;
}

bool CircuitBreaker::recovery_complete(const ProviderState& s, TimePoint now) const {
    if (now - s.last_transition < config_.recovery_window) return false;
    if (s.recovery_successes < config_.recovery_min_successes) return false;
    double total = static_cast<double>(s.recovery_successes + s.recovery_failures);
    double rate = total > 0.0 ? s.recovery_failures / total : 0.0;
    return rate < config_.recovery_failure_rate;
}

void CircuitBreaker::advance(const std::string& provider, ProviderState& s, TimePoint now) const {
    if (s.circuit_state == CircuitState::Open && now >= s.next_trial_eligible) {
        transition(provider, s, CircuitState::HalfOpen, now, "cooldown elapsed");
    } else if (s.circuit_state == CircuitState::Recovering && recovery_complete(s, now)) {
        uint32_t ok = s.recovery_successes;
        transition(provider, s, CircuitState::Closed, now,
                   std::to_string(ok) + " successes while recovering");
        s.current_cooldown = config_.cooldown;
    }
}

void CircuitBreaker::record_outcome(const std::string& provider, const CallPermit& permit,
                                    bool success) {
    record(provider, &permit, success);
}

void CircuitBreaker::record_outcome(const std::string& provider, bool success) {
    record(provider, nullptr, success);
}

void CircuitBreaker::record(const std::string& provider, const CallPermit* permit,
                            bool success) {
    auto& entry = entry_for(provider);
    TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(entry.mutex);
    auto& s = entry.state;
    advance(provider, s, now);

    if (permit && permit->generation != s.generation) {
        // Admitted before the last trip or reset
        if (success) s.total_successes++;
        else s.total_failures++;
        return;
    }
    bool is_trial = permit && permit->trial;

    if (success) {
        s.total_successes++;
        s.consecutive_successes++;
        s.consecutive_failures = 0;
    } else {
        s.total_failures++;
        s.consecutive_failures++;
        s.consecutive_successes = 0;
    }

    switch (s.circuit_state) {
        case CircuitState::Closed: {
            if (success) break;
            s.recent_failures.push_back(now);
            while (!s.recent_failures.empty() &&
                   now - s.recent_failures.front() > config_.failure_window) {
                s.recent_failures.pop_front();
            }
            uint32_t in_window = static_cast<uint32_t>(s.recent_failures.size());
            if (in_window >= config_.failure_threshold ||
                s.consecutive_failures >= config_.failure_threshold) {
                trip(provider, s, now, false,
                     std::to_string(std::max(in_window, s.consecutive_failures)) + " failures");
            }
            break;
        }
        case CircuitState::Open:
            // Late outcome from a call admitted before the trip
            break;
        case CircuitState::HalfOpen:
            if (!is_trial) break;
            if (success) {
                transition(provider, s, CircuitState::Recovering, now, "trial succeeded");
            } else {
                trip(provider, s, now, true, "trial failed");
            }
            break;
        case CircuitState::Recovering:
            if (success) {
                s.recovery_successes++;
                advance(provider, s, now);
            } else {
                s.recovery_failures++;
                trip(provider, s, now, true, "failure while recovering");
            }
            break;
    }
}

bool CircuitBreaker::is_available(const std::string& provider) const {
    auto& entry = entry_for(provider);
    TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(entry.mutex);
    auto& s = entry.state;
    advance(provider, s, now);

    switch (s.circuit_state) {
        case CircuitState::Closed:
        case CircuitState::Recovering:
            return true;
        case CircuitState::HalfOpen:
            return !s.trial_in_flight;
        case CircuitState::Open:
            return false;
    }
    return false;
}

CallPermit CircuitBreaker::acquire(const std::string& provider) {
    auto& entry = entry_for(provider);
    TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(entry.mutex);
    auto& s = entry.state;
    advance(provider, s, now);

    CallPermit permit;
    permit.generation = s.generation;
    switch (s.circuit_state) {
        case CircuitState::Closed:
        case CircuitState::Recovering:
            permit.granted = true;
            break;
        case CircuitState::HalfOpen:
            if (!s.trial_in_flight) {
                s.trial_in_flight = true;
                permit.granted = true;
                permit.trial = true;
            } else {
                s.rejected_calls++;
            }
            break;
        case CircuitState::Open:
            s.rejected_calls++;
            break;
    }
    return permit;
}

void CircuitBreaker::release(const std::string& provider, const CallPermit& permit) {
    if (!permit.trial) return;
    auto& entry = entry_for(provider);
    std::lock_guard<std::mutex> lock(entry.mutex);
    auto& s = entry.state;
    if (s.circuit_state == CircuitState::HalfOpen && s.generation == permit.generation) {
        s.trial_in_flight = false;
    }
}

Duration CircuitBreaker::time_until_retry(const std::string& provider) const {
    auto& entry = entry_for(provider);
    TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(entry.mutex);
    auto& s = entry.state;
    advance(provider, s, now);

    if (s.circuit_state != CircuitState::Open) return Duration{0};
    return std::chrono::duration_cast<Duration>(s.next_trial_eligible - now);
}

CircuitState CircuitBreaker::state(const std::string& provider) const {
    auto& entry = entry_for(provider);
    TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(entry.mutex);
    advance(provider, entry.state, now);
    return entry.state.circuit_state;
}

ProviderState CircuitBreaker::provider_state(const std::string& provider) const {
    auto& entry = entry_for(provider);
    TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(entry.mutex);
    advance(provider, entry.state, now);
    return entry.state;
}

void CircuitBreaker::reset(const std::string& provider) {
    auto& entry = entry_for(provider);
    TimePoint now = clock_.now();
    std::lock_guard<std::mutex> lock(entry.mutex);
    auto& s = entry.state;
    if (s.circuit_state != CircuitState::Closed) {
        transition(provider, s, CircuitState::Closed, now, "manual reset");
    }
    s.generation++;
    s.recent_failures.clear();
    s.consecutive_failures = 0;
    s.current_cooldown = config_.cooldown;
}

nlohmann::json CircuitBreaker::snapshot() const {
    std::vector<std::string> names;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        names.reserve(entries_.size());
        for (const auto& [name, entry] : entries_) {
            (void)entry;
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());

    nlohmann::json out = nlohmann::json::object();
    for (const auto& name : names) {
        ProviderState s = provider_state(name);
        Duration retry = time_until_retry(name);
        out[name] = {
            {"state", circuit_state_to_string(s.circuit_state)},
            {"consecutive_failures", s.consecutive_failures},
            {"consecutive_successes", s.consecutive_successes},
            {"total_successes", s.total_successes},
            {"total_failures", s.total_failures},
            {"rejected_calls", s.rejected_calls},
            {"cooldown_seconds", duration_to_seconds(s.current_cooldown)},
            {"retry_in_seconds", duration_to_seconds(retry)}
        };
    }
    return out;
}

} // namespace modelgate
