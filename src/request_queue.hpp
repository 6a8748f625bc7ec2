#pragma once
#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace modelgate {

enum class RejectReason { None, QueueFull, DuplicateRequest, AlreadyExpired, Closed };

inline const char* reject_reason_to_string(RejectReason r) {
    switch (r) {
        case RejectReason::None: return "none";
        case RejectReason::QueueFull: return "queue_full";
        case RejectReason::DuplicateRequest: return "duplicate_request";
        case RejectReason::AlreadyExpired: return "already_expired";
        case RejectReason::Closed: return "closed";
    }
    return "none";
}

struct EnqueueResult {
    bool accepted = false;
    RejectReason reason = RejectReason::None;
    size_t depth = 0; // queue depth after the call

    explicit operator bool() const { return accepted; }
};

struct RequestQueueConfig {
    size_t max_depth = 1000;
    std::unordered_map<std::string, uint32_t> caller_weights; // default 1
};

// Called once for every request dropped because its deadline passed.
using ExpiryHandler = std::function<void(const InferenceRequest&)>;

// Bounded priority queue with per-caller fairness.
// Higher priority tiers always go first. Inside a tier callers take turns
// (weighted round-robin); each caller's own requests leave in arrival order.
class RequestQueue {
public:
    RequestQueue(RequestQueueConfig config, const Clock& clock);

    void set_expiry_handler(ExpiryHandler handler);

    EnqueueResult enqueue(InferenceRequest request);

    // Next live request, or nullopt if none. Expired requests met on the way
    // are removed and reported.
    std::optional<InferenceRequest> dequeue();

    // Like dequeue(), but waits up to `timeout` for work. Returns nullopt on
    // timeout or once the queue is closed and empty.
    std::optional<InferenceRequest> wait_dequeue(Duration timeout);

    // Remove every expired request; each is reported to the expiry handler
    // and returned.
    std::vector<InferenceRequest> sweep_expired();

    // Reject further enqueues and wake all waiters.
    void close();
    bool closed() const;

    // Remove and return everything still queued (used at shutdown).
    std::vector<InferenceRequest> drain();

    size_t depth() const;
    nlohmann::json stats() const;

    uint32_t weight_for(const std::string& caller) const;

private:
    struct Tier {
        std::unordered_map<std::string, std::deque<InferenceRequest>> by_caller;
        std::deque<std::string> rotation; // callers with pending work, turn order
        uint32_t turns_used = 0;          // consecutive turns of rotation.front()
        size_t depth = 0;
    };

    // Caller holds mutex_
    std::optional<InferenceRequest> take_locked(std::vector<InferenceRequest>& expired);
    std::optional<InferenceRequest> pop_next(Tier& tier);
    void report_expired(const std::vector<InferenceRequest>& expired);

    RequestQueueConfig config_;
    const Clock& clock_;
    ExpiryHandler on_expired_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<int, Tier, std::greater<int>> tiers_;
    std::unordered_set<std::string> ids_;
    size_t depth_ = 0;
    bool closed_ = false;

    uint64_t accepted_ = 0;
    uint64_t dequeued_ = 0;
    uint64_t expired_ = 0;
    std::map<std::string, uint64_t> rejected_;
};

} // namespace modelgate
