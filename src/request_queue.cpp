#include "request_queue.hpp"
#include <algorithm>
#include <iostream>

namespace modelgate {

RequestQueue::RequestQueue(RequestQueueConfig config, const Clock& clock)
    : config_(std::move(config)), clock_(clock) {}

void RequestQueue::set_expiry_handler(ExpiryHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_expired_ = std::move(handler);
}

uint32_t RequestQueue::weight_for(const std::string& caller) const {
    auto it = config_.caller_weights.find(caller);
    if (it == config_.caller_weights.end() || it->second == 0) return 1;
    return it->second;
}

EnqueueResult RequestQueue::enqueue(InferenceRequest request) {
    EnqueueResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = clock_.now();

        if (closed_) {
            result.reason = RejectReason::Closed;
        } else if (ids_.count(request.request_id)) {
            result.reason = RejectReason::DuplicateRequest;
        } else if (request.expired(now)) {
            result.reason = RejectReason::AlreadyExpired;
        } else if (depth_ >= config_.max_depth) {
            result.reason = RejectReason::QueueFull;
        }

        if (result.reason != RejectReason::None) {
            rejected_[reject_reason_to_string(result.reason)]++;
            result.depth = depth_;
            std::cerr << "[queue] Rejected " << request.request_id << " from "
                      << request.caller_id << ": " << reject_reason_to_string(result.reason)
                      << " (depth " << depth_ << "/" << config_.max_depth << ")\n";
            return result;
        }

        if (request.enqueue_time == TimePoint{}) request.enqueue_time = now;

        Tier& tier = tiers_[request.priority];
        auto& pending = tier.by_caller[request.caller_id];
        if (pending.empty()) tier.rotation.push_back(request.caller_id);
        ids_.insert(request.request_id);
        pending.push_back(std::move(request));
        tier.depth++;
        depth_++;
        accepted_++;

        result.accepted = true;
        result.depth = depth_;
    }
    cv_.notify_one();
    return result;
}

std::optional<InferenceRequest> RequestQueue::pop_next(Tier& tier) {
    while (!tier.rotation.empty()) {
        std::string caller = tier.rotation.front();
        auto it = tier.by_caller.find(caller);
        if (it == tier.by_caller.end() || it->second.empty()) {
            if (it != tier.by_caller.end()) tier.by_caller.erase(it);
            tier.rotation.pop_front();
            tier.turns_used = 0;
            continue;
        }

        InferenceRequest req = std::move(it->second.front());
        it->second.pop_front();
        tier.depth--;
        tier.turns_used++;

        if (it->second.empty()) {
            tier.by_caller.erase(it);
            tier.rotation.pop_front();
            tier.turns_used = 0;
        } else if (tier.turns_used >= weight_for(caller)) {
            tier.rotation.pop_front();
            tier.rotation.push_back(caller);
            tier.turns_used = 0;
        }
        return req;
    }
    return std::nullopt;
}

std::optional<InferenceRequest> RequestQueue::take_locked(std::vector<InferenceRequest>& expired) {
    TimePoint now = clock_.now();
    while (!tiers_.empty()) {
        auto tier_it = tiers_.begin();
        auto req = pop_next(tier_it->second);
        if (tier_it->second.depth == 0) tiers_.erase(tier_it);
        if (!req) continue;

        ids_.erase(req->request_id);
        depth_--;
        if (req->expired(now)) {
            expired_++;
            expired.push_back(std::move(*req));
            continue;
        }
        dequeued_++;
        return req;
    }
    return std::nullopt;
}

void RequestQueue::report_expired(const std::vector<InferenceRequest>& expired) {
    if (expired.empty()) return;
    ExpiryHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = on_expired_;
    }
    for (const auto& req : expired) {
        std::cerr << "[queue] Dropped expired request " << req.request_id
                  << " from " << req.caller_id << "\n";
        if (handler) handler(req);
    }
}

std::optional<InferenceRequest> RequestQueue::dequeue() {
    std::vector<InferenceRequest> expired;
    std::optional<InferenceRequest> req;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        req = take_locked(expired);
    }
    report_expired(expired);
    return req;
}

std::optional<InferenceRequest> RequestQueue::wait_dequeue(Duration timeout) {
    std::vector<InferenceRequest> expired;
    std::optional<InferenceRequest> req;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto until = SteadyClock::now() + timeout;
        while (true) {
            req = take_locked(expired);
            if (req || closed_) break;
            if (cv_.wait_until(lock, until) == std::cv_status::timeout) {
                req = take_locked(expired);
                break;
            }
        }
    }
    report_expired(expired);
    return req;
}

std::vector<InferenceRequest> RequestQueue::sweep_expired() {
    std::vector<InferenceRequest> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = clock_.now();

        for (auto tier_it = tiers_.begin(); tier_it != tiers_.end(); ) {
            Tier& tier = tier_it->second;
            for (auto& [caller, pending] : tier.by_caller) {
                (void)caller;
                for (auto it = pending.begin(); it != pending.end(); ) {
                    if (it->expired(now)) {
                        ids_.erase(it->request_id);
                        expired.push_back(std::move(*it));
                        it = pending.erase(it);
                        tier.depth--;
                        depth_--;
                        expired_++;
                    } else {
                        ++it;
                    }
                }
            }

            // Drop callers left with nothing; keep the rest in turn order
            std::string front = tier.rotation.empty() ? std::string() : tier.rotation.front();
            std::deque<std::string> rotation;
            for (const auto& caller : tier.rotation) {
                auto it = tier.by_caller.find(caller);
                if (it != tier.by_caller.end() && !it->second.empty()) {
                    rotation.push_back(caller);
                } else if (it != tier.by_caller.end()) {
                    tier.by_caller.erase(it);
                }
            }
            tier.rotation = std::move(rotation);
            if (tier.rotation.empty() || tier.rotation.front() != front) tier.turns_used = 0;

            if (tier.depth == 0) {
                tier_it = tiers_.erase(tier_it);
            } else {
                ++tier_it;
            }
        }
    }
    report_expired(expired);
    return expired;
}

void RequestQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
    }
    std::cerr << "[queue] Closed\n";
    cv_.notify_all();
}

bool RequestQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::vector<InferenceRequest> RequestQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InferenceRequest> out;
    out.reserve(depth_);
    for (auto& [priority, tier] : tiers_) {
        (void)priority;
        for (const auto& caller : tier.rotation) {
            auto it = tier.by_caller.find(caller);
            if (it == tier.by_caller.end()) continue;
            for (auto& req : it->second) out.push_back(std::move(req));
        }
    }
    tiers_.clear();
    ids_.clear();
    depth_ = 0;
    return out;
}

size_t RequestQueue::depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return depth_;
}

nlohmann::json RequestQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json tiers = nlohmann::json::object();
    std::map<std::string, size_t> per_caller;
    for (const auto& [priority, tier] : tiers_) {
        tiers[std::to_string(priority)] = tier.depth;
        for (const auto& [caller, pending] : tier.by_caller) {
            per_caller[caller] += pending.size();
        }
    }

    return {
        {"depth", depth_},
        {"max_depth", config_.max_depth},
        {"closed", closed_},
        {"by_priority", tiers},
        {"by_caller", per_caller},
        {"accepted", accepted_},
        {"dequeued", dequeued_},
        {"expired", expired_},
        {"rejected", rejected_}
    };
}

} // namespace modelgate
