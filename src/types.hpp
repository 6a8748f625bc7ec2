#pragma once
#include "clock.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace modelgate {

// Lower-case capability names ("chat", "embeddings", "vision", ...).
// Ordered so the set has one canonical spelling for keys and fingerprints.
using CapabilitySet = std::set<std::string>;

// Canonical comma-joined form, e.g. "chat,vision"
std::string capability_key(const CapabilitySet& caps);

CapabilitySet make_capabilities(const std::vector<std::string>& names);

enum class LatencyClass { Fast = 0, Standard = 1, Slow = 2 };

const char* latency_class_to_string(LatencyClass lc);
// Unknown names map to Standard.
LatencyClass latency_class_from_string(const std::string& s);

struct ModelDescriptor {
    std::string id;
    std::string provider;
    std::string display_name;
    CapabilitySet capabilities;
    double cost_per_input_token = 0.0;
    double cost_per_output_token = 0.0;
    uint32_t max_context_tokens = 0;
    uint32_t max_output_tokens = 0;
    LatencyClass latency_class = LatencyClass::Standard;
    bool enabled = true;
    std::vector<std::string> regions; // where it is hosted; empty = unrestricted

    // True if every required capability is offered
    bool supports(const CapabilitySet& required) const;

    // True if the model has no region list or shares one with `allowed`.
    // An empty `allowed` accepts every model.
    bool hosted_in(const std::vector<std::string>& allowed) const;

    double estimate_cost(uint32_t input_tokens, uint32_t output_tokens) const {
        return cost_per_input_token * input_tokens + cost_per_output_token * output_tokens;
    }
};

// ── Payload ─────────────────────────────────────────────────────

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

Role role_from_string(const std::string& s);

struct ChatMessage {
    Role role;
    std::string content;
};

struct ChatPayload {
    std::string system_prompt;
    std::vector<ChatMessage> messages;
    double temperature = 0.7;
};

struct EmbeddingPayload {
    std::vector<std::string> inputs;
};

struct VisionPayload {
    std::string prompt;
    std::vector<std::string> image_urls;
};

// Anything the gateway does not understand; routed and cached by bytes only.
struct OpaquePayload {
    std::string content_type;
    std::string bytes;
};

using Payload = std::variant<ChatPayload, EmbeddingPayload, VisionPayload, OpaquePayload>;

enum class PayloadKind { Chat, Embedding, Vision, Opaque };

PayloadKind payload_kind(const Payload& payload);
const char* payload_kind_to_string(PayloadKind kind);

// Text as sent to a provider ("role: content" lines for chat).
std::string payload_text(const Payload& payload);

// Whitespace-collapsed, lower-cased text for fingerprints and embeddings.
// Opaque payloads are returned byte-for-byte.
std::string normalized_payload_text(const Payload& payload);

// Rough input token count; images count a flat 85 tokens each.
uint32_t payload_tokens(const Payload& payload);

// ── Request / result ────────────────────────────────────────────

struct InferenceRequest {
    std::string request_id;     // caller-supplied idempotency key
    std::string caller_id;
    CapabilitySet required_capabilities;
    Payload payload;
    int priority = 0;           // higher = more urgent
    std::optional<double> max_cost;
    std::optional<Duration> max_latency;
    uint32_t max_output_tokens = 1024;
    std::optional<TimePoint> deadline;
    TimePoint enqueue_time{};
    std::string volatility = "standard"; // cache TTL class
    bool enable_cache = true;
    std::vector<std::string> allowed_regions;     // data residency; empty = any
    std::vector<std::string> preferred_providers; // soft: ignored if none can serve

    uint32_t estimated_input_tokens() const { return payload_tokens(payload); }

    // Input estimate plus the output allowance; what the rate limiter charges.
    uint32_t estimated_total_tokens() const {
        return estimated_input_tokens() + max_output_tokens;
    }

    bool expired(TimePoint now) const { return deadline && now >= *deadline; }
};

struct InferenceResult {
    std::string request_id;
    std::string model_id;
    std::string provider;
    std::string output;
    uint32_t input_tokens = 0;
    uint32_t output_tokens = 0;
    double cost = 0.0;
    Duration latency{0};
    bool cache_hit = false;
    double similarity = 0.0;

    uint32_t tokens_consumed() const { return input_tokens + output_tokens; }
};

nlohmann::json result_to_json(const InferenceResult& result);
InferenceResult result_from_json(const nlohmann::json& j);

} // namespace modelgate
