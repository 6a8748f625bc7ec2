#include "types.hpp"
#include "util.hpp"
#include <algorithm>

namespace modelgate {

namespace {

// Flat per-image charge (low-detail image tiles)
constexpr uint32_t kTokensPerImage = 85;

// Overload set for std::visit
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string capability_key(const CapabilitySet& caps) {
    std::string key;
    for (const auto& c : caps) {
        if (!key.empty()) key += ',';
        key += c;
    }
    return key;
}

CapabilitySet make_capabilities(const std::vector<std::string>& names) {
    CapabilitySet caps;
    for (const auto& n : names) {
        std::string c = to_lower(trim(n));
        if (!c.empty()) caps.insert(std::move(c));
    }
    return caps;
}

const char* latency_class_to_string(LatencyClass lc) {
    switch (lc) {
        case LatencyClass::Fast: return "fast";
        case LatencyClass::Standard: return "standard";
        case LatencyClass::Slow: return "slow";
    }
    return "standard";
}

LatencyClass latency_class_from_string(const std::string& s) {
    std::string v = to_lower(s);
    if (v == "fast") return LatencyClass::Fast;
    if (v == "slow") return LatencyClass::Slow;
    return LatencyClass::Standard;
}

bool ModelDescriptor::supports(const CapabilitySet& required) const {
    for (const auto& c : required) {
        if (capabilities.count(c) == 0) return false;
    }
    return true;
}

bool ModelDescriptor::hosted_in(const std::vector<std::string>& allowed) const {
    if (allowed.empty() || regions.empty()) return true;
    for (const auto& r : allowed) {
        if (std::find(regions.begin(), regions.end(), r) != regions.end()) return true;
    }
    return false;
}

Role role_from_string(const std::string& s) {
    if (s == "system") return Role::System;
    if (s == "assistant") return Role::Assistant;
    if (s == "tool") return Role::Tool;
    return Role::User;
}

PayloadKind payload_kind(const Payload& payload) {
    return std::visit(overloaded{
        [](const ChatPayload&) { return PayloadKind::Chat; },
        [](const EmbeddingPayload&) { return PayloadKind::Embedding; },
        [](const VisionPayload&) { return PayloadKind::Vision; },
        [](const OpaquePayload&) { return PayloadKind::Opaque; },
    }, payload);
}

const char* payload_kind_to_string(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::Chat: return "chat";
        case PayloadKind::Embedding: return "embedding";
        case PayloadKind::Vision: return "vision";
        case PayloadKind::Opaque: return "opaque";
    }
    return "opaque";
}

std::string payload_text(const Payload& payload) {
    return std::visit(overloaded{
        [](const ChatPayload& p) {
            std::string out;
            if (!p.system_prompt.empty()) out += "system: " + p.system_prompt + "\n";
            for (const auto& m : p.messages) {
                out += role_to_string(m.role);
                out += ": " + m.content + "\n";
            }
            return out;
        },
        [](const EmbeddingPayload& p) {
            std::string out;
            for (const auto& in : p.inputs) out += in + "\n";
            return out;
        },
        [](const VisionPayload& p) {
            std::string out = p.prompt + "\n";
            for (const auto& url : p.image_urls) out += "image: " + url + "\n";
            return out;
        },
        [](const OpaquePayload& p) { return p.bytes; },
    }, payload);
}

std::string normalized_payload_text(const Payload& payload) {
    if (auto* opaque = std::get_if<OpaquePayload>(&payload)) return opaque->bytes;
    return normalize_text(payload_text(payload));
}

uint32_t payload_tokens(const Payload& payload) {
    uint32_t tokens = estimate_tokens(payload_text(payload));
    if (auto* vision = std::get_if<VisionPayload>(&payload)) {
        tokens += kTokensPerImage * static_cast<uint32_t>(vision->image_urls.size());
    }
    return tokens;
}

nlohmann::json result_to_json(const InferenceResult& result) {
    return {
        {"request_id", result.request_id},
        {"model_id", result.model_id},
        {"provider", result.provider},
        {"output", result.output},
        {"input_tokens", result.input_tokens},
        {"output_tokens", result.output_tokens},
        {"cost", result.cost},
        {"latency_ms", result.latency.count()},
        {"cache_hit", result.cache_hit},
        {"similarity", result.similarity}
    };
}

InferenceResult result_from_json(const nlohmann::json& j) {
    InferenceResult r;
    r.request_id = j.value("request_id", "");
    r.model_id = j.value("model_id", "");
    r.provider = j.value("provider", "");
    r.output = j.value("output", "");
    r.input_tokens = j.value("input_tokens", 0u);
    r.output_tokens = j.value("output_tokens", 0u);
    r.cost = j.value("cost", 0.0);
    r.latency = Duration(j.value("latency_ms", int64_t{0}));
    r.cache_hit = j.value("cache_hit", false);
    r.similarity = j.value("similarity", 0.0);
    return r;
}

} // namespace modelgate
