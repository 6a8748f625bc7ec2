#pragma once
#include "circuit_breaker.hpp"
#include "provider_adapter.hpp"
#include "rate_limiter.hpp"
#include "request_queue.hpp"
#include "router.hpp"
#include "semantic_cache.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace modelgate {

struct EmbeddingSettings {
    std::string provider; // "openai", "ollama", "none"; empty = auto-detect
    std::string base_url;
    std::string model;
    std::string api_key;  // empty = the provider's key
    Duration timeout = std::chrono::seconds(10);
};

struct GatewaySettings {
    uint32_t workers = 4;
    Duration sweep_interval = std::chrono::seconds(30);
    Duration health_timeout = std::chrono::seconds(5); // per provider
};

// Everything read from config.json. Durations in the file are seconds.
struct GatewayConfig {
    std::unordered_map<std::string, ProviderSettings> providers;
    std::string catalog_path;                              // JSON catalog file
    nlohmann::json models = nlohmann::json::array();       // inline catalog
    RateLimiterConfig rate_limit;
    CircuitBreakerConfig circuit_breaker;
    SemanticCacheConfig cache;
    std::string cache_path;                                // empty = memory only
    RequestQueueConfig queue;
    RouterConfig router;
    EmbeddingSettings embeddings;
    GatewaySettings gateway;

    // Load from `path` (default ~/.modelgate/config.json) + env vars.
    // The default file is created if missing; missing keys are filled in.
    // Throws GatewayError (ConfigurationError) on unreadable or invalid JSON.
    static GatewayConfig load(const std::string& path = "");

    // Build from parsed JSON, defaults applied for missing keys. No env.
    static GatewayConfig from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    static std::string default_path();

    // Environment variables override file values
    void apply_env();

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;
};

// Recursively add keys present in `defaults` but missing from `existing`.
nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults);

} // namespace modelgate
