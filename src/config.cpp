#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace modelgate {

nlohmann::json GatewayConfig::defaults_json() {
    return {
        {"providers", {
            {"openai", {{"type", "openai"}, {"api_key", ""}, {"base_url", ""}}},
            {"anthropic", {{"type", "anthropic"}, {"api_key", ""}, {"base_url", ""}}},
            {"ollama", {{"type", "ollama"}, {"base_url", "http://localhost:11434"}}}
        }},
        {"catalog", {{"path", ""}}},
        {"models", nlohmann::json::array()},
        {"rate_limit", {
            {"capacity", 100000},
            {"refill_per_second", 2000},
            {"requests_per_minute", 0},
            {"idle_timeout", 600},
            {"providers", nlohmann::json::object()}
        }},
        {"circuit_breaker", {
            {"failure_threshold", 5},
            {"failure_window", 60},
            {"cooldown", 30},
            {"backoff_multiplier", 2.0},
            {"max_cooldown", 300},
            {"recovery_window", 60},
            {"recovery_min_successes", 3},
            {"recovery_failure_rate", 0.1}
        }},
        {"cache", {
            {"enabled", true},
            {"similarity_threshold", 0.85},
            {"thresholds", nlohmann::json::object()},
            {"default_ttl", 3600},
            {"ttl_by_volatility", {
                {"static", 86400},
                {"standard", 3600},
                {"volatile", 300}
            }},
            {"max_entries", 10000},
            {"path", ""}
        }},
        {"queue", {
            {"max_depth", 1000},
            {"caller_weights", nlohmann::json::object()}
        }},
        {"router", {
            {"max_failover", 2},
            {"latency_budgets", {{"fast", 2}, {"standard", 10}, {"slow", 30}}},
            {"timeouts", {{"fast", 15}, {"standard", 60}, {"slow", 180}}}
        }},
        {"embeddings", {
            {"provider", ""},
            {"base_url", ""},
            {"model", ""},
            {"api_key", ""},
            {"timeout", 10}
        }},
        {"gateway", {
            {"workers", 4},
            {"sweep_interval", 30},
            {"health_timeout", 5}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string GatewayConfig::default_path() {
    return expand_home("~/.modelgate/config.json");
}

// ── Field readers ───────────────────────────────────────────────
// Each leaves `out` untouched when the key is absent or has the wrong type.

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

static void read_bool(const nlohmann::json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean()) out = obj[key].get<bool>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number()) out = obj[key].get<double>();
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned()) out = obj[key].get<uint32_t>();
}

static void read_size(const nlohmann::json& obj, const char* key, size_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned()) out = obj[key].get<size_t>();
}

static void read_seconds(const nlohmann::json& obj, const char* key, Duration& out) {
    if (obj.contains(key) && obj[key].is_number()) {
        double secs = obj[key].get<double>();
        if (secs < 0) {
            throw GatewayError(ErrorKind::ConfigurationError,
                               std::string("Negative duration for \"") + key + "\"");
        }
        out = seconds_to_duration(secs);
    }
}

static void read_latency_map(const nlohmann::json& obj, const char* key,
                             std::map<LatencyClass, Duration>& out) {
    if (!obj.contains(key) || !obj[key].is_object()) return;
    for (auto& [name, value] : obj[key].items()) {
        if (!value.is_number()) continue;
        out[latency_class_from_string(name)] = seconds_to_duration(value.get<double>());
    }
}

static void require(bool ok, const std::string& message) {
    if (!ok) throw GatewayError(ErrorKind::ConfigurationError, message);
}

GatewayConfig GatewayConfig::from_json(const nlohmann::json& input) {
    require(input.is_object(), "Config root must be a JSON object");
    nlohmann::json j = merge_defaults(input, defaults_json());
    GatewayConfig cfg;

    if (j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderSettings entry;
            read_string(obj, "type", entry.type);
            read_string(obj, "api_key", entry.api_key);
            read_string(obj, "base_url", entry.base_url);
            if (entry.type.empty()) entry.type = name;
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j["catalog"].is_object()) read_string(j["catalog"], "path", cfg.catalog_path);
    if (j["models"].is_array()) cfg.models = j["models"];

    if (j["rate_limit"].is_object()) {
        auto& r = j["rate_limit"];
        read_double(r, "capacity", cfg.rate_limit.defaults.capacity);
        read_double(r, "refill_per_second", cfg.rate_limit.defaults.refill_per_second);
        read_double(r, "requests_per_minute", cfg.rate_limit.defaults.requests_per_minute);
        read_seconds(r, "idle_timeout", cfg.rate_limit.idle_timeout);
        if (r.contains("providers") && r["providers"].is_object()) {
            for (auto& [name, obj] : r["providers"].items()) {
                if (!obj.is_object()) continue;
                BucketSettings s = cfg.rate_limit.defaults;
                read_double(obj, "capacity", s.capacity);
                read_double(obj, "refill_per_second", s.refill_per_second);
                read_double(obj, "requests_per_minute", s.requests_per_minute);
                cfg.rate_limit.per_provider[name] = s;
            }
        }
        require(cfg.rate_limit.defaults.capacity > 0, "rate_limit.capacity must be positive");
        require(cfg.rate_limit.defaults.refill_per_second >= 0,
                "rate_limit.refill_per_second must not be negative");
        require(cfg.rate_limit.defaults.requests_per_minute >= 0,
                "rate_limit.requests_per_minute must not be negative");
    }

    if (j["circuit_breaker"].is_object()) {
        auto& c = j["circuit_breaker"];
        auto& cb = cfg.circuit_breaker;
        read_u32(c, "failure_threshold", cb.failure_threshold);
        read_seconds(c, "failure_window", cb.failure_window);
        read_seconds(c, "cooldown", cb.cooldown);
        read_double(c, "backoff_multiplier", cb.backoff_multiplier);
        read_seconds(c, "max_cooldown", cb.max_cooldown);
        read_seconds(c, "recovery_window", cb.recovery_window);
        read_u32(c, "recovery_min_successes", cb.recovery_min_successes);
        read_double(c, "recovery_failure_rate", cb.recovery_failure_rate);
        require(cb.failure_threshold > 0, "circuit_breaker.failure_threshold must be positive");
        require(cb.backoff_multiplier >= 1.0, "circuit_breaker.backoff_multiplier must be >= 1");
    }

    if (j["cache"].is_object()) {
        auto& c = j["cache"];
        read_bool(c, "enabled", cfg.cache.enabled);
        read_double(c, "similarity_threshold", cfg.cache.similarity_threshold);
        if (c.contains("thresholds") && c["thresholds"].is_object()) {
            for (auto& [kind, value] : c["thresholds"].items()) {
                if (!value.is_number()) continue;
                double t = value.get<double>();
                require(t >= 0.0 && t <= 1.0, "cache.thresholds." + kind + " must be in [0, 1]");
                cfg.cache.thresholds[kind] = t;
            }
        }
        read_seconds(c, "default_ttl", cfg.cache.default_ttl);
        if (c.contains("ttl_by_volatility") && c["ttl_by_volatility"].is_object()) {
            for (auto& [name, value] : c["ttl_by_volatility"].items()) {
                if (value.is_number()) {
                    cfg.cache.ttl_by_volatility[name] = seconds_to_duration(value.get<double>());
                }
            }
        }
        read_size(c, "max_entries", cfg.cache.max_entries);
        read_string(c, "path", cfg.cache_path);
        require(cfg.cache.similarity_threshold >= 0.0 && cfg.cache.similarity_threshold <= 1.0,
                "cache.similarity_threshold must be in [0, 1]");
        require(cfg.cache.max_entries > 0, "cache.max_entries must be positive");
    }

    if (j["queue"].is_object()) {
        auto& q = j["queue"];
        read_size(q, "max_depth", cfg.queue.max_depth);
        if (q.contains("caller_weights") && q["caller_weights"].is_object()) {
            for (auto& [caller, value] : q["caller_weights"].items()) {
                if (value.is_number_unsigned() && value.get<uint32_t>() > 0) {
                    cfg.queue.caller_weights[caller] = value.get<uint32_t>();
                }
            }
        }
        require(cfg.queue.max_depth > 0, "queue.max_depth must be positive");
    }

    if (j["router"].is_object()) {
        auto& r = j["router"];
        read_u32(r, "max_failover", cfg.router.max_failover);
        read_latency_map(r, "latency_budgets", cfg.router.latency_budgets);
        read_latency_map(r, "timeouts", cfg.router.timeouts);
    }

    if (j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        read_string(e, "provider", cfg.embeddings.provider);
        read_string(e, "base_url", cfg.embeddings.base_url);
        read_string(e, "model", cfg.embeddings.model);
        read_string(e, "api_key", cfg.embeddings.api_key);
        read_seconds(e, "timeout", cfg.embeddings.timeout);
    }

    if (j["gateway"].is_object()) {
        auto& g = j["gateway"];
        read_u32(g, "workers", cfg.gateway.workers);
        read_seconds(g, "sweep_interval", cfg.gateway.sweep_interval);
        read_seconds(g, "health_timeout", cfg.gateway.health_timeout);
        require(cfg.gateway.workers > 0, "gateway.workers must be positive");
        require(cfg.gateway.sweep_interval > Duration{0}, "gateway.sweep_interval must be positive");
        require(cfg.gateway.health_timeout > Duration{0}, "gateway.health_timeout must be positive");
    }

    return cfg;
}

GatewayConfig GatewayConfig::load(const std::string& path) {
    bool default_location = path.empty();
    std::string config_path = default_location ? default_path() : expand_home(path);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        nlohmann::json original;
        try {
            original = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            throw GatewayError(ErrorKind::ConfigurationError,
                               "Config " + config_path + " is not valid JSON: " + e.what());
        }
        file.close();
        j = merge_defaults(original, defaults_json());
        if (default_location && j != original) {
            atomic_write_file(config_path, j.dump(4) + "\n");
            std::cerr << "[config] Migrated config with new defaults: "
                      << config_path << "\n";
        }
    } else if (default_location) {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    } else {
        throw GatewayError(ErrorKind::ConfigurationError, "Cannot open config: " + config_path);
    }

    GatewayConfig cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void GatewayConfig::apply_env() {
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        providers["openai"].api_key = v;
    if (const char* v = std::getenv("ANTHROPIC_API_KEY"))
        providers["anthropic"].api_key = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        providers["ollama"].base_url = v;
    if (const char* v = std::getenv("MODELGATE_CATALOG"))
        catalog_path = v;
    if (const char* v = std::getenv("MODELGATE_WORKERS")) {
        long n = std::strtol(v, nullptr, 10);
        if (n > 0) {
            gateway.workers = static_cast<uint32_t>(n);
        } else {
            std::cerr << "[config] Ignoring invalid MODELGATE_WORKERS=" << v << "\n";
        }
    }

    // Entries created above by env alone need a type
    for (auto& [name, entry] : providers) {
        if (entry.type.empty()) entry.type = name;
    }
}

std::string GatewayConfig::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string GatewayConfig::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

} // namespace modelgate
