#include "commands.hpp"
#include "errors.hpp"
#include "gateway.hpp"
#include "util.hpp"
#include <cstdio>

namespace modelgate {

std::string cmd_stats(const Gateway& gateway) {
    return gateway.stats().dump(2);
}

std::string cmd_models(const Gateway& gateway) {
    const auto& registry = gateway.registry();
    auto models = registry.list_all();
    if (models.empty()) return "No models in catalog.";

    std::string result = "Catalog v" + std::to_string(registry.version()) + ":\n";
    for (const auto& m : models) {
        char cost[64];
        std::snprintf(cost, sizeof(cost), "%.2g/%.2g", m.cost_per_input_token,
                      m.cost_per_output_token);
        result += "  " + m.provider + "/" + m.id;
        result += " [" + capability_key(m.capabilities) + "]";
        result += " " + std::string(latency_class_to_string(m.latency_class));
        result += " ctx=" + std::to_string(m.max_context_tokens);
        result += " cost=" + std::string(cost);
        result += " circuit=" + std::string(circuit_state_to_string(
            gateway.breaker().state(m.provider)));
        if (!m.regions.empty()) {
            result += " regions=";
            for (size_t i = 0; i < m.regions.size(); ++i) {
                if (i > 0) result += ",";
                result += m.regions[i];
            }
        }
        if (!m.enabled) result += " (disabled)";
        result += "\n";
    }
    return result;
}

std::string cmd_help() {
    return "Commands:\n"
           "  /stats            Show gateway statistics (JSON)\n"
           "  /models           List catalog models\n"
           "  /health           Check every provider\n"
           "  /clear-cache      Drop all cached responses\n"
           "  /reload           Re-read the model catalog\n"
           "  /reset PROVIDER   Force a provider's circuit closed\n"
           "  /help             Show this help\n"
           "  /quit             Exit\n";
}

std::string cmd_health(Gateway& gateway) {
    auto health = gateway.health_check();
    std::string result = "Gateway " + health["status"].get<std::string>() + ":\n";
    if (health["providers"].empty()) return result + "  No providers configured.";

    for (auto& [name, p] : health["providers"].items()) {
        result += "  " + name + ": " + p["status"].get<std::string>();
        result += ", circuit " + p["circuit"].get<std::string>();
        std::string detail = p["detail"].get<std::string>();
        if (!detail.empty()) result += " (" + detail + ")";
        result += "\n";
    }
    return result;
}

std::string cmd_clear_cache(Gateway& gateway) {
    gateway.clear_cache();
    return "Cache cleared.";
}

std::string cmd_reload(Gateway& gateway) {
    try {
        gateway.reload_registry();
    } catch (const GatewayError& e) {
        return "Reload failed (" + std::to_string(e.code()) + "): " + e.what();
    }
    return "Catalog reloaded: version " + std::to_string(gateway.registry().version()) +
           ", " + std::to_string(gateway.registry().size()) + " models.";
}

std::string cmd_reset(const std::string& args, Gateway& gateway) {
    std::string provider = trim(args);
    if (provider.empty()) return "Usage: /reset PROVIDER";
    gateway.reset_provider(provider);
    return "Circuit for " + provider + " reset to CLOSED.";
}

std::string run_command(const std::string& line, Gateway& gateway, bool& quit) {
    std::string cmd = line;
    std::string args;
    auto space = line.find(' ');
    if (space != std::string::npos) {
        cmd = line.substr(0, space);
        args = line.substr(space + 1);
    }

    if (cmd == "/quit" || cmd == "/exit") {
        quit = true;
        return {};
    }
    if (cmd == "/stats") return cmd_stats(gateway);
    if (cmd == "/models") return cmd_models(gateway);
    if (cmd == "/health") return cmd_health(gateway);
    if (cmd == "/clear-cache") return cmd_clear_cache(gateway);
    if (cmd == "/reload") return cmd_reload(gateway);
    if (cmd == "/reset") return cmd_reset(args, gateway);
    if (cmd == "/help") return cmd_help();
    return "Unknown command: " + cmd;
}

std::string format_result(const InferenceResult& result) {
    char cost[32];
    std::snprintf(cost, sizeof(cost), "%.6f", result.cost);
    std::string header = "[" + result.provider + "/" + result.model_id;
    if (result.cache_hit) {
        char sim[16];
        std::snprintf(sim, sizeof(sim), "%.3f", result.similarity);
        header += " cached, similarity " + std::string(sim);
    } else {
        header += " " + std::to_string(result.latency.count()) + "ms";
    }
    header += ", " + std::to_string(result.input_tokens) + "+" +
              std::to_string(result.output_tokens) + " tokens, $" + cost + "]";
    return header + "\n" + result.output;
}

} // namespace modelgate
