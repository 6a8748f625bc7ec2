#pragma once
#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

class HttpClient;   // forward declaration
struct HttpResponse;

enum class HealthStatus { Healthy, Degraded, Unavailable };

inline const char* health_status_to_string(HealthStatus s) {
    switch (s) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Unavailable: return "unavailable";
    }
    return "unavailable";
}

// Result of one reachability check against a provider
struct ProviderHealth {
    HealthStatus status = HealthStatus::Unavailable;
    long http_status = 0;
    std::string detail;

    bool healthy() const { return status == HealthStatus::Healthy; }
};

// Uniform inference contract over one provider's API.
class ProviderAdapter {
public:
    virtual ~ProviderAdapter() = default;

    // Run one inference. Fills model_id, provider, output and token counts
    // of the result; the router adds cost and latency.
    // Throws ProviderError (transient or permanent) on failure.
    virtual InferenceResult invoke(const ModelDescriptor& model,
                                   const Payload& payload,
                                   Duration timeout,
                                   uint32_t max_output_tokens) = 0;

    // Cheap authenticated call that lists models. Provider faults are
    // reported in the result, never thrown.
    virtual ProviderHealth health_check(Duration timeout) = 0;

    virtual bool supports(PayloadKind kind) const = 0;
    virtual std::string provider_name() const = 0;
};

// Adapters by provider name. Not thread-safe to mutate; built once at
// startup and read concurrently afterwards.
class AdapterSet {
public:
    void add(std::shared_ptr<ProviderAdapter> adapter);
    ProviderAdapter* find(const std::string& provider) const;
    std::vector<std::string> names() const;
    size_t size() const { return adapters_.size(); }
    bool empty() const { return adapters_.empty(); }

private:
    std::unordered_map<std::string, std::shared_ptr<ProviderAdapter>> adapters_;
};

// One entry of the "providers" config section
struct ProviderSettings {
    std::string type;     // "openai", "anthropic", "ollama"; empty = same as name
    std::string api_key;
    std::string base_url; // empty = the type's default endpoint
};

// Build an adapter named `name` from its settings. Throws GatewayError
// (ConfigurationError) for an unknown type.
std::unique_ptr<ProviderAdapter> create_adapter(const std::string& name,
                                                const ProviderSettings& settings,
                                                HttpClient& http);

// ── Helpers shared by the HTTP adapters ─────────────────────────

// Throw ProviderError for a non-2xx (or missing) response.
void raise_for_status(const std::string& provider, const HttpResponse& response);

// Parse a 2xx body. A body that is not JSON is a transient provider fault.
nlohmann::json parse_response_body(const std::string& provider, const HttpResponse& response);

// 2xx is healthy, any other status degraded, no response unavailable
ProviderHealth health_from_response(const HttpResponse& response);

// Permanent error for a payload kind the adapter cannot serve
[[noreturn]] void raise_unsupported(const std::string& provider, PayloadKind kind);

} // namespace modelgate
