#include "provider_adapter.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "providers/anthropic.hpp"
#include "providers/ollama.hpp"
#include "providers/openai.hpp"
#include <algorithm>

namespace modelgate {

void AdapterSet::add(std::shared_ptr<ProviderAdapter> adapter) {
    std::string name = adapter->provider_name();
    adapters_[name] = std::move(adapter);
}

ProviderAdapter* AdapterSet::find(const std::string& provider) const {
    auto it = adapters_.find(provider);
    return it == adapters_.end() ? nullptr : it->second.get();
}

std::vector<std::string> AdapterSet::names() const {
    std::vector<std::string> out;
    out.reserve(adapters_.size());
    for (const auto& [name, adapter] : adapters_) {
        (void)adapter;
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::unique_ptr<ProviderAdapter> create_adapter(const std::string& name,
                                                const ProviderSettings& settings,
                                                HttpClient& http) {
    const std::string& type = settings.type.empty() ? name : settings.type;

    if (type == "openai" || type == "compatible") {
        return std::make_unique<OpenAiAdapter>(name, settings.api_key, http, settings.base_url);
    }
    if (type == "anthropic") {
        return std::make_unique<AnthropicAdapter>(name, settings.api_key, http, settings.base_url);
    }
    if (type == "ollama") {
        return std::make_unique<OllamaAdapter>(name, http, settings.base_url);
    }
    throw GatewayError(ErrorKind::ConfigurationError,
                       "Unknown provider type '" + type + "' for provider " + name);
}

void raise_for_status(const std::string& provider, const HttpResponse& response) {
    long status = response.status_code;
    if (status >= 200 && status < 300) return;

    if (status == 0) {
        throw ProviderError(ProviderErrorKind::Transient,
                            provider + ": no response (connection failed or timed out)", 0);
    }

    std::string body = response.body;
    if (body.size() > 300) body = body.substr(0, 300) + "...";
    throw ProviderError(classify_http_status(status),
                        provider + " API error (HTTP " + std::to_string(status) + "): " + body,
                        status);
}

nlohmann::json parse_response_body(const std::string& provider, const HttpResponse& response) {
    raise_for_status(provider, response);
    auto j = nlohmann::json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ProviderError(ProviderErrorKind::Transient,
                            provider + " returned a malformed response body",
                            response.status_code);
    }
    return j;
}

ProviderHealth health_from_response(const HttpResponse& response) {
    ProviderHealth health;
    health.http_status = response.status_code;
    if (response.status_code == 0) {
        health.status = HealthStatus::Unavailable;
        health.detail = "no response";
    } else if (response.status_code >= 200 && response.status_code < 300) {
        health.status = HealthStatus::Healthy;
    } else {
        health.status = HealthStatus::Degraded;
        health.detail = "HTTP " + std::to_string(response.status_code);
    }
    return health;
}

void raise_unsupported(const std::string& provider, PayloadKind kind) {
    throw ProviderError(ProviderErrorKind::Permanent,
                        provider + " does not accept " + payload_kind_to_string(kind) + " payloads");
}

} // namespace modelgate
