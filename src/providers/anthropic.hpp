#pragma once
#include "../provider_adapter.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace modelgate {

// Anthropic messages API. Chat and vision (URL image sources) only.
class AnthropicAdapter : public ProviderAdapter {
public:
    AnthropicAdapter(std::string name, std::string api_key, HttpClient& http,
                     const std::string& base_url = "");

    InferenceResult invoke(const ModelDescriptor& model,
                           const Payload& payload,
                           Duration timeout,
                           uint32_t max_output_tokens) override;

    ProviderHealth health_check(Duration timeout) override;

    bool supports(PayloadKind kind) const override {
        return kind == PayloadKind::Chat || kind == PayloadKind::Vision;
    }
    std::string provider_name() const override { return name_; }

    nlohmann::json build_request(const ModelDescriptor& model,
                                 const Payload& payload,
                                 uint32_t max_output_tokens) const;

private:
    std::string name_;
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    static constexpr const char* API_VERSION = "2023-06-01";
};

} // namespace modelgate
