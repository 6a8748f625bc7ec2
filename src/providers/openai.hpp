#pragma once
#include "../provider_adapter.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace modelgate {

// OpenAI-compatible API: /chat/completions for chat, vision and JSON opaque
// payloads, /embeddings for embedding payloads. Works for any endpoint that
// speaks the same dialect (set base_url).
class OpenAiAdapter : public ProviderAdapter {
public:
    OpenAiAdapter(std::string name, std::string api_key, HttpClient& http,
                  const std::string& base_url = "");

    InferenceResult invoke(const ModelDescriptor& model,
                           const Payload& payload,
                           Duration timeout,
                           uint32_t max_output_tokens) override;

    ProviderHealth health_check(Duration timeout) override;

    bool supports(PayloadKind kind) const override;
    std::string provider_name() const override { return name_; }

    nlohmann::json build_chat_request(const ModelDescriptor& model,
                                      const ChatPayload& chat,
                                      uint32_t max_output_tokens) const;
    nlohmann::json build_vision_request(const ModelDescriptor& model,
                                        const VisionPayload& vision,
                                        uint32_t max_output_tokens) const;

private:
    std::vector<Header> build_headers() const;
    InferenceResult complete(const ModelDescriptor& model, const nlohmann::json& request,
                             const Payload& payload, Duration timeout);
    InferenceResult embed(const ModelDescriptor& model, const EmbeddingPayload& payload,
                          Duration timeout);

    std::string name_;
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
};

} // namespace modelgate
