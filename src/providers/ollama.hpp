#pragma once
#include "../provider_adapter.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace modelgate {

// Local Ollama server: /api/chat and /api/embed. No auth.
class OllamaAdapter : public ProviderAdapter {
public:
    OllamaAdapter(std::string name, HttpClient& http, const std::string& base_url = "");

    InferenceResult invoke(const ModelDescriptor& model,
                           const Payload& payload,
                           Duration timeout,
                           uint32_t max_output_tokens) override;

    ProviderHealth health_check(Duration timeout) override;

    bool supports(PayloadKind kind) const override {
        return kind == PayloadKind::Chat || kind == PayloadKind::Embedding;
    }
    std::string provider_name() const override { return name_; }

private:
    InferenceResult chat(const ModelDescriptor& model, const ChatPayload& chat,
                         Duration timeout, uint32_t max_output_tokens);
    InferenceResult embed(const ModelDescriptor& model, const EmbeddingPayload& payload,
                          Duration timeout);

    std::string name_;
    HttpClient& http_;
    std::string base_url_;
};

} // namespace modelgate
