#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace modelgate {

std::unique_ptr<Embedder> create_embedder(const GatewayConfig& config, HttpClient& http) {
    const auto& emb = config.embeddings;

    // Dedicated key wins; otherwise borrow the matching provider's key
    std::string api_key = emb.api_key;
    if (api_key.empty()) api_key = config.api_key_for(emb.provider.empty() ? "openai" : emb.provider);

    // No backend named: an OpenAI key alone is enough to turn embeddings on
    std::string provider = emb.provider;
    if (provider.empty()) {
        if (!api_key.empty()) {
            provider = "openai";
            std::cerr << "[embedder] Auto-detected OpenAI API key, enabling embeddings\n";
        }
    }
    if (provider.empty() || provider == "none") return nullptr;

    if (provider == "openai") {
        if (api_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        return create_openai_embedder(api_key, http, emb.base_url, emb.model, emb.timeout);
    }

    if (provider == "ollama") {
        return create_ollama_embedder(http, emb.base_url, emb.model, emb.timeout);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
    return nullptr;
}

} // namespace modelgate
