#pragma once
#include "../embedder.hpp"
#include "../http.hpp"
#include <string>

namespace modelgate {

// One embedder for every JSON-over-HTTP backend. Backends differ only in
// path, auth header and where the vector sits in the reply.
class HttpEmbedder : public Embedder {
public:
    struct Config {
        std::string name;           // e.g. "openai", "ollama"
        std::string api_key;        // empty = no Authorization header
        std::string base_url;       // e.g. "https://api.openai.com/v1"
        std::string model;          // e.g. "text-embedding-3-small"
        std::string endpoint;       // URL path, e.g. "/embeddings"
        std::string response_path;  // RFC 6901 pointer, e.g. "/data/0/embedding"
        uint32_t default_dims;      // reported before any call succeeds
        Duration timeout = std::chrono::seconds(10);
    };

    HttpEmbedder(Config config, HttpClient& http);

    // Throws std::runtime_error when the backend answers with anything but
    // 200, when nothing comes back before config.timeout, or when the reply
    // has no number array at response_path.
    Embedding embed(const std::string& text) override;
    uint32_t dimensions() const override { return dimensions_; }
    std::string embedder_name() const override { return config_.name; }

private:
    Config config_;
    HttpClient& http_;
    uint32_t dimensions_;
};

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, Duration timeout);

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    Duration timeout);

} // namespace modelgate
