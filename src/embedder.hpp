#pragma once
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace modelgate {

using Embedding = std::vector<float>;

class HttpClient;     // forward declare
struct GatewayConfig; // forward declare

// Turns prompt text into a vector for semantic cache lookups.
class Embedder {
public:
    virtual ~Embedder() = default;

    // Failure may surface as an exception or as an empty result. The
    // semantic cache handles both by falling back to exact-match lookup.
    virtual Embedding embed(const std::string& text) = 0;

    // Vector length. Known up front, corrected by the first real response.
    virtual uint32_t dimensions() const = 0;

    // Backend tag used in log lines
    virtual std::string embedder_name() const = 0;
};

// Cosine of the angle between a and b, in [-1, 1]. Mismatched lengths,
// empty input and zero vectors all score 0.0 so they never count as a hit.
inline double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (denom < 1e-12) return 0.0;

    return dot / denom;
}

// Builds the embedder named in the embeddings config section. A null
// result leaves the semantic cache in exact-match mode.
std::unique_ptr<Embedder> create_embedder(const GatewayConfig& config, HttpClient& http);

} // namespace modelgate
