#include "ollama.hpp"
#include "../errors.hpp"
#include "../util.hpp"

using json = nlohmann::json;

namespace modelgate {

OllamaAdapter::OllamaAdapter(std::string name, HttpClient& http, const std::string& base_url)
    : name_(std::move(name)), http_(http),
      base_url_(base_url.empty() ? "http://localhost:11434" : base_url) {}

InferenceResult OllamaAdapter::chat(const ModelDescriptor& model, const ChatPayload& chat,
                                    Duration timeout, uint32_t max_output_tokens) {
    json request;
    request["model"] = model.id;
    request["stream"] = false;
    request["options"] = {
        {"temperature", chat.temperature},
        {"num_predict", max_output_tokens}
    };

    json msgs = json::array();
    if (!chat.system_prompt.empty()) {
        msgs.push_back({{"role", "system"}, {"content", chat.system_prompt}});
    }
    for (const auto& msg : chat.messages) {
        std::string role = (msg.role == Role::Tool) ? "user" : role_to_string(msg.role);
        msgs.push_back({{"role", role}, {"content", msg.content}});
    }
    request["messages"] = msgs;

    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    auto response = http_.post(base_url_ + "/api/chat", request.dump(), headers, timeout);
    json resp = parse_response_body(name_, response);

    InferenceResult result;
    result.model_id = model.id;
    result.provider = name_;
    if (resp.contains("message") && resp["message"].contains("content") &&
        resp["message"]["content"].is_string()) {
        result.output = resp["message"]["content"].get<std::string>();
    }

    result.input_tokens = resp.value("prompt_eval_count", 0u);
    result.output_tokens = resp.value("eval_count", 0u);
    if (result.input_tokens == 0) result.input_tokens = payload_tokens(Payload{chat});
    if (result.output_tokens == 0) result.output_tokens = estimate_tokens(result.output);
    return result;
}

InferenceResult OllamaAdapter::embed(const ModelDescriptor& model, const EmbeddingPayload& payload,
                                     Duration timeout) {
    json request = {{"model", model.id}, {"input", payload.inputs}};
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    auto response = http_.post(base_url_ + "/api/embed", request.dump(), headers, timeout);
    json resp = parse_response_body(name_, response);

    if (!resp.contains("embeddings") || !resp["embeddings"].is_array()) {
        throw ProviderError(ProviderErrorKind::Transient,
                            name_ + " embed response has no embeddings", response.status_code);
    }

    InferenceResult result;
    result.model_id = model.id;
    result.provider = name_;
    result.output = resp["embeddings"].dump();
    result.input_tokens = resp.value("prompt_eval_count", 0u);
    if (result.input_tokens == 0) result.input_tokens = payload_tokens(Payload{payload});
    return result;
}

InferenceResult OllamaAdapter::invoke(const ModelDescriptor& model,
                                      const Payload& payload,
                                      Duration timeout,
                                      uint32_t max_output_tokens) {
    if (auto* c = std::get_if<ChatPayload>(&payload)) {
        return chat(model, *c, timeout, max_output_tokens);
    }
    if (auto* e = std::get_if<EmbeddingPayload>(&payload)) {
        return embed(model, *e, timeout);
    }
    raise_unsupported(name_, payload_kind(payload));
}

ProviderHealth OllamaAdapter::health_check(Duration timeout) {
    auto response = http_.get(base_url_ + "/api/tags", {}, timeout);
    ProviderHealth health = health_from_response(response);
    if (!health.healthy()) return health;

    auto j = json::parse(response.body, nullptr, false);
    if (j.is_object() && j.contains("models") && j["models"].is_array()) {
        health.detail = std::to_string(j["models"].size()) + " models installed";
    }
    return health;
}

} // namespace modelgate
