#include "openai.hpp"
#include "../errors.hpp"
#include "../util.hpp"

using json = nlohmann::json;

namespace modelgate {

OpenAiAdapter::OpenAiAdapter(std::string name, std::string api_key, HttpClient& http,
                             const std::string& base_url)
    : name_(std::move(name)), api_key_(std::move(api_key)), http_(http),
      base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url) {}

bool OpenAiAdapter::supports(PayloadKind kind) const {
    (void)kind;
    return true;
}

std::vector<Header> OpenAiAdapter::build_headers() const {
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (!api_key_.empty()) {
        headers.push_back({"Authorization", "Bearer " + api_key_});
    }
    return headers;
}

json OpenAiAdapter::build_chat_request(const ModelDescriptor& model,
                                       const ChatPayload& chat,
                                       uint32_t max_output_tokens) const {
    json request;
    request["model"] = model.id;
    request["temperature"] = chat.temperature;
    request["max_tokens"] = max_output_tokens;

    json msgs = json::array();
    if (!chat.system_prompt.empty()) {
        msgs.push_back({{"role", "system"}, {"content", chat.system_prompt}});
    }
    for (const auto& msg : chat.messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;
    return request;
}

json OpenAiAdapter::build_vision_request(const ModelDescriptor& model,
                                         const VisionPayload& vision,
                                         uint32_t max_output_tokens) const {
    json content = json::array();
    content.push_back({{"type", "text"}, {"text", vision.prompt}});
    for (const auto& url : vision.image_urls) {
        content.push_back({{"type", "image_url"}, {"image_url", {{"url", url}}}});
    }

    json request;
    request["model"] = model.id;
    request["max_tokens"] = max_output_tokens;
    request["messages"] = json::array({{{"role", "user"}, {"content", content}}});
    return request;
}

InferenceResult OpenAiAdapter::complete(const ModelDescriptor& model, const json& request,
                                        const Payload& payload, Duration timeout) {
    auto response = http_.post(base_url_ + "/chat/completions", request.dump(),
                               build_headers(), timeout);
    json resp = parse_response_body(name_, response);

    InferenceResult result;
    result.model_id = model.id;
    result.provider = name_;

    if (resp.contains("choices") && resp["choices"].is_array() && !resp["choices"].empty()) {
        const auto& choice = resp["choices"][0];
        if (choice.contains("finish_reason") && choice["finish_reason"] == "content_filter") {
            throw ProviderError(ProviderErrorKind::Permanent,
                                name_ + " rejected the request (content filter)", response.status_code);
        }
        if (choice.contains("message") && choice["message"].contains("content") &&
            choice["message"]["content"].is_string()) {
            result.output = choice["message"]["content"].get<std::string>();
        }
    } else {
        throw ProviderError(ProviderErrorKind::Transient,
                            name_ + " response has no choices", response.status_code);
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        result.input_tokens = resp["usage"].value("prompt_tokens", 0u);
        result.output_tokens = resp["usage"].value("completion_tokens", 0u);
    }
    if (result.input_tokens == 0) result.input_tokens = payload_tokens(payload);
    if (result.output_tokens == 0) result.output_tokens = estimate_tokens(result.output);
    return result;
}

InferenceResult OpenAiAdapter::embed(const ModelDescriptor& model, const EmbeddingPayload& payload,
                                     Duration timeout) {
    json request = {{"model", model.id}, {"input", payload.inputs}};
    auto response = http_.post(base_url_ + "/embeddings", request.dump(), build_headers(), timeout);
    json resp = parse_response_body(name_, response);

    if (!resp.contains("data") || !resp["data"].is_array()) {
        throw ProviderError(ProviderErrorKind::Transient,
                            name_ + " embeddings response has no data", response.status_code);
    }

    json vectors = json::array();
    for (const auto& item : resp["data"]) {
        if (item.contains("embedding")) vectors.push_back(item["embedding"]);
    }

    InferenceResult result;
    result.model_id = model.id;
    result.provider = name_;
    result.output = vectors.dump();
    if (resp.contains("usage") && resp["usage"].is_object()) {
        result.input_tokens = resp["usage"].value("prompt_tokens", 0u);
    }
    if (result.input_tokens == 0) result.input_tokens = payload_tokens(Payload{payload});
    return result;
}

InferenceResult OpenAiAdapter::invoke(const ModelDescriptor& model,
                                      const Payload& payload,
                                      Duration timeout,
                                      uint32_t max_output_tokens) {
    if (auto* chat = std::get_if<ChatPayload>(&payload)) {
        return complete(model, build_chat_request(model, *chat, max_output_tokens), payload, timeout);
    }
    if (auto* vision = std::get_if<VisionPayload>(&payload)) {
        return complete(model, build_vision_request(model, *vision, max_output_tokens), payload, timeout);
    }
    if (auto* emb = std::get_if<EmbeddingPayload>(&payload)) {
        return embed(model, *emb, timeout);
    }

    // Opaque: forward a JSON chat-completions body as-is, pinned to this model
    const auto& opaque = std::get<OpaquePayload>(payload);
    if (opaque.content_type != "application/json") raise_unsupported(name_, PayloadKind::Opaque);
    json request = json::parse(opaque.bytes, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        throw ProviderError(ProviderErrorKind::Permanent, "Opaque payload is not a JSON object");
    }
    request["model"] = model.id;
    return complete(model, request, payload, timeout);
}

ProviderHealth OpenAiAdapter::health_check(Duration timeout) {
    std::vector<Header> headers;
    if (!api_key_.empty()) headers.push_back({"Authorization", "Bearer " + api_key_});
    return health_from_response(http_.get(base_url_ + "/models", headers, timeout));
}

} // namespace modelgate
