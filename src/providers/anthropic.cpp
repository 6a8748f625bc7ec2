#include "anthropic.hpp"
#include "../errors.hpp"
#include "../util.hpp"

using json = nlohmann::json;

namespace modelgate {

AnthropicAdapter::AnthropicAdapter(std::string name, std::string api_key, HttpClient& http,
                                   const std::string& base_url)
    : name_(std::move(name)), api_key_(std::move(api_key)), http_(http),
      base_url_(base_url.empty() ? "https://api.anthropic.com/v1" : base_url) {}

json AnthropicAdapter::build_request(const ModelDescriptor& model,
                                     const Payload& payload,
                                     uint32_t max_output_tokens) const {
    json request;
    request["model"] = model.id;
    request["max_tokens"] = max_output_tokens;

    json msgs = json::array();
    if (auto* chat = std::get_if<ChatPayload>(&payload)) {
        request["temperature"] = chat->temperature;

        // System text goes in its own field, not in messages
        std::string system_text = chat->system_prompt;
        for (const auto& msg : chat->messages) {
            if (msg.role == Role::System) {
                if (!system_text.empty()) system_text += "\n";
                system_text += msg.content;
                continue;
            }
            std::string role = msg.role == Role::Assistant ? "assistant" : "user";
            msgs.push_back({{"role", role}, {"content", msg.content}});
        }
        if (!system_text.empty()) request["system"] = system_text;
    } else if (auto* vision = std::get_if<VisionPayload>(&payload)) {
        json content = json::array();
        for (const auto& url : vision->image_urls) {
            content.push_back({{"type", "image"},
                               {"source", {{"type", "url"}, {"url", url}}}});
        }
        content.push_back({{"type", "text"}, {"text", vision->prompt}});
        msgs.push_back({{"role", "user"}, {"content", content}});
    }
    request["messages"] = msgs;
    return request;
}

InferenceResult AnthropicAdapter::invoke(const ModelDescriptor& model,
                                         const Payload& payload,
                                         Duration timeout,
                                         uint32_t max_output_tokens) {
    PayloadKind kind = payload_kind(payload);
    if (!supports(kind)) raise_unsupported(name_, kind);

    json request = build_request(model, payload, max_output_tokens);
    std::vector<Header> headers = {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION},
        {"content-type", "application/json"}
    };

    auto response = http_.post(base_url_ + "/messages", request.dump(), headers, timeout);
    json resp = parse_response_body(name_, response);

    if (resp.value("type", "") == "error") {
        std::string message = resp.contains("error") ? resp["error"].dump() : "unknown error";
        throw ProviderError(ProviderErrorKind::Permanent, name_ + " error: " + message,
                            response.status_code);
    }

    InferenceResult result;
    result.model_id = model.id;
    result.provider = name_;

    if (resp.contains("content") && resp["content"].is_array()) {
        for (const auto& block : resp["content"]) {
            if (block.value("type", "") == "text") {
                result.output += block.value("text", "");
            }
        }
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        result.input_tokens = resp["usage"].value("input_tokens", 0u);
        result.output_tokens = resp["usage"].value("output_tokens", 0u);
    }
    if (result.input_tokens == 0) result.input_tokens = payload_tokens(payload);
    if (result.output_tokens == 0) result.output_tokens = estimate_tokens(result.output);
    return result;
}

ProviderHealth AnthropicAdapter::health_check(Duration timeout) {
    if (api_key_.empty()) {
        ProviderHealth health;
        health.detail = "no API key";
        return health;
    }
    std::vector<Header> headers = {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION}
    };
    return health_from_response(http_.get(base_url_ + "/models", headers, timeout));
}

} // namespace modelgate
