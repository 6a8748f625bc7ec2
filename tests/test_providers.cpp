#include <catch2/catch.hpp>
#include "errors.hpp"
#include "mock_http_client.hpp"
#include "provider_adapter.hpp"
#include "providers/anthropic.hpp"
#include "providers/ollama.hpp"
#include "providers/openai.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace modelgate;
using std::chrono::seconds;

// ── Helper: find header value ───────────────────────────────────

static std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

static Payload chat_payload(const std::string& text, const std::string& system = "") {
    ChatPayload chat;
    chat.system_prompt = system;
    chat.messages.push_back({Role::User, text});
    return chat;
}

static ProviderError catch_provider_error(ProviderAdapter& adapter, const ModelDescriptor& model,
                                          const Payload& payload) {
    try {
        adapter.invoke(model, payload, seconds(5), 100);
    } catch (const ProviderError& e) {
        return e;
    }
    FAIL("expected ProviderError");
    return ProviderError(ProviderErrorKind::Permanent, "unreachable");
}

// ════════════════════════════════════════════════════════════════
// Status classification
// ════════════════════════════════════════════════════════════════

TEST_CASE("classify_http_status: retryable statuses are transient", "[providers]") {
    REQUIRE(classify_http_status(0) == ProviderErrorKind::Transient);
    REQUIRE(classify_http_status(408) == ProviderErrorKind::Transient);
    REQUIRE(classify_http_status(429) == ProviderErrorKind::Transient);
    REQUIRE(classify_http_status(500) == ProviderErrorKind::Transient);
    REQUIRE(classify_http_status(503) == ProviderErrorKind::Transient);
}

TEST_CASE("classify_http_status: caller errors are permanent", "[providers]") {
    REQUIRE(classify_http_status(400) == ProviderErrorKind::Permanent);
    REQUIRE(classify_http_status(401) == ProviderErrorKind::Permanent);
    REQUIRE(classify_http_status(404) == ProviderErrorKind::Permanent);
    REQUIRE(classify_http_status(413) == ProviderErrorKind::Permanent);
}

TEST_CASE("raise_for_status: truncates long bodies", "[providers]") {
    HttpResponse resp{400, std::string(1000, 'x')};
    try {
        raise_for_status("p", resp);
        FAIL("expected ProviderError");
    } catch (const ProviderError& e) {
        REQUIRE(e.http_status() == 400);
        REQUIRE(std::string(e.what()).size() < 400);
    }
}

TEST_CASE("health_from_response: status mapping", "[providers]") {
    auto ok = health_from_response({204, ""});
    REQUIRE(ok.healthy());
    REQUIRE(ok.http_status == 204);

    auto limited = health_from_response({429, "slow down"});
    REQUIRE(limited.status == HealthStatus::Degraded);
    REQUIRE(limited.detail == "HTTP 429");

    auto down = health_from_response({0, ""});
    REQUIRE(down.status == HealthStatus::Unavailable);
    REQUIRE(down.detail == "no response");
}

// ════════════════════════════════════════════════════════════════
// OpenAI
// ════════════════════════════════════════════════════════════════

TEST_CASE("OpenAiAdapter: chat sends correct request", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({
        "choices": [{"message": {"content": "Hello!"}, "finish_reason": "stop"}],
        "usage": {"prompt_tokens": 10, "completion_tokens": 5}
    })"};

    OpenAiAdapter adapter("openai", "sk-test", mock);
    auto model = make_model("gpt-4o-mini", "openai");
    auto result = adapter.invoke(model, chat_payload("Hi", "Be brief"), seconds(15), 256);

    REQUIRE(mock.last_url == "https://api.openai.com/v1/chat/completions");
    REQUIRE(find_header(mock.last_headers, "Authorization") == "Bearer sk-test");
    REQUIRE(mock.last_timeout == seconds(15));

    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "gpt-4o-mini");
    REQUIRE(body["max_tokens"] == 256);
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0]["role"] == "system");
    REQUIRE(body["messages"][1]["content"] == "Hi");

    REQUIRE(result.output == "Hello!");
    REQUIRE(result.model_id == "gpt-4o-mini");
    REQUIRE(result.provider == "openai");
    REQUIRE(result.input_tokens == 10);
    REQUIRE(result.output_tokens == 5);
}

TEST_CASE("OpenAiAdapter: custom base URL and name", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices": [{"message": {"content": "ok"}}]})"};
    OpenAiAdapter adapter("local", "", mock, "http://localhost:8080/v1");
    auto result = adapter.invoke(make_model("m", "local"), chat_payload("Hi"), seconds(5), 10);

    REQUIRE(mock.last_url == "http://localhost:8080/v1/chat/completions");
    REQUIRE(find_header(mock.last_headers, "Authorization").empty());
    REQUIRE(result.provider == "local");
    // No usage block: estimates
    REQUIRE(result.input_tokens > 0);
    REQUIRE(result.output_tokens > 0);
}

TEST_CASE("OpenAiAdapter: vision request carries image parts", "[providers][openai]") {
    MockHttpClient mock;
    OpenAiAdapter adapter("openai", "k", mock);
    VisionPayload v{"What is this?", {"https://img/a.png"}};
    auto req = adapter.build_vision_request(make_model("gpt-4o", "openai"), v, 100);

    auto& content = req["messages"][0]["content"];
    REQUIRE(content.size() == 2);
    REQUIRE(content[1]["type"] == "image_url");
    REQUIRE(content[1]["image_url"]["url"] == "https://img/a.png");
}

TEST_CASE("OpenAiAdapter: embeddings return vectors as JSON", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({
        "data": [{"embedding": [0.1, 0.2]}, {"embedding": [0.3, 0.4]}],
        "usage": {"prompt_tokens": 4}
    })"};
    OpenAiAdapter adapter("openai", "k", mock);
    auto result = adapter.invoke(make_model("text-embedding-3-small", "openai", {"embeddings"}),
                                 EmbeddingPayload{{"a", "b"}}, seconds(5), 0);

    REQUIRE(mock.last_url == "https://api.openai.com/v1/embeddings");
    REQUIRE(json::parse(mock.last_body)["input"].size() == 2);
    auto vectors = json::parse(result.output);
    REQUIRE(vectors.size() == 2);
    REQUIRE(result.input_tokens == 4);
}

TEST_CASE("OpenAiAdapter: opaque JSON is forwarded with model pinned", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices": [{"message": {"content": "ok"}}]})"};
    OpenAiAdapter adapter("openai", "k", mock);
    OpaquePayload raw{"application/json", R"({"model": "other", "messages": [], "seed": 7})"};
    adapter.invoke(make_model("gpt-4o", "openai"), raw, seconds(5), 10);

    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "gpt-4o");
    REQUIRE(body["seed"] == 7);
}

TEST_CASE("OpenAiAdapter: non-JSON opaque payload is permanent", "[providers][openai]") {
    MockHttpClient mock;
    OpenAiAdapter adapter("openai", "k", mock);
    auto err = catch_provider_error(adapter, make_model("m", "openai"),
                                    OpaquePayload{"application/octet-stream", "\x01\x02"});
    REQUIRE_FALSE(err.transient());
    REQUIRE(mock.call_count == 0);
}

TEST_CASE("OpenAiAdapter: HTTP errors are classified", "[providers][openai]") {
    MockHttpClient mock;
    OpenAiAdapter adapter("openai", "k", mock);
    auto model = make_model("m", "openai");

    mock.next_response = {429, R"({"error": "slow down"})"};
    REQUIRE(catch_provider_error(adapter, model, chat_payload("x")).transient());

    mock.next_response = {401, R"({"error": "bad key"})"};
    auto err = catch_provider_error(adapter, model, chat_payload("x"));
    REQUIRE_FALSE(err.transient());
    REQUIRE(err.http_status() == 401);

    mock.next_response = {0, ""};
    REQUIRE(catch_provider_error(adapter, model, chat_payload("x")).transient());
}

TEST_CASE("OpenAiAdapter: malformed body is transient", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, "<html>gateway timeout</html>"};
    OpenAiAdapter adapter("openai", "k", mock);
    REQUIRE(catch_provider_error(adapter, make_model("m", "openai"), chat_payload("x")).transient());

    mock.next_response = {200, R"({"choices": []})"};
    REQUIRE(catch_provider_error(adapter, make_model("m", "openai"), chat_payload("x")).transient());
}

TEST_CASE("OpenAiAdapter: content filter is permanent", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices": [{"message": {"content": null},
                                                "finish_reason": "content_filter"}]})"};
    OpenAiAdapter adapter("openai", "k", mock);
    REQUIRE_FALSE(catch_provider_error(adapter, make_model("m", "openai"),
                                       chat_payload("x")).transient());
}

TEST_CASE("OpenAiAdapter: health check lists models", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"data": []})"};
    OpenAiAdapter adapter("openai", "sk-test", mock);

    auto health = adapter.health_check(seconds(3));
    REQUIRE(health.healthy());
    REQUIRE(mock.last_url == "https://api.openai.com/v1/models");
    REQUIRE(mock.last_body.empty());
    REQUIRE(find_header(mock.last_headers, "Authorization") == "Bearer sk-test");
    REQUIRE(mock.last_timeout == seconds(3));

    mock.next_response = {401, R"({"error": "bad key"})"};
    auto rejected = adapter.health_check(seconds(3));
    REQUIRE(rejected.status == HealthStatus::Degraded);
    REQUIRE(rejected.http_status == 401);
}

// ════════════════════════════════════════════════════════════════
// Anthropic
// ════════════════════════════════════════════════════════════════

TEST_CASE("AnthropicAdapter: chat sends correct request", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({
        "content": [{"type": "text", "text": "Hello!"}],
        "usage": {"input_tokens": 10, "output_tokens": 5}
    })"};

    AnthropicAdapter adapter("anthropic", "test-key", mock);
    auto result = adapter.invoke(make_model("claude-haiku", "anthropic"),
                                 chat_payload("Hi", "Be helpful"), seconds(5), 512);

    REQUIRE(mock.last_url == "https://api.anthropic.com/v1/messages");
    REQUIRE(find_header(mock.last_headers, "x-api-key") == "test-key");
    REQUIRE(find_header(mock.last_headers, "anthropic-version") == "2023-06-01");

    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "claude-haiku");
    REQUIRE(body["max_tokens"] == 512);
    REQUIRE(body["system"] == "Be helpful");
    REQUIRE(body["messages"].size() == 1);
    REQUIRE(body["messages"][0]["role"] == "user");

    REQUIRE(result.output == "Hello!");
    REQUIRE(result.input_tokens == 10);
    REQUIRE(result.output_tokens == 5);
}

TEST_CASE("AnthropicAdapter: system-role messages merge into system field", "[providers][anthropic]") {
    MockHttpClient mock;
    AnthropicAdapter adapter("anthropic", "k", mock);
    ChatPayload chat;
    chat.system_prompt = "A";
    chat.messages = {{Role::System, "B"}, {Role::User, "Hi"}};
    auto req = adapter.build_request(make_model("c", "anthropic"), chat, 10);
    REQUIRE(req["system"] == "A\nB");
    REQUIRE(req["messages"].size() == 1);
}

TEST_CASE("AnthropicAdapter: vision uses URL image sources", "[providers][anthropic]") {
    MockHttpClient mock;
    AnthropicAdapter adapter("anthropic", "k", mock);
    VisionPayload v{"What is this?", {"https://img/a.png"}};
    auto req = adapter.build_request(make_model("c", "anthropic"), v, 10);
    auto& content = req["messages"][0]["content"];
    REQUIRE(content[0]["type"] == "image");
    REQUIRE(content[0]["source"]["url"] == "https://img/a.png");
    REQUIRE(content[1]["text"] == "What is this?");
}

TEST_CASE("AnthropicAdapter: embeddings are not supported", "[providers][anthropic]") {
    MockHttpClient mock;
    AnthropicAdapter adapter("anthropic", "k", mock);
    REQUIRE_FALSE(adapter.supports(PayloadKind::Embedding));
    REQUIRE(adapter.supports(PayloadKind::Vision));
    auto err = catch_provider_error(adapter, make_model("c", "anthropic"),
                                    EmbeddingPayload{{"x"}});
    REQUIRE_FALSE(err.transient());
    REQUIRE(mock.call_count == 0);
}

TEST_CASE("AnthropicAdapter: overloaded is transient", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {529, R"({"type": "error", "error": {"type": "overloaded_error"}})"};
    AnthropicAdapter adapter("anthropic", "k", mock);
    REQUIRE(catch_provider_error(adapter, make_model("c", "anthropic"), chat_payload("x")).transient());
}

TEST_CASE("AnthropicAdapter: health check", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"data": []})"};
    AnthropicAdapter adapter("anthropic", "sk-ant", mock);

    REQUIRE(adapter.health_check(seconds(5)).healthy());
    REQUIRE(mock.last_url == "https://api.anthropic.com/v1/models");
    REQUIRE(find_header(mock.last_headers, "x-api-key") == "sk-ant");
    REQUIRE(find_header(mock.last_headers, "anthropic-version") == "2023-06-01");

    AnthropicAdapter keyless("anthropic", "", mock);
    int calls = mock.call_count;
    auto health = keyless.health_check(seconds(5));
    REQUIRE(health.status == HealthStatus::Unavailable);
    REQUIRE(health.detail == "no API key");
    REQUIRE(mock.call_count == calls);
}

// ════════════════════════════════════════════════════════════════
// Ollama
// ════════════════════════════════════════════════════════════════

TEST_CASE("OllamaAdapter: chat sends correct request", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({
        "message": {"role": "assistant", "content": "Hello!"},
        "prompt_eval_count": 7, "eval_count": 3
    })"};

    OllamaAdapter adapter("ollama", mock);
    auto result = adapter.invoke(make_model("llama3", "ollama"), chat_payload("Hi"), seconds(5), 64);

    REQUIRE(mock.last_url == "http://localhost:11434/api/chat");
    auto body = json::parse(mock.last_body);
    REQUIRE(body["stream"] == false);
    REQUIRE(body["options"]["num_predict"] == 64);
    REQUIRE(result.output == "Hello!");
    REQUIRE(result.input_tokens == 7);
    REQUIRE(result.output_tokens == 3);
}

TEST_CASE("OllamaAdapter: embeddings via /api/embed", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"embeddings": [[0.1, 0.2, 0.3]]})"};
    OllamaAdapter adapter("ollama", mock, "http://gpu-box:11434");
    auto result = adapter.invoke(make_model("nomic", "ollama", {"embeddings"}),
                                 EmbeddingPayload{{"hello"}}, seconds(5), 0);
    REQUIRE(mock.last_url == "http://gpu-box:11434/api/embed");
    REQUIRE(json::parse(result.output)[0].size() == 3);
}

TEST_CASE("OllamaAdapter: vision is unsupported", "[providers][ollama]") {
    MockHttpClient mock;
    OllamaAdapter adapter("ollama", mock);
    REQUIRE_FALSE(adapter.supports(PayloadKind::Vision));
    REQUIRE_FALSE(catch_provider_error(adapter, make_model("llava", "ollama"),
                                       VisionPayload{"x", {}}).transient());
}

TEST_CASE("OllamaAdapter: health check counts installed models", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"models": [{"name": "llama3"}, {"name": "mistral"}]})"};
    OllamaAdapter adapter("ollama", mock);

    auto health = adapter.health_check(seconds(5));
    REQUIRE(health.healthy());
    REQUIRE(health.detail == "2 models installed");
    REQUIRE(mock.last_url == "http://localhost:11434/api/tags");

    mock.next_response = {0, ""};
    REQUIRE(adapter.health_check(seconds(5)).status == HealthStatus::Unavailable);
}

// ════════════════════════════════════════════════════════════════
// Factory / AdapterSet
// ════════════════════════════════════════════════════════════════

TEST_CASE("create_adapter: type selects implementation", "[providers]") {
    MockHttpClient mock;
    auto a = create_adapter("openai", {"", "k", ""}, mock);
    REQUIRE(a->provider_name() == "openai");
    REQUIRE(dynamic_cast<OpenAiAdapter*>(a.get()) != nullptr);

    auto b = create_adapter("groq", {"compatible", "k", "https://api.groq.com/openai/v1"}, mock);
    REQUIRE(b->provider_name() == "groq");
    REQUIRE(dynamic_cast<OpenAiAdapter*>(b.get()) != nullptr);

    auto c = create_adapter("claude", {"anthropic", "k", ""}, mock);
    REQUIRE(dynamic_cast<AnthropicAdapter*>(c.get()) != nullptr);

    auto d = create_adapter("ollama", {}, mock);
    REQUIRE(dynamic_cast<OllamaAdapter*>(d.get()) != nullptr);
}

TEST_CASE("create_adapter: unknown type is a configuration error", "[providers]") {
    MockHttpClient mock;
    try {
        create_adapter("x", {"carrier-pigeon", "", ""}, mock);
        FAIL("expected GatewayError");
    } catch (const GatewayError& e) {
        REQUIRE(e.kind() == ErrorKind::ConfigurationError);
    }
}

TEST_CASE("AdapterSet: find by provider name", "[providers]") {
    AdapterSet set;
    set.add(std::make_shared<ScriptedAdapter>("b"));
    set.add(std::make_shared<ScriptedAdapter>("a"));
    REQUIRE(set.size() == 2);
    REQUIRE(set.find("a")->provider_name() == "a");
    REQUIRE(set.find("zzz") == nullptr);
    REQUIRE(set.names() == std::vector<std::string>{"a", "b"});
}
