#include <catch2/catch.hpp>
#include "gateway.hpp"
#include "errors.hpp"
#include "mock_http_client.hpp"
#include "test_helpers.hpp"
#include <future>
#include <memory>
#include <vector>

using namespace modelgate;
using std::chrono::seconds;

namespace {

// Catalog backed by a vector the test can edit between reloads
class TestCatalog : public CatalogSource {
public:
    explicit TestCatalog(std::vector<ModelDescriptor>* models) : models_(models) {}
    std::vector<ModelDescriptor> load() override { return *models_; }
    std::string source_name() const override { return "test"; }

private:
    std::vector<ModelDescriptor>* models_;
};

struct GatewayFixture {
    ManualClock clock;
    std::vector<ModelDescriptor> catalog = {
        make_model("gpt-4o-mini", "openai", {"chat"}, 0.001, 0.002),
        make_model("llama3", "ollama", {"chat"}, 0.002, 0.004),
    };
    std::shared_ptr<ScriptedAdapter> openai = std::make_shared<ScriptedAdapter>("openai");
    std::shared_ptr<ScriptedAdapter> ollama = std::make_shared<ScriptedAdapter>("ollama");
    GatewayConfig config;
    std::unique_ptr<Gateway> gateway;

    GatewayFixture() { config.gateway.workers = 2; }

    Gateway& build(std::unique_ptr<Embedder> embedder = nullptr) {
        GatewayParts parts;
        parts.catalog = std::make_unique<TestCatalog>(&catalog);
        parts.adapters.add(openai);
        parts.adapters.add(ollama);
        parts.embedder = std::move(embedder);
        parts.clock = &clock;
        gateway = std::make_unique<Gateway>(config, std::move(parts));
        return *gateway;
    }

    Gateway& start() {
        build();
        gateway->start();
        return *gateway;
    }
};

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const GatewayError& e) {
        return e.kind();
    }
    FAIL("expected GatewayError");
    return ErrorKind::ConfigurationError;
}

} // namespace

// ── Inference path ──────────────────────────────────────────────

TEST_CASE("Gateway: infer routes to cheapest model", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.start();

    auto result = gw.infer(make_chat_request("r1", "hello"));
    REQUIRE(result.request_id == "r1");
    REQUIRE(result.provider == "openai");
    REQUIRE(result.model_id == "gpt-4o-mini");
    REQUIRE_FALSE(result.cache_hit);
    REQUIRE(result.cost > 0.0);
    REQUIRE(f.openai->calls == 1);
    REQUIRE(f.ollama->calls == 0);

    auto stats = gw.stats();
    REQUIRE(stats["gateway"]["completed"] == 1);
    REQUIRE(stats["gateway"]["in_flight"] == 0);
}

TEST_CASE("Gateway: empty request id is generated", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.start();
    auto result = gw.infer(make_chat_request("", "hello"));
    REQUIRE_FALSE(result.request_id.empty());
}

TEST_CASE("Gateway: repeated request is served from cache", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.start();

    auto first = gw.infer(make_chat_request("r1", "What is 2+2?"));
    auto second = gw.infer(make_chat_request("r2", "  what is 2+2?  "));

    REQUIRE(f.openai->calls == 1);
    REQUIRE(second.cache_hit);
    REQUIRE(second.request_id == "r2");
    REQUIRE(second.output == first.output);
    REQUIRE(second.cost == 0.0);
    REQUIRE(gw.stats()["gateway"]["cache_served"] == 1);
}

TEST_CASE("Gateway: similar request is served by semantic match", "[gateway]") {
    GatewayFixture f;
    auto embedder = std::make_unique<FakeEmbedder>();
    embedder->vectors["user: capital of france?"] = {1.0f, 0.0f, 0.0f};
    embedder->vectors["user: france's capital city?"] = {0.98f, 0.2f, 0.0f};
    f.build(std::move(embedder));
    f.gateway->start();

    f.gateway->infer(make_chat_request("r1", "Capital of France?"));
    auto hit = f.gateway->infer(make_chat_request("r2", "France's capital city?"));

    REQUIRE(hit.cache_hit);
    REQUIRE(hit.similarity > 0.9);
    REQUIRE(hit.similarity < 1.0);
    REQUIRE(f.openai->calls == 1);
}

TEST_CASE("Gateway: cache can be bypassed per request", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.start();
    gw.infer(make_chat_request("r1", "hello"));
    auto req = make_chat_request("r2", "hello");
    req.enable_cache = false;
    auto result = gw.infer(req);
    REQUIRE_FALSE(result.cache_hit);
    REQUIRE(f.openai->calls == 2);
}

TEST_CASE("Gateway: transient failure fails over", "[gateway]") {
    GatewayFixture f;
    f.openai->push(ScriptedAdapter::Outcome::Transient);
    auto& gw = f.start();

    auto result = gw.infer(make_chat_request("r1", "hello"));
    REQUIRE(result.provider == "ollama");
    REQUIRE(f.openai->calls == 1);
    REQUIRE(f.ollama->calls == 1);
    REQUIRE(gw.stats()["router"]["failovers"] == 1);
}

TEST_CASE("Gateway: permanent failure reaches the caller", "[gateway]") {
    GatewayFixture f;
    f.openai->push(ScriptedAdapter::Outcome::Permanent);
    auto& gw = f.start();

    auto kind = kind_of([&]() { gw.infer(make_chat_request("r1", "hello")); });
    REQUIRE(kind == ErrorKind::ProviderPermanentError);
    REQUIRE(f.ollama->calls == 0);
    REQUIRE(gw.stats()["gateway"]["failed"] == 1);

    // Failures are not cached
    gw.infer(make_chat_request("r2", "hello"));
    REQUIRE(f.openai->calls == 2);
}

TEST_CASE("Gateway: missing capability is reported", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.start();
    auto kind = kind_of([&]() {
        gw.infer(make_chat_request("r1", "hello", "agent-1", {"chat", "vision"}));
    });
    REQUIRE(kind == ErrorKind::CapabilityUnavailable);
}

TEST_CASE("Gateway: concurrent submissions all complete", "[gateway]") {
    GatewayFixture f;
    f.config.gateway.workers = 4;
    auto& gw = f.start();

    std::vector<std::future<InferenceResult>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(gw.submit(make_chat_request(
            "r" + std::to_string(i), "question " + std::to_string(i),
            "caller-" + std::to_string(i % 3))));
    }
    for (auto& fut : futures) {
        REQUIRE_FALSE(fut.get().output.empty());
    }
    REQUIRE(gw.stats()["gateway"]["completed"] == 20);
    REQUIRE(gw.in_flight() == 0);
}

// ── Admission ───────────────────────────────────────────────────

TEST_CASE("Gateway: full queue rejects", "[gateway]") {
    GatewayFixture f;
    f.config.queue.max_depth = 1;
    auto& gw = f.build(); // not started: nothing drains the queue

    auto pending = gw.submit(make_chat_request("r1", "one"));
    auto kind = kind_of([&]() { gw.submit(make_chat_request("r2", "two")); });
    REQUIRE(kind == ErrorKind::QueueRejected);
    REQUIRE(gw.in_flight() == 1);

    // Stopping a gateway that never ran fails what it still holds
    gw.stop();
    REQUIRE_THROWS_AS(pending.get(), GatewayError);
    REQUIRE(gw.in_flight() == 0);
}

TEST_CASE("Gateway: duplicate in-flight id is rejected", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.build();

    auto pending = gw.submit(make_chat_request("same", "one"));
    auto kind = kind_of([&]() { gw.submit(make_chat_request("same", "two")); });
    REQUIRE(kind == ErrorKind::QueueRejected);
    REQUIRE(gw.stats()["queue"]["depth"] == 1);
}

TEST_CASE("Gateway: past deadline is rejected at submit", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.build();

    auto req = make_chat_request("r1", "hello");
    req.deadline = f.clock.now();
    auto kind = kind_of([&]() { gw.submit(req); });
    REQUIRE(kind == ErrorKind::RequestExpired);
    REQUIRE(gw.in_flight() == 0);
}

TEST_CASE("Gateway: request expiring in queue fails its future", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.build();

    auto req = make_chat_request("r1", "hello");
    req.deadline = f.clock.now() + seconds(1);
    auto fut = gw.submit(req);

    f.clock.advance(seconds(2));
    gw.run_maintenance();

    try {
        fut.get();
        FAIL("expected GatewayError");
    } catch (const GatewayError& e) {
        REQUIRE(e.kind() == ErrorKind::RequestExpired);
    }
    REQUIRE(gw.stats()["queue"]["expired"] == 1);
    REQUIRE(f.openai->calls == 0);
}

TEST_CASE("Gateway: late result is discarded and not cached", "[gateway]") {
    GatewayFixture f;
    f.openai->on_invoke = [&]() { f.clock.advance(seconds(5)); };
    auto& gw = f.start();

    auto req = make_chat_request("r1", "slow question");
    req.deadline = f.clock.now() + seconds(1);
    auto kind = kind_of([&]() { gw.infer(req); });
    REQUIRE(kind == ErrorKind::RequestExpired);
    REQUIRE(gw.stats()["gateway"]["late_results"] == 1);

    f.openai->on_invoke = nullptr;
    auto again = gw.infer(make_chat_request("r2", "slow question"));
    REQUIRE_FALSE(again.cache_hit);
}

TEST_CASE("Gateway: infer on a gateway that was never started is rejected", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.build();

    auto req = make_chat_request("r1", "hello");
    req.deadline = f.clock.now() + seconds(5);
    auto kind = kind_of([&]() { gw.infer(req); });
    REQUIRE(kind == ErrorKind::QueueRejected);
    REQUIRE(gw.in_flight() == 0);
    REQUIRE(gw.stats()["queue"]["depth"] == 0);
    REQUIRE(f.openai->calls == 0);

    gw.start();
    auto result = gw.infer(make_chat_request("r2", "hello"));
    REQUIRE(result.provider == "openai");
}

TEST_CASE("Gateway: submit after stop is rejected", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.start();
    gw.stop();
    REQUIRE_FALSE(gw.running());
    auto kind = kind_of([&]() { gw.submit(make_chat_request("r1", "hello")); });
    REQUIRE(kind == ErrorKind::QueueRejected);
}

// ── Administrative surface ──────────────────────────────────────

TEST_CASE("Gateway: stats exposes every component", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.start();
    gw.infer(make_chat_request("r1", "hello"));

    auto stats = gw.stats();
    for (const char* key : {"gateway", "cache", "circuits", "rate_limits", "queue",
                            "registry", "router"}) {
        REQUIRE(stats.contains(key));
    }
    REQUIRE(stats["gateway"]["running"] == true);
    REQUIRE(stats["gateway"]["adapters"].size() == 2);
    REQUIRE(stats["registry"]["models"] == 2);
    REQUIRE(stats["cache"]["size"] == 1);
}

TEST_CASE("Gateway: clear_cache forces a fresh call", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.start();
    gw.infer(make_chat_request("r1", "hello"));
    gw.clear_cache();
    auto result = gw.infer(make_chat_request("r2", "hello"));
    REQUIRE_FALSE(result.cache_hit);
    REQUIRE(f.openai->calls == 2);
}

TEST_CASE("Gateway: reload_registry picks up catalog changes", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.start();
    uint64_t before = gw.registry().version();

    f.catalog.push_back(make_model("gpt-4o", "openai", {"chat", "vision"}));
    gw.reload_registry();

    REQUIRE(gw.registry().version() > before);
    REQUIRE(gw.registry().size() == 3);
    auto result = gw.infer(make_chat_request("r1", "describe", "agent-1", {"vision"}));
    REQUIRE(result.model_id == "gpt-4o");
}

TEST_CASE("Gateway: invalid reload keeps the previous catalog", "[gateway]") {
    GatewayFixture f;
    auto& gw = f.build();
    uint64_t before = gw.registry().version();

    f.catalog.push_back(make_model("llama3", "ollama")); // duplicate id
    auto kind = kind_of([&]() { gw.reload_registry(); });
    REQUIRE(kind == ErrorKind::ConfigurationError);
    REQUIRE(gw.registry().version() == before);
    REQUIRE(gw.registry().size() == 2);
}

TEST_CASE("Gateway: reset_provider closes a tripped circuit", "[gateway]") {
    GatewayFixture f;
    f.config.circuit_breaker.failure_threshold = 1;
    f.openai->push(ScriptedAdapter::Outcome::Transient);
    auto& gw = f.start();

    gw.infer(make_chat_request("r1", "hello"));
    REQUIRE(gw.breaker().state("openai") == CircuitState::Open);

    // Open circuit: traffic goes elsewhere
    auto result = gw.infer(make_chat_request("r2", "other"));
    REQUIRE(result.provider == "ollama");

    gw.reset_provider("openai");
    REQUIRE(gw.breaker().state("openai") == CircuitState::Closed);
    result = gw.infer(make_chat_request("r3", "third"));
    REQUIRE(result.provider == "openai");
}

TEST_CASE("Gateway: health_check reports every adapter with its circuit", "[gateway]") {
    GatewayFixture f;
    f.config.circuit_breaker.failure_threshold = 1;
    f.openai->push(ScriptedAdapter::Outcome::Transient);
    auto& gw = f.start();
    gw.infer(make_chat_request("r1", "hello"));

    auto health = gw.health_check();
    REQUIRE(health["status"] == "healthy");
    REQUIRE(health["running"] == true);
    REQUIRE(health["providers"]["openai"]["status"] == "healthy");
    REQUIRE(health["providers"]["openai"]["circuit"] == "OPEN");
    REQUIRE(health["providers"]["ollama"]["circuit"] == "CLOSED");
    REQUIRE(f.openai->health_calls == 1);
    REQUIRE(f.ollama->health_calls == 1);

    // A healthy answer does not close the circuit
    REQUIRE(gw.breaker().state("openai") == CircuitState::Open);
}

TEST_CASE("Gateway: health_check degrades with failing providers", "[gateway]") {
    GatewayFixture f;
    f.openai->health = {HealthStatus::Degraded, 401, "HTTP 401"};
    f.ollama->health_error = "connection refused";
    auto& gw = f.build();

    auto health = gw.health_check();
    REQUIRE(health["status"] == "unavailable");
    REQUIRE(health["providers"]["openai"]["status"] == "degraded");
    REQUIRE(health["providers"]["openai"]["http_status"] == 401);
    REQUIRE(health["providers"]["ollama"]["status"] == "unavailable");
    REQUIRE(health["providers"]["ollama"]["detail"] == "connection refused");

    f.ollama->health_error.clear();
    REQUIRE(gw.health_check()["status"] == "degraded");
}

TEST_CASE("Gateway: request-count limit routes the next call elsewhere", "[gateway]") {
    GatewayFixture f;
    f.config.rate_limit.defaults.requests_per_minute = 1;
    auto& gw = f.start();

    REQUIRE(gw.infer(make_chat_request("r1", "first")).provider == "openai");
    REQUIRE(gw.infer(make_chat_request("r2", "second")).provider == "ollama");

    auto kind = kind_of([&]() { gw.infer(make_chat_request("r3", "third")); });
    REQUIRE(kind == ErrorKind::AllProvidersUnavailable);

    f.clock.advance(seconds(60));
    REQUIRE(gw.infer(make_chat_request("r4", "fourth")).provider == "openai");
}

TEST_CASE("Gateway: residency and provider preference reach the router", "[gateway]") {
    GatewayFixture f;
    f.catalog[0].regions = {"us-east-1"};
    f.catalog[1].regions = {"eu-west-1"};
    auto& gw = f.start();

    auto pinned = make_chat_request("r1", "hello");
    pinned.allowed_regions = {"eu-west-1"};
    REQUIRE(gw.infer(pinned).provider == "ollama");

    // Same text, no pinning: a separate cache partition, cheapest model
    auto open = gw.infer(make_chat_request("r2", "hello"));
    REQUIRE_FALSE(open.cache_hit);
    REQUIRE(open.provider == "openai");

    auto preferred = make_chat_request("r3", "something else");
    preferred.preferred_providers = {"ollama"};
    REQUIRE(gw.infer(preferred).provider == "ollama");
}

// ── from_config ─────────────────────────────────────────────────

TEST_CASE("Gateway::from_config: keyless cloud providers are skipped", "[gateway]") {
    MockHttpClient mock;
    auto config = GatewayConfig::from_json(nlohmann::json::parse(R"({
        "providers": {"anthropic": {"api_key": "sk-ant"}},
        "models": [
            {"id": "claude-haiku", "provider": "anthropic", "capabilities": ["chat"],
             "cost_per_input_token": 0.000001, "cost_per_output_token": 0.000005,
             "max_context_tokens": 200000, "max_output_tokens": 4096,
             "latency_class": "fast"}
        ]
    })"));

    auto gw = Gateway::from_config(config, mock);
    auto adapters = gw->stats()["gateway"]["adapters"];
    REQUIRE(adapters == nlohmann::json::array({"anthropic", "ollama"}));
    REQUIRE(gw->registry().size() == 1);
    REQUIRE(gw->stats()["cache"]["semantic"] == false);
}
