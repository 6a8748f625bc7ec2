#include <catch2/catch.hpp>
#include "catalog.hpp"
#include "errors.hpp"
#include "model_registry.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <thread>

using namespace modelgate;

static std::vector<ModelDescriptor> sample_catalog() {
    return {
        make_model("gpt-4o", "openai", {"chat", "vision"}),
        make_model("text-embedding-3-small", "openai", {"embeddings"}),
        make_model("claude-haiku", "anthropic", {"chat"}),
        make_model("llama3", "ollama", {"chat"}),
    };
}

TEST_CASE("ModelRegistry: list by capability", "[registry]") {
    ModelRegistry registry(sample_catalog());
    REQUIRE(registry.size() == 4);
    REQUIRE(registry.list("chat").size() == 3);
    REQUIRE(registry.list("vision").size() == 1);
    REQUIRE(registry.list("audio").empty());
    REQUIRE(registry.list("").size() == 4);
}

TEST_CASE("ModelRegistry: list_matching requires every capability", "[registry]") {
    ModelRegistry registry(sample_catalog());
    auto both = registry.list_matching(make_capabilities({"chat", "vision"}));
    REQUIRE(both.size() == 1);
    REQUIRE(both[0].id == "gpt-4o");
}

TEST_CASE("ModelRegistry: disabled models are not listed", "[registry]") {
    auto models = sample_catalog();
    models[3].enabled = false;
    ModelRegistry registry(models);
    REQUIRE(registry.list("chat").size() == 2);
    REQUIRE(registry.list_all().size() == 4);
}

TEST_CASE("ModelRegistry: get, providers, list_by_provider", "[registry]") {
    ModelRegistry registry(sample_catalog());
    REQUIRE(registry.get("llama3")->provider == "ollama");
    REQUIRE_FALSE(registry.get("missing").has_value());
    REQUIRE(registry.providers() == std::vector<std::string>{"anthropic", "ollama", "openai"});
    REQUIRE(registry.list_by_provider("openai").size() == 2);
}

TEST_CASE("ModelRegistry: reload bumps version", "[registry]") {
    ModelRegistry registry;
    REQUIRE(registry.version() == 0);
    registry.reload(sample_catalog());
    REQUIRE(registry.version() == 1);
    registry.reload({make_model("only", "p")});
    REQUIRE(registry.version() == 2);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("ModelRegistry: invalid catalog keeps previous snapshot", "[registry]") {
    ModelRegistry registry(sample_catalog());
    auto bad = sample_catalog();
    bad.push_back(make_model("gpt-4o", "openai"));

    try {
        registry.reload(bad);
        FAIL("expected ConfigurationError");
    } catch (const GatewayError& e) {
        REQUIRE(e.kind() == ErrorKind::ConfigurationError);
    }
    REQUIRE(registry.size() == 4);
    REQUIRE(registry.version() == 1);
}

TEST_CASE("validate_catalog: rejects missing and non-positive fields", "[registry]") {
    auto no_provider = make_model("a", "");
    REQUIRE_THROWS_AS(validate_catalog({no_provider}), std::invalid_argument);

    auto no_context = make_model("a", "p");
    no_context.max_context_tokens = 0;
    REQUIRE_THROWS_AS(validate_catalog({no_context}), std::invalid_argument);

    auto negative = make_model("a", "p", {"chat"}, -1.0);
    REQUIRE_THROWS_AS(validate_catalog({negative}), std::invalid_argument);
}

TEST_CASE("ModelRegistry: load pulls from a catalog source", "[registry]") {
    InlineCatalogSource source(nlohmann::json::array({
        {{"id", "m1"}, {"provider", "p"}, {"capabilities", {"chat"}}, {"max_context_tokens", 4096}}
    }));
    ModelRegistry registry;
    registry.load(source);
    REQUIRE(registry.get("m1").has_value());
}

TEST_CASE("ModelRegistry: held snapshot survives reload", "[registry]") {
    ModelRegistry registry(sample_catalog());
    auto snap = registry.snapshot();
    registry.reload({make_model("only", "p")});
    REQUIRE(snap->models.size() == 4);
    REQUIRE(registry.snapshot()->models.size() == 1);
}

TEST_CASE("ModelRegistry: readers never see a partial catalog", "[registry]") {
    ModelRegistry registry(sample_catalog());
    std::atomic<bool> done{false};
    std::atomic<int> bad{0};

    std::thread reader([&]() {
        while (!done.load()) {
            auto snap = registry.snapshot();
            if (snap->models.size() != 4 && snap->models.size() != 2) bad++;
            if (snap->by_id.size() != snap->models.size()) bad++;
        }
    });

    for (int i = 0; i < 200; ++i) {
        if (i % 2 == 0) {
            registry.reload({make_model("x", "p"), make_model("y", "p")});
        } else {
            registry.reload(sample_catalog());
        }
    }
    done = true;
    reader.join();
    REQUIRE(bad.load() == 0);
}

TEST_CASE("ModelRegistry: stats summary", "[registry]") {
    ModelRegistry registry(sample_catalog());
    auto s = registry.stats();
    REQUIRE(s["models"] == 4);
    REQUIRE(s["providers"]["openai"] == 2);
    REQUIRE(s["capabilities"]["chat"] == 3);
}
