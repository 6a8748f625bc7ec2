#include <catch2/catch.hpp>
#include "stores/sqlite_cache_store.hpp"
#include "semantic_cache.hpp"
#include "test_helpers.hpp"
#include "util.hpp"
#include <filesystem>
#include <memory>
#include <unistd.h>

using namespace modelgate;
using std::chrono::seconds;

static std::string sqlite_test_path() {
    return "/tmp/modelgate_test_cache_" + std::to_string(getpid()) + ".db";
}

struct SqliteFixture {
    std::string path = sqlite_test_path();
    std::shared_ptr<SqliteCacheStore> store = std::make_shared<SqliteCacheStore>(path);

    ~SqliteFixture() {
        store.reset();
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

static CacheEntry make_entry(const std::string& fp, uint64_t created_epoch, Duration ttl) {
    CacheEntry e;
    e.fingerprint = fp;
    e.capability_key = "chat";
    e.kind = PayloadKind::Vision;
    e.embedding = {0.25f, -1.0f, 3.5f};
    e.created_epoch = created_epoch;
    e.ttl = ttl;
    e.hit_count = 4;
    e.result.model_id = "gpt-4o";
    e.result.provider = "openai";
    e.result.output = "a cat";
    e.result.input_tokens = 90;
    e.result.output_tokens = 3;
    return e;
}

// ── Put and load ─────────────────────────────────────────────

TEST_CASE("SqliteCacheStore: put and load_live", "[sqlite_cache]") {
    SqliteFixture f;
    f.store->put(make_entry("fp1", 1000, seconds(60)));

    auto entries = f.store->load_live(1030);
    REQUIRE(entries.size() == 1);
    const auto& e = entries[0];
    REQUIRE(e.fingerprint == "fp1");
    REQUIRE(e.capability_key == "chat");
    REQUIRE(e.kind == PayloadKind::Vision);
    REQUIRE(e.embedding == Embedding{0.25f, -1.0f, 3.5f});
    REQUIRE(e.created_epoch == 1000);
    REQUIRE(e.ttl == seconds(60));
    REQUIRE(e.hit_count == 4);
    REQUIRE(e.result.output == "a cat");
    REQUIRE(e.result.provider == "openai");
    REQUIRE(e.result.input_tokens == 90);
}

TEST_CASE("SqliteCacheStore: same fingerprint replaces", "[sqlite_cache]") {
    SqliteFixture f;
    f.store->put(make_entry("fp1", 1000, seconds(60)));
    auto updated = make_entry("fp1", 1010, seconds(60));
    updated.result.output = "a dog";
    f.store->put(updated);

    REQUIRE(f.store->count() == 1);
    REQUIRE(f.store->load_live(1020)[0].result.output == "a dog");
}

TEST_CASE("SqliteCacheStore: exact-only entries have no embedding", "[sqlite_cache]") {
    SqliteFixture f;
    auto e = make_entry("fp1", 1000, seconds(60));
    e.embedding.clear();
    f.store->put(e);
    REQUIRE(f.store->load_live(1000)[0].embedding.empty());
}

// ── Expiry ───────────────────────────────────────────────────

TEST_CASE("SqliteCacheStore: expired rows are not loaded", "[sqlite_cache]") {
    SqliteFixture f;
    f.store->put(make_entry("short", 1000, seconds(10)));
    f.store->put(make_entry("long", 1000, seconds(100)));

    auto live = f.store->load_live(1010);
    REQUIRE(live.size() == 1);
    REQUIRE(live[0].fingerprint == "long");
}

TEST_CASE("SqliteCacheStore: purge_expired deletes only expired rows", "[sqlite_cache]") {
    SqliteFixture f;
    f.store->put(make_entry("short", 1000, seconds(10)));
    f.store->put(make_entry("long", 1000, seconds(100)));

    REQUIRE(f.store->purge_expired(1050) == 1);
    REQUIRE(f.store->count() == 1);
    REQUIRE(f.store->purge_expired(1050) == 0);
}

// ── Remove and clear ─────────────────────────────────────────

TEST_CASE("SqliteCacheStore: remove and clear", "[sqlite_cache]") {
    SqliteFixture f;
    f.store->put(make_entry("a", 1000, seconds(60)));
    f.store->put(make_entry("b", 1000, seconds(60)));
    f.store->put(make_entry("c", 1000, seconds(60)));

    f.store->remove("b");
    REQUIRE(f.store->count() == 2);
    f.store->remove("missing");
    REQUIRE(f.store->count() == 2);

    f.store->clear();
    REQUIRE(f.store->count() == 0);
}

TEST_CASE("SqliteCacheStore: data survives reopen", "[sqlite_cache]") {
    SqliteFixture f;
    f.store->put(make_entry("fp1", 1000, seconds(60)));
    f.store = std::make_shared<SqliteCacheStore>(f.path);
    REQUIRE(f.store->count() == 1);
}

// ── With the semantic cache ──────────────────────────────────

TEST_CASE("SqliteCacheStore: semantic cache starts warm", "[sqlite_cache]") {
    SqliteFixture f;
    ManualClock clock;
    SemanticCacheConfig config;

    {
        SemanticCache first(config, nullptr, clock, f.store);
        InferenceResult r;
        r.model_id = "gpt-4o-mini";
        r.provider = "openai";
        r.output = "Paris";
        first.store(make_chat_request("r1", "Capital of France?"), r, nullptr);
    }
    REQUIRE(f.store->count() == 1);

    SemanticCache second(config, nullptr, clock, f.store);
    REQUIRE(second.warm_start() == 1);
    auto hit = second.lookup(make_chat_request("r2", "capital of france?"), nullptr);
    REQUIRE(hit.has_value());
    REQUIRE(hit->exact);
    REQUIRE(hit->entry.result.output == "Paris");
}

TEST_CASE("SqliteCacheStore: clearing the semantic cache clears the store", "[sqlite_cache]") {
    SqliteFixture f;
    ManualClock clock;
    SemanticCache cache(SemanticCacheConfig{}, nullptr, clock, f.store);

    InferenceResult r;
    r.output = "x";
    cache.store(make_chat_request("r1", "hello"), r, nullptr);
    REQUIRE(f.store->count() == 1);

    cache.clear();
    REQUIRE(f.store->count() == 0);
}
