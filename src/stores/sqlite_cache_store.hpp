#pragma once
#include "../cache_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace modelgate {

// SQLite-backed cache persistence. One row per fingerprint; embeddings are
// stored as raw float BLOBs.
class SqliteCacheStore : public CacheStore {
public:
    explicit SqliteCacheStore(const std::string& path);
    ~SqliteCacheStore() override;

    // Non-copyable
    SqliteCacheStore(const SqliteCacheStore&) = delete;
    SqliteCacheStore& operator=(const SqliteCacheStore&) = delete;

    void put(const CacheEntry& entry) override;
    void remove(const std::string& fingerprint) override;
    std::vector<CacheEntry> load_live(uint64_t now_epoch) override;
    size_t purge_expired(uint64_t now_epoch) override;
    void clear() override;
    size_t count() override;
    std::string store_name() const override { return "sqlite"; }

private:
    void init_schema();
    void exec(const char* sql);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::mutex mutex_;
};

} // namespace modelgate
