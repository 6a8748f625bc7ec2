#include "sqlite_cache_store.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <cstring>
#include <filesystem>
#include <stdexcept>

namespace modelgate {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static std::string serialize_vector(const Embedding& vec) {
    if (vec.empty()) return {};

    std::string data(sizeof(float) * vec.size(), '\0');
    std::memcpy(data.data(), vec.data(), sizeof(float) * vec.size());
    return data;
}

static Embedding deserialize_vector(const void* blob, int bytes) {
    if (!blob || bytes <= 0 || bytes % static_cast<int>(sizeof(float)) != 0) return {};

    Embedding vec(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(vec.data(), blob, static_cast<size_t>(bytes));
    return vec;
}

static PayloadKind kind_from_string(const std::string& s) {
    if (s == "embedding") return PayloadKind::Embedding;
    if (s == "vision") return PayloadKind::Vision;
    if (s == "opaque") return PayloadKind::Opaque;
    return PayloadKind::Chat;
}

SqliteCacheStore::SqliteCacheStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteCacheStore: failed to open database: " + err);
    }

    // Performance pragmas
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteCacheStore::~SqliteCacheStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteCacheStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw std::runtime_error("SqliteCacheStore: " + msg);
    }
}

void SqliteCacheStore::init_schema() {
    exec("CREATE TABLE IF NOT EXISTS cache_entries ("
         "  fingerprint    TEXT PRIMARY KEY,"
         "  capability_key TEXT NOT NULL,"
         "  kind           TEXT NOT NULL,"
         "  result         TEXT NOT NULL,"
         "  embedding      BLOB,"
         "  created_epoch  INTEGER NOT NULL,"
         "  ttl_ms         INTEGER NOT NULL,"
         "  hit_count      INTEGER NOT NULL DEFAULT 0"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_cache_expiry "
         "ON cache_entries(created_epoch, ttl_ms);");
}

void SqliteCacheStore::put(const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT OR REPLACE INTO cache_entries "
        "(fingerprint, capability_key, kind, result, embedding, created_epoch, ttl_ms, hit_count) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteCacheStore: ") + sqlite3_errmsg(db_));
    }

    std::string result = result_to_json(entry.result).dump();
    std::string blob = serialize_vector(entry.embedding);

    sqlite3_bind_text(g.stmt, 1, entry.fingerprint.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, entry.capability_key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, payload_kind_to_string(entry.kind), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, result.c_str(), -1, SQLITE_STATIC);
    if (blob.empty()) {
        sqlite3_bind_null(g.stmt, 5);
    } else {
        sqlite3_bind_blob(g.stmt, 5, blob.data(), static_cast<int>(blob.size()), SQLITE_STATIC);
    }
    sqlite3_bind_int64(g.stmt, 6, static_cast<sqlite3_int64>(entry.created_epoch));
    sqlite3_bind_int64(g.stmt, 7, static_cast<sqlite3_int64>(entry.ttl.count()));
    sqlite3_bind_int64(g.stmt, 8, static_cast<sqlite3_int64>(entry.hit_count));

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteCacheStore: ") + sqlite3_errmsg(db_));
    }
}

void SqliteCacheStore::remove(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "DELETE FROM cache_entries WHERE fingerprint = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteCacheStore: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, fingerprint.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteCacheStore: ") + sqlite3_errmsg(db_));
    }
}

std::vector<CacheEntry> SqliteCacheStore::load_live(uint64_t now_epoch) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT fingerprint, capability_key, kind, result, embedding, "
        "created_epoch, ttl_ms, hit_count FROM cache_entries "
        "WHERE created_epoch * 1000 + ttl_ms > ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteCacheStore: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(now_epoch * 1000));

    std::vector<CacheEntry> entries;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        CacheEntry e;
        if (auto* v = sqlite3_column_text(g.stmt, 0)) e.fingerprint    = reinterpret_cast<const char*>(v);
        if (auto* v = sqlite3_column_text(g.stmt, 1)) e.capability_key = reinterpret_cast<const char*>(v);
        if (auto* v = sqlite3_column_text(g.stmt, 2)) e.kind = kind_from_string(reinterpret_cast<const char*>(v));

        const auto* text = sqlite3_column_text(g.stmt, 3);
        if (!text) continue;
        auto parsed = nlohmann::json::parse(reinterpret_cast<const char*>(text), nullptr, false);
        if (parsed.is_discarded()) continue; // unreadable row, skip it
        e.result = result_from_json(parsed);

        e.embedding = deserialize_vector(sqlite3_column_blob(g.stmt, 4),
                                         sqlite3_column_bytes(g.stmt, 4));
        e.created_epoch = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 5));
        e.ttl = Duration(sqlite3_column_int64(g.stmt, 6));
        e.hit_count = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 7));
        entries.push_back(std::move(e));
    }
    return entries;
}

size_t SqliteCacheStore::purge_expired(uint64_t now_epoch) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "DELETE FROM cache_entries WHERE created_epoch * 1000 + ttl_ms <= ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteCacheStore: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(now_epoch * 1000));
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteCacheStore: ") + sqlite3_errmsg(db_));
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

void SqliteCacheStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("DELETE FROM cache_entries;");
}

size_t SqliteCacheStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "SELECT COUNT(*) FROM cache_entries;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteCacheStore: ") + sqlite3_errmsg(db_));
    }
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<size_t>(sqlite3_column_int64(g.stmt, 0));
}

} // namespace modelgate
