#include "../include/cache_store.hpp"
#include <sqlite3.h>
#include <stdexcept>

std::optional<BridgeCacheEntry> MemoryCacheStore::load() {
    std::lock_guard<std::mutex> lock(mtx_);
    return entry_;
}

void MemoryCacheStore::save(const BridgeCacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mtx_);
    entry_ = entry;
}

void MemoryCacheStore::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    entry_.reset();
}

SqliteCacheStore::SqliteCacheStore(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    init();
    prepare_statements();
}

SqliteCacheStore::~SqliteCacheStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteCacheStore::init() {
    exec("CREATE TABLE IF NOT EXISTS bridge_cache (\n"
         "  id INTEGER PRIMARY KEY CHECK (id = 1),\n"
         "  port INTEGER NOT NULL,\n"
         "  token TEXT NOT NULL,\n"
         "  discovered_at INTEGER NOT NULL\n"
         ");");
}

void SqliteCacheStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void SqliteCacheStore::prepare_statements() {
    const char* up = "INSERT OR REPLACE INTO bridge_cache (id, port, token, discovered_at) VALUES (1, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, up, -1, &upsert_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare upsert failed");
    }
    const char* sel = "SELECT port, token, discovered_at FROM bridge_cache WHERE id = 1;";
    if (sqlite3_prepare_v2(db_, sel, -1, &select_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare select failed");
    }
}

void SqliteCacheStore::close_statements() {
    if (upsert_stmt_) { sqlite3_finalize(upsert_stmt_); upsert_stmt_ = nullptr; }
    if (select_stmt_) { sqlite3_finalize(select_stmt_); select_stmt_ = nullptr; }
}

std::optional<BridgeCacheEntry> SqliteCacheStore::load() {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(select_stmt_);
    std::optional<BridgeCacheEntry> out;
    if (sqlite3_step(select_stmt_) == SQLITE_ROW) {
        BridgeCacheEntry e;
        e.port = sqlite3_column_int(select_stmt_, 0);
        const unsigned char* tok = sqlite3_column_text(select_stmt_, 1);
        e.token = tok ? reinterpret_cast<const char*>(tok) : "";
        e.discovered_at = sqlite3_column_int64(select_stmt_, 2);
        out = e;
    }
    sqlite3_reset(select_stmt_);
    return out;
}

void SqliteCacheStore::save(const BridgeCacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(upsert_stmt_);
    sqlite3_clear_bindings(upsert_stmt_);
    sqlite3_bind_int(upsert_stmt_, 1, entry.port);
    sqlite3_bind_text(upsert_stmt_, 2, entry.token.c_str(), (int)entry.token.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int64(upsert_stmt_, 3, entry.discovered_at);
    int rc = sqlite3_step(upsert_stmt_);
    sqlite3_reset(upsert_stmt_);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("save bridge cache failed");
    }
}

void SqliteCacheStore::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    exec("DELETE FROM bridge_cache;");
}
