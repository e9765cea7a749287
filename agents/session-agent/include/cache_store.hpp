#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

struct BridgeCacheEntry {
    int port{0};
    std::string token;
    int64_t discovered_at{0}; // ms since epoch
};

// Where the agent remembers the last discovered ControlServer.
class CacheStore {
public:
    virtual ~CacheStore() = default;
    virtual std::optional<BridgeCacheEntry> load() = 0;
    virtual void save(const BridgeCacheEntry& entry) = 0;
    virtual void clear() = 0;
};

class MemoryCacheStore : public CacheStore {
public:
    std::optional<BridgeCacheEntry> load() override;
    void save(const BridgeCacheEntry& entry) override;
    void clear() override;

private:
    std::mutex mtx_;
    std::optional<BridgeCacheEntry> entry_;
};

// Single-row SQLite table, so the cache survives agent restarts.
class SqliteCacheStore : public CacheStore {
public:
    explicit SqliteCacheStore(const std::string& db_path);
    ~SqliteCacheStore() override;

    SqliteCacheStore(const SqliteCacheStore&) = delete;
    SqliteCacheStore& operator=(const SqliteCacheStore&) = delete;

    std::optional<BridgeCacheEntry> load() override;
    void save(const BridgeCacheEntry& entry) override;
    void clear() override;

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* upsert_stmt_ {nullptr};
    struct sqlite3_stmt* select_stmt_ {nullptr};
};
