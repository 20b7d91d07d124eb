#pragma once

#include "persistence/provider.hpp"

#include <string>

struct sqlite3;

namespace weave {

// ─── SqliteProvider ────────────────────────────────────────────
// Every key in one table of one database file:
//
//   kv_store(namespace TEXT, id TEXT, value TEXT, updated_at TEXT,
//            PRIMARY KEY (namespace, id))
//
// A key splits at its first ':' ("graph:abc" → "graph", "abc");
// a key without one lives in the "" namespace.

class SqliteProvider : public Provider {
public:
    /// Opens (creating if needed) the database at `path`; ":memory:" works.
    explicit SqliteProvider(const std::string& path);
    ~SqliteProvider() override;

    SqliteProvider(const SqliteProvider&) = delete;
    SqliteProvider& operator=(const SqliteProvider&) = delete;

    std::optional<nlohmann::json> get(const std::string& key) override;
    void set(const std::string& key, const nlohmann::json& value) override;
    void remove(const std::string& key) override;
    std::vector<std::string> list(const std::string& prefix = "") override;
    void clear(const std::string& prefix = "") override;
    void close() override;

    bool isClosed() const override { return db_ == nullptr; }
    std::string name() const override { return "SqliteProvider"; }
    const std::string& path() const { return path_; }

private:
    void assertOpen() const;
    void exec(const char* sql);
    [[noreturn]] void fail(const std::string& what) const;

    std::string path_;
    sqlite3* db_ = nullptr;
};

} // namespace weave
