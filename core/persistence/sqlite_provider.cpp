#include "persistence/sqlite_provider.hpp"
#include "graph/errors.hpp"
#include "graph/timestamp.hpp"
#include "log/log.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <filesystem>
#include <utility>

namespace weave {

namespace {

struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

std::pair<std::string, std::string> splitKey(const std::string& key) {
    auto colon = key.find(':');
    if (colon == std::string::npos) return {"", key};
    return {key.substr(0, colon), key.substr(colon + 1)};
}

std::string joinKey(const std::string& ns, const std::string& id) {
    return ns.empty() ? id : ns + ":" + id;
}

std::string columnText(sqlite3_stmt* stmt, int col) {
    auto* text = sqlite3_column_text(stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

} // namespace

SqliteProvider::SqliteProvider(const std::string& path) : path_(path) {
    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw StorageError("[" + name() + "] cannot create " + parent.string() +
                                   ": " + ec.message());
            }
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StorageError("[" + name() + "] cannot open " + path_ + ": " + err);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("CREATE TABLE IF NOT EXISTS kv_store ("
             "  namespace  TEXT NOT NULL,"
             "  id         TEXT NOT NULL,"
             "  value      TEXT NOT NULL,"
             "  updated_at TEXT NOT NULL,"
             "  PRIMARY KEY (namespace, id)"
             ");");
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    log::get()->debug("Opened sqlite store {}", path_);
}

SqliteProvider::~SqliteProvider() {
    if (db_) sqlite3_close(db_);
}

void SqliteProvider::assertOpen() const {
    if (!db_) throw ProviderClosedError(name());
}

void SqliteProvider::fail(const std::string& what) const {
    throw StorageError("[" + name() + "] " + what + ": " + sqlite3_errmsg(db_));
}

void SqliteProvider::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError("[" + name() + "] " + msg);
    }
}

std::optional<nlohmann::json> SqliteProvider::get(const std::string& key) {
    assertOpen();
    auto [ns, id] = splitKey(key);

    StmtGuard g;
    const char* sql = "SELECT value FROM kv_store WHERE namespace = ? AND id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) fail("prepare get");
    sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail("get " + key);

    std::string text = columnText(g.stmt, 0);
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("[" + name() + "] corrupt value for " + key + ": " + e.what());
    }
}

void SqliteProvider::set(const std::string& key, const nlohmann::json& value) {
    assertOpen();
    auto [ns, id] = splitKey(key);
    std::string payload = value.dump();
    std::string stamp = toIso8601(now());

    StmtGuard g;
    const char* sql =
        "INSERT OR REPLACE INTO kv_store (namespace, id, value, updated_at) "
        "VALUES (?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) fail("prepare set");
    sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, payload.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 4, stamp.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("set " + key);
}

void SqliteProvider::remove(const std::string& key) {
    assertOpen();
    auto [ns, id] = splitKey(key);

    StmtGuard g;
    const char* sql = "DELETE FROM kv_store WHERE namespace = ? AND id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) fail("prepare delete");
    sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("delete " + key);
}

std::vector<std::string> SqliteProvider::list(const std::string& prefix) {
    assertOpen();

    StmtGuard g;
    const char* sql = "SELECT namespace, id FROM kv_store;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) fail("prepare list");

    std::vector<std::string> keys;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        std::string key = joinKey(columnText(g.stmt, 0), columnText(g.stmt, 1));
        if (key.compare(0, prefix.size(), prefix) == 0) keys.push_back(std::move(key));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) fail("list");

    std::sort(keys.begin(), keys.end());
    return keys;
}

void SqliteProvider::clear(const std::string& prefix) {
    assertOpen();
    if (prefix.empty()) {
        exec("DELETE FROM kv_store;");
        return;
    }

    std::vector<std::string> keys = list(prefix);
    exec("BEGIN;");
    try {
        for (const auto& key : keys) remove(key);
    } catch (const StorageError&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    exec("COMMIT;");
}

void SqliteProvider::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

} // namespace weave
