#include "state/sqlite_store.hpp"
#include "state/sqlite_statement.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <chrono>

namespace warden::state {

namespace {

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Migration N brings the schema from version N-1 to N
const char* const MIGRATIONS[] = {
    // 1: key-value table and append-only event log
    "CREATE TABLE IF NOT EXISTS kv_store ("
    "  key TEXT PRIMARY KEY,"
    "  value TEXT NOT NULL,"
    "  created_at INTEGER NOT NULL,"
    "  updated_at INTEGER NOT NULL);"
    "CREATE TABLE IF NOT EXISTS event_log ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  timestamp INTEGER NOT NULL,"
    "  event_type TEXT NOT NULL,"
    "  agent_id TEXT NOT NULL,"
    "  data TEXT NOT NULL);"
    "CREATE INDEX IF NOT EXISTS idx_event_log_agent ON event_log(agent_id);",

    // 2: artifact index
    "CREATE TABLE IF NOT EXISTS artifacts ("
    "  id TEXT PRIMARY KEY,"
    "  kind TEXT NOT NULL,"
    "  path TEXT NOT NULL,"
    "  agent_id TEXT NOT NULL,"
    "  created_at INTEGER NOT NULL);"
    "CREATE INDEX IF NOT EXISTS idx_artifacts_agent ON artifacts(agent_id);",
};

} // namespace

SqliteStore::SqliteStore(sqlite3* db) : db_(db) {}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

std::unique_ptr<SqliteStore> SqliteStore::open(const std::filesystem::path& path, std::string& error) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "failed to create " + path.parent_path().string() + ": " + ec.message();
            return nullptr;
        }
    }

    sqlite3* db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &db,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                        nullptr) != SQLITE_OK) {
        error = "failed to open state database " + path.string() + ": " +
                (db ? sqlite3_errmsg(db) : "out of memory");
        if (db) sqlite3_close(db);
        return nullptr;
    }

    std::unique_ptr<SqliteStore> store(new SqliteStore(db));
    exec_sql(db, "PRAGMA journal_mode=WAL;", error);
    error.clear();
    if (!store->migrate(error)) {
        return nullptr;
    }
    spdlog::debug("State database opened: {}", path.string());
    return store;
}

std::unique_ptr<SqliteStore> SqliteStore::open_in_memory(std::string& error) {
    sqlite3* db = nullptr;
    if (sqlite3_open(":memory:", &db) != SQLITE_OK) {
        error = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        return nullptr;
    }
    std::unique_ptr<SqliteStore> store(new SqliteStore(db));
    if (!store->migrate(error)) {
        return nullptr;
    }
    return store;
}

bool SqliteStore::migrate(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!exec_sql(db_, "CREATE TABLE IF NOT EXISTS schema_version ("
                       "  version INTEGER PRIMARY KEY,"
                       "  applied_at INTEGER NOT NULL);", error)) {
        return false;
    }

    int version = schema_version_locked();
    for (int target = version + 1; target <= CURRENT_SCHEMA_VERSION; ++target) {
        spdlog::info("Migrating state database to schema version {}", target);

        if (!exec_sql(db_, "BEGIN IMMEDIATE;", error)) {
            return false;
        }
        Statement record(db_, "INSERT INTO schema_version (version, applied_at) VALUES (?1, ?2)");
        bool applied = exec_sql(db_, MIGRATIONS[target - 1], error) &&
                       record.bind(1, static_cast<int64_t>(target)).bind(2, now_seconds()).run();
        if (!applied) {
            if (error.empty()) error = record.error();
            std::string ignored;
            exec_sql(db_, "ROLLBACK;", ignored);
            error = "migration to version " + std::to_string(target) + " failed: " + error;
            return false;
        }
        if (!exec_sql(db_, "COMMIT;", error)) {
            return false;
        }
    }
    return true;
}

int SqliteStore::schema_version_locked() {
    Statement stmt(db_, "SELECT COALESCE(MAX(version), 0) FROM schema_version");
    if (stmt.step() != SQLITE_ROW) {
        return 0;
    }
    return static_cast<int>(stmt.column_int64(0));
}

int SqliteStore::schema_version() {
    std::lock_guard<std::mutex> lock(mutex_);
    return schema_version_locked();
}

core::Status SqliteStore::kv_set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "INSERT INTO kv_store (key, value, created_at, updated_at) VALUES (?1, ?2, ?3, ?3) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at");
    if (!stmt.bind(1, key).bind(2, value).bind(3, now_seconds()).run()) {
        return core::Status::fail(core::ErrorCode::BACKEND, "kv_set failed: " + stmt.error());
    }
    return core::Status::ok();
}

std::optional<std::string> SqliteStore::kv_get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT value FROM kv_store WHERE key = ?1");
    stmt.bind(1, key);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return stmt.column_text(0);
}

core::Status SqliteStore::kv_erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM kv_store WHERE key = ?1");
    if (!stmt.bind(1, key).run()) {
        return core::Status::fail(core::ErrorCode::BACKEND, "kv_erase failed: " + stmt.error());
    }
    return core::Status::ok();
}

std::vector<std::string> SqliteStore::kv_keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    Statement stmt(db_, "SELECT key FROM kv_store ORDER BY key");
    while (stmt.step() == SQLITE_ROW) {
        keys.push_back(stmt.column_text(0));
    }
    return keys;
}

core::Status SqliteStore::append_event(int64_t timestamp_ms, const std::string& event_type,
                                       const std::string& agent_id, const std::string& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "INSERT INTO event_log (timestamp, event_type, agent_id, data) VALUES (?1, ?2, ?3, ?4)");
    if (!stmt.bind(1, timestamp_ms).bind(2, event_type).bind(3, agent_id).bind(4, data).run()) {
        return core::Status::fail(core::ErrorCode::BACKEND, "append_event failed: " + stmt.error());
    }
    return core::Status::ok();
}

std::vector<StoredEvent> SqliteStore::query_events(const char* sql, const std::string* text_arg,
                                                   int64_t int_arg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoredEvent> events;
    Statement stmt(db_, sql);
    if (text_arg) {
        stmt.bind(1, *text_arg);
    } else {
        stmt.bind(1, int_arg);
    }
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        StoredEvent e;
        e.id = stmt.column_int64(0);
        e.timestamp_ms = stmt.column_int64(1);
        e.event_type = stmt.column_text(2);
        e.agent_id = stmt.column_text(3);
        e.data = stmt.column_text(4);
        events.push_back(std::move(e));
    }
    if (rc != SQLITE_DONE) {
        spdlog::error("Event log query failed: {}", stmt.error());
    }
    return events;
}

std::vector<StoredEvent> SqliteStore::events_for_agent(const std::string& agent_id) {
    return query_events("SELECT id, timestamp, event_type, agent_id, data FROM event_log "
                        "WHERE agent_id = ?1 ORDER BY id ASC", &agent_id, 0);
}

std::vector<StoredEvent> SqliteStore::events_by_type(const std::string& event_type) {
    return query_events("SELECT id, timestamp, event_type, agent_id, data FROM event_log "
                        "WHERE event_type = ?1 ORDER BY id ASC", &event_type, 0);
}

std::vector<StoredEvent> SqliteStore::recent_events(size_t limit) {
    return query_events("SELECT id, timestamp, event_type, agent_id, data FROM event_log "
                        "ORDER BY id DESC LIMIT ?1", nullptr, static_cast<int64_t>(limit));
}

core::Status SqliteStore::index_artifact(const ArtifactRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "INSERT OR REPLACE INTO artifacts (id, kind, path, agent_id, created_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5)");
    int64_t created = record.created_at != 0 ? record.created_at : now_seconds();
    if (!stmt.bind(1, record.id).bind(2, record.kind).bind(3, record.path)
             .bind(4, record.agent_id).bind(5, created).run()) {
        return core::Status::fail(core::ErrorCode::BACKEND, "index_artifact failed: " + stmt.error());
    }
    return core::Status::ok();
}

std::vector<ArtifactRecord> SqliteStore::artifacts_for_agent(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ArtifactRecord> records;
    Statement stmt(db_, "SELECT id, kind, path, agent_id, created_at FROM artifacts "
                        "WHERE agent_id = ?1 ORDER BY created_at ASC, id ASC");
    stmt.bind(1, agent_id);
    while (stmt.step() == SQLITE_ROW) {
        ArtifactRecord r;
        r.id = stmt.column_text(0);
        r.kind = stmt.column_text(1);
        r.path = stmt.column_text(2);
        r.agent_id = stmt.column_text(3);
        r.created_at = stmt.column_int64(4);
        records.push_back(std::move(r));
    }
    return records;
}

} // namespace warden::state
