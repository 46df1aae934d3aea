#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/error.hpp"

struct sqlite3;

namespace warden::state {

// Row of the append-only event_log table
struct StoredEvent {
    int64_t id = 0;
    int64_t timestamp_ms = 0;
    std::string event_type;
    std::string agent_id;
    std::string data;
};

// Row of the artifacts index
struct ArtifactRecord {
    std::string id;
    std::string kind;
    std::string path;
    std::string agent_id;
    int64_t created_at = 0;
};

// Durable key-value / event log / artifact index on a single SQLite database.
// One connection, serialized by an internal mutex.
class SqliteStore {
public:
    static constexpr int CURRENT_SCHEMA_VERSION = 2;

    ~SqliteStore();

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // Open (creating parent directories) and migrate. nullptr + error on failure.
    static std::unique_ptr<SqliteStore> open(const std::filesystem::path& path, std::string& error);
    static std::unique_ptr<SqliteStore> open_in_memory(std::string& error);

    int schema_version();

    // Key-value
    core::Status kv_set(const std::string& key, const std::string& value);
    std::optional<std::string> kv_get(const std::string& key);
    core::Status kv_erase(const std::string& key);
    std::vector<std::string> kv_keys();

    // Event log
    core::Status append_event(int64_t timestamp_ms, const std::string& event_type,
                              const std::string& agent_id, const std::string& data);
    std::vector<StoredEvent> events_for_agent(const std::string& agent_id);
    std::vector<StoredEvent> events_by_type(const std::string& event_type);
    std::vector<StoredEvent> recent_events(size_t limit);

    // Artifacts
    core::Status index_artifact(const ArtifactRecord& record);
    std::vector<ArtifactRecord> artifacts_for_agent(const std::string& agent_id);

private:
    explicit SqliteStore(sqlite3* db);

    bool migrate(std::string& error);
    int schema_version_locked();
    std::vector<StoredEvent> query_events(const char* sql, const std::string* text_arg, int64_t int_arg);

    sqlite3* db_;
    std::mutex mutex_;
};

} // namespace warden::state
