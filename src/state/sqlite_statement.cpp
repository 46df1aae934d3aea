#include "state/sqlite_statement.hpp"

namespace warden::state {

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        error_ = sqlite3_errmsg(db_);
        stmt_ = nullptr;
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement& Statement::bind(int index, const std::string& value) {
    if (stmt_) {
        sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    if (stmt_) {
        sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    }
    return *this;
}

Statement& Statement::bind_blob(int index, const std::vector<uint8_t>& value) {
    if (stmt_) {
        sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }
    return *this;
}

int Statement::step() {
    if (!stmt_) {
        return SQLITE_MISUSE;
    }
    int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        error_ = sqlite3_errmsg(db_);
    }
    return rc;
}

bool Statement::run() {
    int rc;
    while ((rc = step()) == SQLITE_ROW) {
    }
    return rc == SQLITE_DONE;
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

int64_t Statement::column_int64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

std::vector<uint8_t> Statement::column_blob(int col) const {
    const void* data = sqlite3_column_blob(stmt_, col);
    int size = sqlite3_column_bytes(stmt_, col);
    if (!data || size <= 0) {
        return {};
    }
    const auto* bytes = static_cast<const uint8_t*>(data);
    return std::vector<uint8_t>(bytes, bytes + size);
}

bool exec_sql(sqlite3* db, const char* sql, std::string& error) {
    char* message = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        error = message ? message : sqlite3_errmsg(db);
        sqlite3_free(message);
        return false;
    }
    return true;
}

} // namespace warden::state
