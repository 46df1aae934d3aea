#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace warden::state {

// RAII wrapper over a prepared sqlite3 statement. Bind indices are 1-based.
class Statement {
public:
    Statement(sqlite3* db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }
    const std::string& error() const { return error_; }

    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, int64_t value);
    Statement& bind_blob(int index, const std::vector<uint8_t>& value);

    // SQLITE_ROW, SQLITE_DONE or an error code
    int step();

    // Step until SQLITE_DONE; false on error
    bool run();

    std::string column_text(int col) const;
    int64_t column_int64(int col) const;
    std::vector<uint8_t> column_blob(int col) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string error_;
};

// Execute one or more statements without results
bool exec_sql(sqlite3* db, const char* sql, std::string& error);

} // namespace warden::state
