#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

#include "dict_types.hpp"

namespace dictlsp {

// Owns a prepared statement; finalized on scope exit.
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const char* sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    bool ok() const { return stmt_ != nullptr; }
    int prepare_code() const { return prepare_rc_; }

    void bind_text(int index, const std::string& value);
    void bind_int(int index, int64_t value);

    // SQLITE_ROW, SQLITE_DONE or an error code
    int step();

    // Column as UTF-8 text; blobs are taken as raw bytes, NULL as ""
    std::string column_text(int col) const;
    int64_t column_int(int col) const;
    bool column_is_null(int col) const;

private:
    sqlite3_stmt* stmt_ = nullptr;
    int prepare_rc_ = SQLITE_OK;
};

// Open a database read-only. Returns nullptr (and logs) on failure.
sqlite3* open_sqlite_readonly(const fs::path& path);

// True for codes that mean "try again later" rather than a broken database
inline bool is_transient_sqlite_error(int rc) {
    int primary = rc & 0xFF;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

} // namespace dictlsp
