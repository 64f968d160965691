#include "dict_sqlite.hpp"

#include <iostream>

namespace dictlsp {

SqliteStatement::SqliteStatement(sqlite3* db, const char* sql) {
    prepare_rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    if (prepare_rc_ != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void SqliteStatement::bind_text(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), (int)value.size(), SQLITE_TRANSIENT);
}

void SqliteStatement::bind_int(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, (sqlite3_int64)value);
}

int SqliteStatement::step() {
    return sqlite3_step(stmt_);
}

std::string SqliteStatement::column_text(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_BLOB) {
        const void* p = sqlite3_column_blob(stmt_, col);
        int n = sqlite3_column_bytes(stmt_, col);
        if (!p || n <= 0) return {};
        return std::string((const char*)p, (size_t)n);
    }
    const unsigned char* raw = sqlite3_column_text(stmt_, col);
    if (!raw) return {};
    return std::string(reinterpret_cast<const char*>(raw),
                       (size_t)sqlite3_column_bytes(stmt_, col));
}

int64_t SqliteStatement::column_int(int col) const {
    return (int64_t)sqlite3_column_int64(stmt_, col);
}

bool SqliteStatement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

sqlite3* open_sqlite_readonly(const fs::path& path) {
    if (!fs::exists(path)) {
        std::cerr << "[load] database not found: " << path.string() << "\n";
        return nullptr;
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.string().c_str(), &db,
                             SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "[load] cannot open database " << path.string() << ": "
                  << (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)) << "\n";
        sqlite3_close(db);
        return nullptr;
    }

    // Ride out short write locks held by whoever maintains the file
    sqlite3_busy_timeout(db, 250);
    return db;
}

} // namespace dictlsp
