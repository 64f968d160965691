#pragma once

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <string>

#include "dict_types.hpp"

namespace dictlsp::fixtures {

// Scratch directory removed at scope exit
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("dictlsp_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }

    fs::path write(const std::string& name, const std::string& content) const {
        fs::path p = path_ / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

private:
    fs::path path_;
};

inline bool exec_sql(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    sqlite3_free(err);
    return rc == SQLITE_OK;
}

// Creates a database with the dictionary and frequency schemas and runs sql
inline fs::path make_sqlite_db(const TempDir& dir, const std::string& name, const std::string& sql) {
    fs::path p = dir.path() / name;
    sqlite3* db = nullptr;
    sqlite3_open(p.string().c_str(), &db);
    exec_sql(db, sql);
    sqlite3_close(db);
    return p;
}

constexpr const char* kDictionarySchema =
    "CREATE TABLE words(id INTEGER PRIMARY KEY, word TEXT NOT NULL);"
    "CREATE INDEX words_word ON words(word);"
    "CREATE TABLE parts_of_speech(id INTEGER PRIMARY KEY, name TEXT NOT NULL);"
    "CREATE TABLE definitions(word_id INTEGER, pos_id INTEGER, definition TEXT);";

// Small vocabulary shared by the store, engine and session tests
constexpr const char* kSampleJson = R"({
  "passion": {
    "noun": [
      "strong and barely controllable emotion",
      {"definition": "an intense desire or enthusiasm for something",
       "example": "a passion for football"}
    ]
  },
  "passing": { "adjective": ["going past"], "noun": ["the end of something"] },
  "passive": { "adjective": ["accepting what happens without resistance"] },
  "Hello": { "interjection": ["used as a greeting"] },
  "well-known": { "adjective": ["known widely"] }
})";

constexpr const char* kSampleFreq =
    "passion 10\n"
    "passing 50\n"
    "passive 5\n"
    "hello 2000\n";

} // namespace dictlsp::fixtures
