#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <sqlite3.h>

#include "dict_types.hpp"

namespace dictlsp {

// In-memory dictionary loaded from a JSON document:
// { "word": { "pos": [ "sense" | {"definition": "...", "example": "..."} ] } }
class JsonDictionary {
public:
    bool load(const fs::path& path);
    bool load_json(const json& doc);

    std::optional<DictionaryEntry> lookup(const std::string& word) const;
    void for_each_word(const std::function<void(const std::string&)>& fn) const;
    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, DictionaryEntry> entries_;
};

// Read-only view over the words / parts_of_speech / definitions schema.
// Every query runs under one mutex; the connection is not shared.
class SqliteDictionary {
public:
    SqliteDictionary() = default;
    ~SqliteDictionary();

    SqliteDictionary(const SqliteDictionary&) = delete;
    SqliteDictionary& operator=(const SqliteDictionary&) = delete;
    SqliteDictionary(SqliteDictionary&& other) noexcept;
    SqliteDictionary& operator=(SqliteDictionary&& other) noexcept;

    bool open(const fs::path& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Throws BackendError when the database cannot answer.
    std::optional<DictionaryEntry> lookup(const std::string& word) const;

    // Words starting with prefix (case-insensitive), the limit best by
    // score_of, then alphabetical.
    std::vector<TrieHit> complete_prefix(const std::string& prefix, size_t limit,
                                         const std::function<int64_t(const std::string&)>& score_of) const;

    // Words within max_distance, pre-filtered by length and first letter in SQL.
    std::vector<FuzzyCandidate> fuzzy_candidates(const std::string& word, int max_distance) const;

    size_t size() const;

private:
    sqlite3* db_ = nullptr;
    mutable std::mutex mtx_;
};

// Dictionary backend chosen once at startup from the path suffix.
class DictionaryStore {
public:
    bool load(const fs::path& path);

    // Case-insensitive exact lookup; empty when the word is absent.
    std::optional<DictionaryEntry> lookup(const std::string& word) const;

    // Only the JSON backend can enumerate its keys.
    bool has_key_iteration() const;
    void for_each_word(const std::function<void(const std::string&)>& fn) const;

    const SqliteDictionary* sqlite() const { return std::get_if<SqliteDictionary>(&backend_); }
    const char* backend_name() const;
    size_t size() const;

private:
    std::variant<std::monostate, JsonDictionary, SqliteDictionary> backend_;
};

} // namespace dictlsp
