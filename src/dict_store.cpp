#include "dict_store.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <unordered_set>

#include "dict_fuzzy.hpp"
#include "dict_sqlite.hpp"
#include "dict_text.hpp"

namespace dictlsp {

// ---------------------------------------------------------------- JSON

bool JsonDictionary::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[load] cannot open dictionary: " << path.string() << "\n";
        return false;
    }

    json doc;
    try {
        in >> doc;
    } catch (const std::exception& e) {
        std::cerr << "[load] malformed dictionary JSON " << path.string() << ": " << e.what() << "\n";
        return false;
    }
    return load_json(doc);
}

// Validate the whole document before keeping any of it
bool JsonDictionary::load_json(const json& doc) {
    if (!doc.is_object()) {
        std::cerr << "[load] dictionary JSON must be an object of words\n";
        return false;
    }

    std::unordered_map<std::string, DictionaryEntry> entries;
    entries.reserve(doc.size());

    for (auto w = doc.begin(); w != doc.end(); ++w) {
        const json& parts = w.value();
        if (!parts.is_object()) {
            std::cerr << "[load] entry '" << w.key() << "' is not an object of parts of speech\n";
            return false;
        }

        std::string key = normalize_word(w.key());
        if (key.empty()) continue;

        DictionaryEntry& entry = entries[key];
        entry.word = key;

        for (auto p = parts.begin(); p != parts.end(); ++p) {
            if (!p.value().is_array()) {
                std::cerr << "[load] senses of '" << w.key() << "' / '" << p.key()
                          << "' are not an array\n";
                return false;
            }

            std::vector<Sense>& senses = entry.senses[p.key()];
            for (const auto& item : p.value()) {
                Sense s;
                if (item.is_string()) {
                    s.definition = item.get<std::string>();
                } else if (item.is_object() && item.contains("definition") &&
                           item["definition"].is_string()) {
                    s.definition = item["definition"].get<std::string>();
                    if (item.contains("example") && item["example"].is_string())
                        s.example = item["example"].get<std::string>();
                } else {
                    std::cerr << "[load] bad sense under '" << w.key() << "' / '" << p.key() << "'\n";
                    return false;
                }
                senses.push_back(std::move(s));
            }
        }
    }

    entries_ = std::move(entries);
    std::cerr << "[load] JSON dictionary: " << entries_.size() << " words\n";
    return true;
}

std::optional<DictionaryEntry> JsonDictionary::lookup(const std::string& word) const {
    auto it = entries_.find(normalize_word(word));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void JsonDictionary::for_each_word(const std::function<void(const std::string&)>& fn) const {
    for (const auto& kv : entries_) fn(kv.first);
}

// ---------------------------------------------------------------- SQLite

static const char* kLookupSql =
    "SELECT p.name, d.definition FROM words w "
    "JOIN definitions d ON d.word_id = w.id "
    "JOIN parts_of_speech p ON p.id = d.pos_id "
    "WHERE w.word = ?1 COLLATE NOCASE "
    "ORDER BY p.name, d.rowid";

// ASCII case-insensitive, like kLookupSql
static const char* kPrefixSql =
    "SELECT DISTINCT word FROM words "
    "WHERE word >= ?1 COLLATE NOCASE AND word < ?2 COLLATE NOCASE";

static const char* kFuzzySql =
    "SELECT DISTINCT word FROM words "
    "WHERE length(word) BETWEEN ?1 AND ?2 "
    "AND (lower(substr(word, 1, 1)) = ?3 OR lower(substr(word, -1, 1)) = ?4)";

[[noreturn]] static void throw_backend(sqlite3* db, const char* what) {
    throw BackendError(std::string(what) + ": " + sqlite3_errmsg(db));
}

SqliteDictionary::~SqliteDictionary() {
    close();
}

SqliteDictionary::SqliteDictionary(SqliteDictionary&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.mtx_);
    db_ = other.db_;
    other.db_ = nullptr;
}

SqliteDictionary& SqliteDictionary::operator=(SqliteDictionary&& other) noexcept {
    if (this != &other) {
        close();
        std::lock_guard<std::mutex> lock(other.mtx_);
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

void SqliteDictionary::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// Open and check that the three tables answer the columns we query
bool SqliteDictionary::open(const fs::path& path) {
    close();

    sqlite3* db = open_sqlite_readonly(path);
    if (!db) return false;

    const char* probes[] = {
        "SELECT id, word FROM words LIMIT 1",
        "SELECT word_id, pos_id, definition FROM definitions LIMIT 1",
        "SELECT id, name FROM parts_of_speech LIMIT 1",
    };
    for (const char* sql : probes) {
        SqliteStatement st(db, sql);
        if (!st.ok()) {
            std::cerr << "[load] dictionary schema check failed for " << path.string() << ": "
                      << sqlite3_errmsg(db) << "\n";
            sqlite3_close(db);
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(mtx_);
    db_ = db;
    return true;
}

std::optional<DictionaryEntry> SqliteDictionary::lookup(const std::string& word) const {
    std::string key = normalize_word(word);
    if (key.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mtx_);
    if (!db_) throw BackendError("dictionary database is closed");

    SqliteStatement st(db_, kLookupSql);
    if (!st.ok()) throw_backend(db_, "prepare lookup");
    st.bind_text(1, key);

    DictionaryEntry entry;
    entry.word = key;
    int rc;
    while ((rc = st.step()) == SQLITE_ROW) {
        Sense s;
        s.definition = st.column_text(1);
        entry.senses[st.column_text(0)].push_back(std::move(s));
    }
    if (rc != SQLITE_DONE) throw_backend(db_, "lookup");

    if (entry.senses.empty()) return std::nullopt;
    return entry;
}

std::vector<TrieHit> SqliteDictionary::complete_prefix(
    const std::string& prefix, size_t limit,
    const std::function<int64_t(const std::string&)>& score_of) const {
    std::vector<TrieHit> out;
    std::string key = normalize_word(prefix);
    if (key.empty() || limit == 0) return out;

    // Every UTF-8 string starting with key sorts below key + U+10FFFF
    std::string upper = key + "\xF4\x8F\xBF\xBF";

    std::vector<std::string> rows;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!db_) throw BackendError("dictionary database is closed");

        SqliteStatement st(db_, kPrefixSql);
        if (!st.ok()) throw_backend(db_, "prepare prefix query");
        st.bind_text(1, key);
        st.bind_text(2, upper);

        int rc;
        while ((rc = st.step()) == SQLITE_ROW) rows.push_back(st.column_text(0));
        if (rc != SQLITE_DONE) throw_backend(db_, "prefix query");
    }

    // Rank every match by frequency before cutting to limit
    std::unordered_set<std::string> seen;
    for (auto& r : rows) {
        std::string w = normalize_word(r);
        if (w.empty() || w.compare(0, key.size(), key) != 0) continue;
        if (!seen.insert(w).second) continue;
        int64_t s = score_of ? score_of(w) : kUnrankedScore;
        out.push_back({std::move(w), s});
    }

    size_t m = std::min(limit, out.size());
    std::partial_sort(out.begin(), out.begin() + m, out.end(),
                      [](const TrieHit& a, const TrieHit& b) {
                          if (a.score != b.score) return a.score > b.score;
                          return a.word < b.word;
                      });
    out.resize(m);
    return out;
}

std::vector<FuzzyCandidate> SqliteDictionary::fuzzy_candidates(const std::string& word,
                                                               int max_distance) const {
    std::vector<FuzzyCandidate> out;
    std::string key = normalize_word(word);
    if (key.empty() || max_distance < 0) return out;

    std::u32string cps = utf8_decode(key);
    int64_t len = (int64_t)cps.size();
    std::string first, last;
    utf8_append(first, cps.front());
    utf8_append(last, cps.back());

    std::vector<std::string> rows;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!db_) throw BackendError("dictionary database is closed");

        SqliteStatement st(db_, kFuzzySql);
        if (!st.ok()) throw_backend(db_, "prepare fuzzy query");
        st.bind_int(1, std::max<int64_t>(1, len - max_distance));
        st.bind_int(2, len + max_distance);
        st.bind_text(3, first);
        st.bind_text(4, last);

        int rc;
        while ((rc = st.step()) == SQLITE_ROW) rows.push_back(st.column_text(0));
        if (rc != SQLITE_DONE) throw_backend(db_, "fuzzy query");
    }

    for (auto& r : rows) {
        std::string w = normalize_word(r);
        int d = levenshtein_distance(key, w);
        if (d <= max_distance) out.push_back({std::move(w), d, kUnrankedScore});
    }

    std::sort(out.begin(), out.end(), [](const FuzzyCandidate& a, const FuzzyCandidate& b) {
        return a.word < b.word;
    });
    out.erase(std::unique(out.begin(), out.end(),
                          [](const FuzzyCandidate& a, const FuzzyCandidate& b) {
                              return a.word == b.word;
                          }),
              out.end());
    return out;
}

size_t SqliteDictionary::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!db_) return 0;
    SqliteStatement st(db_, "SELECT COUNT(*) FROM words");
    if (!st.ok() || st.step() != SQLITE_ROW) return 0;
    return (size_t)st.column_int(0);
}

// ---------------------------------------------------------------- store

bool DictionaryStore::load(const fs::path& path) {
    if (path.empty()) {
        std::cerr << "[load] no dictionary path configured\n";
        return false;
    }

    if (to_lower_ascii(path.extension().string()) == ".db") {
        SqliteDictionary db;
        if (!db.open(path)) return false;
        backend_ = std::move(db);
        std::cerr << "[load] SQLite dictionary: " << path.string() << "\n";
        return true;
    }

    JsonDictionary dict;
    if (!dict.load(path)) return false;
    backend_ = std::move(dict);
    return true;
}

std::optional<DictionaryEntry> DictionaryStore::lookup(const std::string& word) const {
    if (auto* j = std::get_if<JsonDictionary>(&backend_)) return j->lookup(word);
    if (auto* s = std::get_if<SqliteDictionary>(&backend_)) return s->lookup(word);
    return std::nullopt;
}

bool DictionaryStore::has_key_iteration() const {
    return std::holds_alternative<JsonDictionary>(backend_);
}

void DictionaryStore::for_each_word(const std::function<void(const std::string&)>& fn) const {
    if (auto* j = std::get_if<JsonDictionary>(&backend_)) j->for_each_word(fn);
}

const char* DictionaryStore::backend_name() const {
    if (std::holds_alternative<JsonDictionary>(backend_)) return "json";
    if (std::holds_alternative<SqliteDictionary>(backend_)) return "sqlite";
    return "none";
}

size_t DictionaryStore::size() const {
    if (auto* j = std::get_if<JsonDictionary>(&backend_)) return j->size();
    if (auto* s = std::get_if<SqliteDictionary>(&backend_)) return s->size();
    return 0;
}

} // namespace dictlsp
