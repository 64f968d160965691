#include "dict_frequency.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "dict_sqlite.hpp"
#include "dict_text.hpp"

namespace dictlsp {

// Pick the loader from the file suffix
bool FrequencyTable::load(const fs::path& path) {
    scores_.clear();

    std::string ext = to_lower_ascii(path.extension().string());
    bool ok = false;
    if (ext == ".db") ok = load_sqlite(path);
    else if (ext == ".json") ok = load_json(path);
    else ok = load_text(path);

    if (ok) {
        std::cerr << "[load] frequency table: " << scores_.size() << " words from "
                  << path.string() << "\n";
    }
    return ok;
}

void FrequencyTable::add(const std::string& word, int64_t score) {
    std::string key = normalize_word(word);
    if (key.empty()) return;
    auto it = scores_.find(key);
    if (it == scores_.end()) scores_.emplace(std::move(key), score);
    else if (score > it->second) it->second = score;
}

int64_t FrequencyTable::score(const std::string& word) const {
    auto it = scores_.find(normalize_word(word));
    if (it == scores_.end()) return kUnrankedScore;
    return it->second;
}

bool FrequencyTable::load_sqlite(const fs::path& path) {
    sqlite3* db = open_sqlite_readonly(path);
    if (!db) return false;

    bool ok = true;
    {
        SqliteStatement st(db, "SELECT word, frequency FROM word_frequencies");
        if (!st.ok()) {
            std::cerr << "[load] word_frequencies table missing in " << path.string() << ": "
                      << sqlite3_errmsg(db) << "\n";
            ok = false;
        } else {
            int rc;
            while ((rc = st.step()) == SQLITE_ROW) {
                if (st.column_is_null(0) || st.column_is_null(1)) continue;
                add(st.column_text(0), st.column_int(1));
            }
            if (rc != SQLITE_DONE) {
                std::cerr << "[load] reading word_frequencies failed: " << sqlite3_errmsg(db) << "\n";
                ok = false;
            }
        }
    }
    sqlite3_close(db);
    return ok;
}

bool FrequencyTable::load_json(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[load] cannot open frequency file: " << path.string() << "\n";
        return false;
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        std::cerr << "[load] malformed frequency JSON " << path.string() << ": " << e.what() << "\n";
        return false;
    }

    if (!j.is_object()) {
        std::cerr << "[load] frequency JSON must be an object of word -> number\n";
        return false;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const json& v = it.value();
        if (v.is_number_integer() || v.is_number_unsigned()) {
            add(it.key(), v.get<int64_t>());
        } else if (v.is_number_float()) {
            add(it.key(), (int64_t)v.get<double>());
        } else {
            std::cerr << "[load] non-numeric frequency for '" << it.key() << "' in "
                      << path.string() << "\n";
            return false;
        }
    }
    return true;
}

bool FrequencyTable::load_text(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[load] cannot open frequency file: " << path.string() << "\n";
        return false;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') continue;

        std::istringstream ss(line);
        std::string word;
        std::string rest;
        long long count = 0;
        // Exactly "<word> <count>"; anything else makes the whole file unusable
        if (!(ss >> word >> count) || (ss >> rest)) {
            std::cerr << "[load] malformed frequency line " << line_no << " in "
                      << path.string() << ": " << line << "\n";
            return false;
        }
        add(word, (int64_t)count);
    }
    return true;
}

} // namespace dictlsp
