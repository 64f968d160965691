#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "dict_types.hpp"

namespace dictlsp {

// Word -> usage score, loaded once at startup.
//
// The source format follows the file suffix:
// - ".db":   SQLite table word_frequencies(word, frequency)
// - ".json": object mapping word -> number
// - other:   whitespace separated "word count" lines ('#' starts a comment)
class FrequencyTable {
public:
    bool load(const fs::path& path);

    // Record a score; keys are normalized and the larger score wins.
    void add(const std::string& word, int64_t score);

    // kUnrankedScore when the word has no record
    int64_t score(const std::string& word) const;

    const std::unordered_map<std::string, int64_t>& scores() const { return scores_; }
    size_t size() const { return scores_.size(); }
    bool empty() const { return scores_.empty(); }

private:
    std::unordered_map<std::string, int64_t> scores_;

    bool load_sqlite(const fs::path& path);
    bool load_json(const fs::path& path);
    bool load_text(const fs::path& path);
};

} // namespace dictlsp
