#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dictlsp {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Score given to vocabulary words that have no frequency record.
constexpr int64_t kUnrankedScore = std::numeric_limits<int64_t>::min();

// Set by the transport when the client cancels a request.
using CancelFlag = std::atomic<bool>;

inline bool is_cancelled(const CancelFlag* cancel) {
    return cancel != nullptr && cancel->load(std::memory_order_relaxed);
}

struct Sense {
    std::string definition;
    std::string example; // empty when the source has none
};

struct DictionaryEntry {
    std::string word; // normalized key
    std::map<std::string, std::vector<Sense>> senses; // part of speech -> senses
};

// LSP position: zero-based line, code point offset within the line
struct Position {
    uint32_t line = 0;
    uint32_t character = 0;
};

struct Range {
    Position start;
    Position end;
};

struct WordAt {
    std::string word;
    Range span;
};

struct TrieHit {
    std::string word;
    int64_t score = kUnrankedScore;
};

struct FuzzyCandidate {
    std::string word;
    int distance = 0;
    int64_t score = kUnrankedScore;
};

enum class MatchSource { Prefix, Fuzzy };

struct CompletionItem {
    std::string word;
    MatchSource source = MatchSource::Prefix;
    int distance = 0;
    int64_t score = kUnrankedScore;
};

// Raised by the on-disk backend when a live query fails (busy, locked, I/O).
class BackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace dictlsp
