#pragma once

#include <string>
#include <vector>

#include "dict_trie.hpp"
#include "dict_types.hpp"

namespace dictlsp {

// Levenshtein distance over code points (insert, delete, substitute).
int levenshtein_distance(const std::string& a, const std::string& b);

// Bounded edit-distance search over a PrefixTrie.
//
// The trie is walked depth first with one DP row per depth. A subtree is
// skipped as soon as the smallest value in its row exceeds max_distance,
// since no continuation can bring the distance back down.
class FuzzyMatcher {
public:
    explicit FuzzyMatcher(const PrefixTrie& trie) : trie_(trie) {}

    // Appends every word within max_distance of query to out, in code point
    // order. Returns false if cancel was raised before the walk finished.
    bool match(const std::string& query, int max_distance,
               std::vector<FuzzyCandidate>& out,
               const CancelFlag* cancel = nullptr) const;

private:
    struct Walk {
        std::u32string query;
        int max_distance = 0;
        std::vector<int> rows; // row d lives at [d * width, (d + 1) * width)
        size_t width = 0;
        std::vector<FuzzyCandidate>* out = nullptr;
        const CancelFlag* cancel = nullptr;
        bool cancelled = false;
    };

    const PrefixTrie& trie_;

    void walk(uint32_t node, size_t depth, Walk& w) const;
};

} // namespace dictlsp
