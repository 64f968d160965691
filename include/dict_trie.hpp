#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dict_types.hpp"

namespace dictlsp {

// Trie-based prefix index over the vocabulary.
//
// Notes:
// - Edges are Unicode code points; keys are normalized on insert.
// - Scores rank suggestions (higher score first, ties lexicographic).
// - Each trie node stores a small "top list" so small lookups are O(|prefix|).
// - Built once during startup; all query methods are const and lock-free.
class PrefixTrie {
public:
    static constexpr uint32_t kRoot = 0;
    static constexpr int32_t kNoTerm = -1;

    struct Node {
        std::vector<std::pair<char32_t, uint32_t>> next; // sorted by code point
        std::vector<uint32_t> top;                       // term indices, best first
        int32_t term = kNoTerm;
    };

    PrefixTrie();

    void clear();
    bool empty() const;
    size_t size() const { return terms_.size(); }

    void build(const std::unordered_map<std::string, int64_t>& term_to_score,
               size_t max_candidates_per_prefix = 10);

    // Adds a word or raises the score of an existing one.
    void insert(const std::string& word, int64_t score);

    bool contains(const std::string& word) const;
    int64_t score_of(const std::string& word) const;

    // All words starting with prefix, best score first, at most limit items.
    std::vector<TrieHit> complete_by_prefix(const std::string& prefix, size_t limit) const;

    // Walks the words under prefix in code point order; stop by returning false.
    void visit_prefix(const std::string& prefix,
                      const std::function<bool(const std::string&, int64_t)>& fn) const;

    const Node& node(uint32_t id) const { return nodes_[id]; }
    const std::string& term(uint32_t index) const { return terms_[index]; }
    int64_t term_score(uint32_t index) const { return scores_[index]; }

private:
    std::vector<Node> nodes_;
    std::vector<std::string> terms_;
    std::vector<int64_t> scores_;
    size_t max_top_ = 10;

    bool better(uint32_t a, uint32_t b) const;
    void update_top(std::vector<uint32_t>& top, uint32_t term_index) const;
    bool lookup_node(const std::u32string& prefix, uint32_t& node_id) const;
    uint32_t child_or_create(uint32_t node, char32_t c);
    void collect_terms(uint32_t node, std::vector<uint32_t>& out) const;
    bool visit_node(uint32_t node,
                    const std::function<bool(const std::string&, int64_t)>& fn) const;
};

} // namespace dictlsp
