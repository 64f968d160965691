#include "dict_fuzzy.hpp"

#include <algorithm>

#include "dict_text.hpp"

namespace dictlsp {

int levenshtein_distance(const std::string& a, const std::string& b) {
    std::u32string s = utf8_decode(a);
    std::u32string t = utf8_decode(b);
    if (s.empty()) return (int)t.size();
    if (t.empty()) return (int)s.size();

    std::vector<int> prev(t.size() + 1);
    std::vector<int> cur(t.size() + 1);
    for (size_t j = 0; j <= t.size(); j++) prev[j] = (int)j;

    for (size_t i = 1; i <= s.size(); i++) {
        cur[0] = (int)i;
        for (size_t j = 1; j <= t.size(); j++) {
            int cost = (s[i - 1] == t[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        prev.swap(cur);
    }
    return prev[t.size()];
}

bool FuzzyMatcher::match(const std::string& query, int max_distance,
                         std::vector<FuzzyCandidate>& out,
                         const CancelFlag* cancel) const {
    if (max_distance < 0 || trie_.empty()) return !is_cancelled(cancel);

    Walk w;
    w.query = utf8_decode(normalize_word(query));
    w.max_distance = max_distance;
    w.width = w.query.size() + 1;
    w.out = &out;
    w.cancel = cancel;

    // Row for the empty trie prefix: distance j to the first j query chars
    w.rows.resize(w.width * 16);
    for (size_t j = 0; j < w.width; j++) w.rows[j] = (int)j;

    walk(PrefixTrie::kRoot, 0, w);
    return !w.cancelled;
}

void FuzzyMatcher::walk(uint32_t node, size_t depth, Walk& w) const {
    // One check per trie level keeps cancellation responsive on wide searches
    if (is_cancelled(w.cancel)) {
        w.cancelled = true;
        return;
    }

    const size_t n = w.query.size();
    if (w.rows.size() < (depth + 2) * w.width) w.rows.resize((depth + 2) * w.width * 2);

    for (const auto& edge : trie_.node(node).next) {
        const char32_t c = edge.first;
        const int* prev = &w.rows[depth * w.width];
        int* cur = &w.rows[(depth + 1) * w.width];

        cur[0] = prev[0] + 1;
        int row_min = cur[0];
        for (size_t j = 1; j <= n; j++) {
            int cost = (w.query[j - 1] == c) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
            if (cur[j] < row_min) row_min = cur[j];
        }

        const PrefixTrie::Node& child = trie_.node(edge.second);
        if (child.term != PrefixTrie::kNoTerm && cur[n] <= w.max_distance) {
            uint32_t t = (uint32_t)child.term;
            w.out->push_back({trie_.term(t), cur[n], trie_.term_score(t)});
        }

        if (row_min <= w.max_distance) {
            walk(edge.second, depth + 1, w);
            if (w.cancelled) return;
        }
    }
}

} // namespace dictlsp
