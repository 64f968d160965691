#include "dict_ranker.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

namespace dictlsp {

int frequency_tier(int64_t score) {
    if (score < 0) return -1;
    int tier = 1;
    while (score >= 10) {
        score /= 10;
        tier++;
    }
    return tier;
}

std::vector<CompletionItem> rank_completions(const std::vector<TrieHit>& prefix_hits,
                                             const std::vector<FuzzyCandidate>& fuzzy_hits,
                                             size_t max_items) {
    std::vector<CompletionItem> items;
    if (max_items == 0) return items;

    items.reserve(prefix_hits.size() + fuzzy_hits.size());
    std::unordered_map<std::string, size_t> seen;
    seen.reserve(items.capacity());

    for (const auto& h : prefix_hits) {
        if (!seen.emplace(h.word, items.size()).second) continue;
        items.push_back({h.word, MatchSource::Prefix, 0, h.score});
    }

    for (const auto& f : fuzzy_hits) {
        auto it = seen.find(f.word);
        if (it != seen.end()) {
            // Fuzzy duplicate of a prefix hit stays a prefix hit; among
            // fuzzy duplicates keep the closest
            CompletionItem& existing = items[it->second];
            if (existing.source == MatchSource::Fuzzy && f.distance < existing.distance) {
                existing.distance = f.distance;
            }
            continue;
        }
        seen.emplace(f.word, items.size());
        items.push_back({f.word, MatchSource::Fuzzy, f.distance, f.score});
    }

    auto rank_before = [](const CompletionItem& a, const CompletionItem& b) {
        int ta = frequency_tier(a.score);
        int tb = frequency_tier(b.score);
        if (ta != tb) return ta > tb;
        if (a.source != b.source) return a.source == MatchSource::Prefix;
        if (a.score != b.score) return a.score > b.score;
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.word < b.word;
    };

    size_t m = std::min(max_items, items.size());
    std::partial_sort(items.begin(), items.begin() + m, items.end(), rank_before);
    items.resize(m);
    return items;
}

} // namespace dictlsp
