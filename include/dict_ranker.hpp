#pragma once

#include <cstdint>
#include <vector>

#include "dict_types.hpp"

namespace dictlsp {

// Coarse frequency bucket: number of decimal digits of the score.
// Unranked or negative scores fall into tier -1.
int frequency_tier(int64_t score);

// Merge prefix and fuzzy candidates into one ranked, de-duplicated list.
//
// Order: tier desc, prefix before fuzzy, score desc, distance asc, word asc.
// A word found by both sources is kept once as a prefix match.
std::vector<CompletionItem> rank_completions(const std::vector<TrieHit>& prefix_hits,
                                             const std::vector<FuzzyCandidate>& fuzzy_hits,
                                             size_t max_items);

} // namespace dictlsp
