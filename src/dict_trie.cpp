#include "dict_trie.hpp"

#include <algorithm>

#include "dict_text.hpp"

namespace dictlsp {

PrefixTrie::PrefixTrie() {
    clear();
}

void PrefixTrie::clear() {
    nodes_.clear();
    terms_.clear();
    scores_.clear();
    nodes_.push_back(Node{}); // root
    max_top_ = 10;
}

bool PrefixTrie::empty() const {
    return terms_.empty();
}

// Ordering used everywhere in the trie: score desc, then word asc
bool PrefixTrie::better(uint32_t a, uint32_t b) const {
    if (scores_[a] != scores_[b]) return scores_[a] > scores_[b];
    return terms_[a] < terms_[b];
}

void PrefixTrie::update_top(std::vector<uint32_t>& top, uint32_t term_index) const {
    // De-duplicate by term index; the score may have been raised
    if (std::find(top.begin(), top.end(), term_index) == top.end()) {
        top.push_back(term_index);
    }

    std::stable_sort(top.begin(), top.end(), [&](uint32_t a, uint32_t b) {
        return better(a, b);
    });

    if (top.size() > max_top_) top.resize(max_top_);
}

uint32_t PrefixTrie::child_or_create(uint32_t node, char32_t c) {
    auto& next = nodes_[node].next;
    auto it = std::lower_bound(next.begin(), next.end(), c,
                               [](const std::pair<char32_t, uint32_t>& e, char32_t v) {
                                   return e.first < v;
                               });
    if (it != next.end() && it->first == c) return it->second;

    uint32_t new_node = (uint32_t)nodes_.size();
    next.insert(it, {c, new_node});
    nodes_.push_back(Node{}); // invalidates `next`, not used after this
    return new_node;
}

void PrefixTrie::insert(const std::string& word, int64_t score) {
    std::u32string cps = utf8_decode(normalize_word(word));
    if (cps.empty()) return;

    uint32_t node = kRoot;
    for (char32_t c : cps) node = child_or_create(node, c);

    uint32_t term_index = 0;
    if (nodes_[node].term == kNoTerm) {
        term_index = (uint32_t)terms_.size();
        terms_.push_back(utf8_encode(cps));
        scores_.push_back(score);
        nodes_[node].term = (int32_t)term_index;
    } else {
        // Terminal keeps the best score seen for this word
        term_index = (uint32_t)nodes_[node].term;
        if (score <= scores_[term_index]) return;
        scores_[term_index] = score;
    }

    // Refresh top lists along the path, root included
    uint32_t cur = kRoot;
    update_top(nodes_[cur].top, term_index);
    for (char32_t c : cps) {
        cur = child_or_create(cur, c);
        update_top(nodes_[cur].top, term_index);
    }
}

void PrefixTrie::build(const std::unordered_map<std::string, int64_t>& term_to_score,
                       size_t max_candidates_per_prefix) {
    clear();
    max_top_ = std::max<size_t>(1, max_candidates_per_prefix);

    // Normalize first so case variants collapse into the best score
    std::unordered_map<std::string, int64_t> normalized;
    normalized.reserve(term_to_score.size());
    for (const auto& kv : term_to_score) {
        std::string t = normalize_word(kv.first);
        if (t.empty()) continue;
        auto it = normalized.find(t);
        if (it == normalized.end()) normalized.emplace(std::move(t), kv.second);
        else if (kv.second > it->second) it->second = kv.second;
    }

    // Insert best-first so every top list fills in order
    std::vector<std::pair<std::string, int64_t>> order(normalized.begin(), normalized.end());
    std::sort(order.begin(), order.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    terms_.reserve(order.size());
    scores_.reserve(order.size());
    nodes_.reserve(1 + order.size() * 3);

    for (const auto& kv : order) insert(kv.first, kv.second);
}

bool PrefixTrie::lookup_node(const std::u32string& prefix, uint32_t& node_id) const {
    node_id = kRoot;
    for (char32_t c : prefix) {
        const auto& next = nodes_[node_id].next;
        auto it = std::lower_bound(next.begin(), next.end(), c,
                                   [](const std::pair<char32_t, uint32_t>& e, char32_t v) {
                                       return e.first < v;
                                   });
        if (it == next.end() || it->first != c) return false;
        node_id = it->second;
    }
    return true;
}

bool PrefixTrie::contains(const std::string& word) const {
    uint32_t node = kRoot;
    if (!lookup_node(utf8_decode(normalize_word(word)), node)) return false;
    return node != kRoot && nodes_[node].term != kNoTerm;
}

int64_t PrefixTrie::score_of(const std::string& word) const {
    uint32_t node = kRoot;
    if (!lookup_node(utf8_decode(normalize_word(word)), node)) return kUnrankedScore;
    if (nodes_[node].term == kNoTerm) return kUnrankedScore;
    return scores_[(uint32_t)nodes_[node].term];
}

void PrefixTrie::collect_terms(uint32_t node, std::vector<uint32_t>& out) const {
    std::vector<uint32_t> stack{node};
    while (!stack.empty()) {
        uint32_t cur = stack.back();
        stack.pop_back();
        if (nodes_[cur].term != kNoTerm) out.push_back((uint32_t)nodes_[cur].term);
        for (const auto& e : nodes_[cur].next) stack.push_back(e.second);
    }
}

std::vector<TrieHit> PrefixTrie::complete_by_prefix(const std::string& prefix,
                                                    size_t limit) const {
    std::vector<TrieHit> out;
    if (empty() || limit == 0) return out;

    std::u32string p = utf8_decode(normalize_word(prefix));
    if (p.empty()) return out;

    uint32_t node = kRoot;
    if (!lookup_node(p, node)) return out;

    // The cached top list is exact when it was never trimmed or covers limit
    const auto& top = nodes_[node].top;
    if (limit <= top.size() || top.size() < max_top_) {
        size_t m = std::min(limit, top.size());
        out.reserve(m);
        for (size_t i = 0; i < m; i++) out.push_back({terms_[top[i]], scores_[top[i]]});
        return out;
    }

    // Otherwise rank the whole subtree
    std::vector<uint32_t> all;
    collect_terms(node, all);
    size_t m = std::min(limit, all.size());
    std::partial_sort(all.begin(), all.begin() + m, all.end(),
                      [&](uint32_t a, uint32_t b) { return better(a, b); });

    out.reserve(m);
    for (size_t i = 0; i < m; i++) out.push_back({terms_[all[i]], scores_[all[i]]});
    return out;
}

bool PrefixTrie::visit_node(uint32_t node,
                            const std::function<bool(const std::string&, int64_t)>& fn) const {
    const Node& n = nodes_[node];
    if (n.term != kNoTerm) {
        if (!fn(terms_[(uint32_t)n.term], scores_[(uint32_t)n.term])) return false;
    }
    for (const auto& e : n.next) {
        if (!visit_node(e.second, fn)) return false;
    }
    return true;
}

void PrefixTrie::visit_prefix(const std::string& prefix,
                              const std::function<bool(const std::string&, int64_t)>& fn) const {
    uint32_t node = kRoot;
    if (!lookup_node(utf8_decode(normalize_word(prefix)), node)) return;
    visit_node(node, fn);
}

} // namespace dictlsp
