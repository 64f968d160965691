#include "dict_engine.hpp"

#include <algorithm>
#include <iostream>

#include "dict_fuzzy.hpp"
#include "dict_ranker.hpp"
#include "dict_text.hpp"

namespace dictlsp {

// Load the configured backend, the optional frequency table and the trie
bool Engine::load() {
    if (!store.load(config.dictionary_path)) {
        std::cerr << "[load] failed to load dictionary: " << config.dictionary_path << "\n";
        return false;
    }

    if (!config.freq_path.empty()) {
        if (!freq.load(config.freq_path)) {
            std::cerr << "[load] failed to load frequency table: " << config.freq_path << "\n";
            return false;
        }
    }

    trie.clear();
    if (trie_enabled()) {
        std::unordered_map<std::string, int64_t> term_to_score = freq.scores();
        term_to_score.reserve(term_to_score.size() + store.size());

        // Dictionary words without a frequency record get the lowest priority
        store.for_each_word([&](const std::string& w) {
            term_to_score.emplace(w, kUnrankedScore);
        });

        // Build trie with top 10 candidates per prefix
        trie.build(term_to_score, 10);
        std::cerr << "[load] trie: " << trie.size() << " words\n";
    } else {
        std::cerr << "[load] " << store.backend_name()
                  << " backend: prefix and fuzzy queries go to the database\n";
    }

    clear_cache();
    return true;
}

std::optional<DictionaryEntry> Engine::lookup(const std::string& word) const {
    return store.lookup(word);
}

std::optional<DictionaryEntry> Engine::define(const std::string& word, const CancelFlag* cancel) {
    std::string key = normalize_word(word);
    if (key.empty()) return std::nullopt;

    if (auto entry = store.lookup(key)) return entry;

    // Fallback: nearest words first, then more frequent, then alphabetical
    std::vector<FuzzyCandidate> near;
    if (trie_enabled()) {
        FuzzyMatcher matcher(trie);
        if (!matcher.match(key, DEFINITION_FALLBACK_DISTANCE, near, cancel)) return std::nullopt;
    } else if (const SqliteDictionary* db = store.sqlite()) {
        near = db->fuzzy_candidates(key, DEFINITION_FALLBACK_DISTANCE);
        for (auto& c : near) c.score = freq.score(c.word);
    }

    std::sort(near.begin(), near.end(), [](const FuzzyCandidate& a, const FuzzyCandidate& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        if (a.score != b.score) return a.score > b.score;
        return a.word < b.word;
    });

    for (const auto& c : near) {
        if (is_cancelled(cancel)) return std::nullopt;
        if (c.word == key) continue;
        if (auto entry = store.lookup(c.word)) {
            stats.increment_definition_fallbacks();
            return entry;
        }
    }
    return std::nullopt;
}

// Generate cache key for a completion query
std::string Engine::make_cache_key(const std::string& token, size_t limit, int max_distance) const {
    return token + "|" + std::to_string(limit) + "|" + std::to_string(max_distance);
}

bool Engine::complete(const std::string& token, size_t limit, int max_distance,
                      std::vector<CompletionItem>& out, const CancelFlag* cancel) {
    out.clear();
    std::string q = normalize_word(token);
    if (q.empty() || limit == 0) return true;

    std::string cache_key = make_cache_key(q, limit, max_distance);
    if (get_from_cache(cache_key, out)) {
        stats.increment_completion_cache_hits();
        return true;
    }
    stats.increment_matcher_runs();

    // A one-letter token with distance >= 1 would match every short word;
    // keep at least one typed character fixed
    size_t qlen = utf8_decode(q).size();
    int d = std::min<int>(max_distance, (int)qlen - 1);
    if (qlen > MAX_FUZZY_QUERY) d = -1;

    std::vector<TrieHit> prefix;
    std::vector<FuzzyCandidate> fuzzy;
    if (trie_enabled()) {
        if (!collect_trie(q, limit, d, prefix, fuzzy, cancel)) return false;
    } else {
        collect_sqlite(q, limit, d, prefix, fuzzy);
    }
    if (is_cancelled(cancel)) return false;

    out = rank_completions(prefix, fuzzy, limit);
    put_in_cache(cache_key, out);
    return true;
}

bool Engine::collect_trie(const std::string& q, size_t limit, int max_distance,
                          std::vector<TrieHit>& prefix, std::vector<FuzzyCandidate>& fuzzy,
                          const CancelFlag* cancel) const {
    prefix = trie.complete_by_prefix(q, limit);
    if (max_distance < 0) return !is_cancelled(cancel);

    FuzzyMatcher matcher(trie);
    return matcher.match(q, max_distance, fuzzy, cancel);
}

void Engine::collect_sqlite(const std::string& q, size_t limit, int max_distance,
                            std::vector<TrieHit>& prefix, std::vector<FuzzyCandidate>& fuzzy) const {
    const SqliteDictionary* db = store.sqlite();
    if (!db) return;

    prefix = db->complete_prefix(q, limit, [this](const std::string& w) { return freq.score(w); });

    if (max_distance < 0) return;
    fuzzy = db->fuzzy_candidates(q, max_distance);
    for (auto& c : fuzzy) c.score = freq.score(c.word);
}

// Get result from cache if it exists (LRU: move to front)
bool Engine::get_from_cache(const std::string& cache_key, std::vector<CompletionItem>& out) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = cache.find(cache_key);
    if (it == cache.end()) return false;

    lru_list.erase(it->second.lru_iter);
    lru_list.push_front(cache_key);
    it->second.lru_iter = lru_list.begin();
    out = it->second.items;
    return true;
}

// Put result in cache with LRU eviction
void Engine::put_in_cache(const std::string& cache_key, const std::vector<CompletionItem>& items) {
    std::lock_guard<std::mutex> lock(mtx);

    auto it = cache.find(cache_key);
    if (it != cache.end()) {
        lru_list.erase(it->second.lru_iter);
        lru_list.push_front(cache_key);
        it->second.items = items;
        it->second.lru_iter = lru_list.begin();
        return;
    }

    if (cache.size() >= MAX_CACHE_SIZE) {
        const std::string& lru_key = lru_list.back();
        cache.erase(lru_key);
        lru_list.pop_back();
    }

    lru_list.push_front(cache_key);
    cache[cache_key] = CacheEntry{items, lru_list.begin()};
}

void Engine::clear_cache() {
    std::lock_guard<std::mutex> lock(mtx);
    cache.clear();
    lru_list.clear();
}

} // namespace dictlsp
