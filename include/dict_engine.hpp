#pragma once

#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "dict_config.hpp"
#include "dict_frequency.hpp"
#include "dict_stats.hpp"
#include "dict_store.hpp"
#include "dict_trie.hpp"
#include "dict_types.hpp"

namespace dictlsp {

// Cache entry structure for LRU cache
struct CacheEntry {
    std::vector<CompletionItem> items;
    std::list<std::string>::iterator lru_iter;
};

struct Engine {
    Config config;

    DictionaryStore store;
    FrequencyTable freq;

    // Vocabulary index: dictionary keys plus frequency words. Only built when
    // the backend can enumerate its keys (JSON); empty in SQLite mode.
    PrefixTrie trie;

    StatsTracker stats;

    // Completion cache: stores up to 1000 queries with LRU eviction
    // Key format: "token|limit|distance" (e.g., "pass|20|3")
    std::unordered_map<std::string, CacheEntry> cache;
    std::list<std::string> lru_list; // Most recently used at front
    static constexpr size_t MAX_CACHE_SIZE = 1000;

    // Tokens longer than this only get prefix matches
    static constexpr size_t MAX_FUZZY_QUERY = 32;

    // Closest-word fallback for definitions
    static constexpr int DEFINITION_FALLBACK_DISTANCE = 2;

    std::mutex mtx;

    // Load dictionary, frequency table and trie from config paths.
    bool load();

    bool trie_enabled() const { return store.has_key_iteration(); }

    // Exact, case-insensitive. May throw BackendError.
    std::optional<DictionaryEntry> lookup(const std::string& word) const;

    // Exact lookup, then the closest dictionary word within distance 2.
    // The returned entry's word tells which one was found. May throw BackendError.
    std::optional<DictionaryEntry> define(const std::string& word, const CancelFlag* cancel = nullptr);

    // Ranked suggestions for a typed token (lowercase). Returns false if
    // cancelled; out is then left empty. May throw BackendError.
    bool complete(const std::string& token, size_t limit, int max_distance,
                  std::vector<CompletionItem>& out, const CancelFlag* cancel = nullptr);

    std::string make_cache_key(const std::string& token, size_t limit, int max_distance) const;
    void clear_cache();

private:
    bool get_from_cache(const std::string& cache_key, std::vector<CompletionItem>& out);
    void put_in_cache(const std::string& cache_key, const std::vector<CompletionItem>& items);

    bool collect_trie(const std::string& q, size_t limit, int max_distance,
                      std::vector<TrieHit>& prefix, std::vector<FuzzyCandidate>& fuzzy,
                      const CancelFlag* cancel) const;
    void collect_sqlite(const std::string& q, size_t limit, int max_distance,
                        std::vector<TrieHit>& prefix, std::vector<FuzzyCandidate>& fuzzy) const;
};

} // namespace dictlsp
