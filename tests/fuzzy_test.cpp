#include "dict_fuzzy.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

using namespace dictlsp;

static const std::vector<std::string> kVocab = {
    "passion", "passing", "passive", "past", "pasta", "paste", "pass", "a",
    "an", "and", "ant", "bat", "cat", "cart", "chart", "kitten", "sitting",
    "mitten", "well-known", "don't", "café", "日本", "日本語",
};

class FuzzyMatcherTest : public ::testing::Test {
protected:
    PrefixTrie trie;

    void SetUp() override {
        std::unordered_map<std::string, int64_t> scores;
        for (size_t i = 0; i < kVocab.size(); i++) scores[kVocab[i]] = (int64_t)i;
        trie.build(scores);
    }

    std::set<std::string> fuzzy(const std::string& q, int d) const {
        FuzzyMatcher m(trie);
        std::vector<FuzzyCandidate> out;
        EXPECT_TRUE(m.match(q, d, out));
        std::set<std::string> words;
        for (const auto& c : out) {
            EXPECT_EQ(c.distance, levenshtein_distance(q, c.word)) << q << " vs " << c.word;
            words.insert(c.word);
        }
        EXPECT_EQ(words.size(), out.size()) << "duplicate candidates for " << q;
        return words;
    }

    static std::set<std::string> brute_force(const std::string& q, int d) {
        std::set<std::string> words;
        for (const auto& w : kVocab) {
            if (levenshtein_distance(q, w) <= d) words.insert(w);
        }
        return words;
    }
};

TEST(LevenshteinTest, KnownDistances) {
    EXPECT_EQ(levenshtein_distance("kitten", "sitting"), 3);
    EXPECT_EQ(levenshtein_distance("possion", "passion"), 1);
    EXPECT_EQ(levenshtein_distance("possion", "passive"), 3);
    EXPECT_EQ(levenshtein_distance("", "abc"), 3);
    EXPECT_EQ(levenshtein_distance("abc", ""), 3);
    EXPECT_EQ(levenshtein_distance("same", "same"), 0);
    // No transposition: a swap costs two
    EXPECT_EQ(levenshtein_distance("ab", "ba"), 2);
    // Counted in code points, not bytes
    EXPECT_EQ(levenshtein_distance("cafe", "café"), 1);
    EXPECT_EQ(levenshtein_distance("日本", "日本語"), 1);
}

TEST_F(FuzzyMatcherTest, MatchesBruteForce) {
    const std::vector<std::string> queries = {
        "possion", "pas", "passiv", "kiten", "cta", "an", "x", "chrat",
        "wellknown", "dont", "cafe", "日", "日本人", "zzzzzz", "passing",
    };
    for (const auto& q : queries) {
        for (int d = 0; d <= 3; d++) {
            EXPECT_EQ(fuzzy(q, d), brute_force(q, d)) << "query=" << q << " d=" << d;
        }
    }
}

TEST_F(FuzzyMatcherTest, PossionExample) {
    auto hits = fuzzy("possion", 2);
    EXPECT_TRUE(hits.count("passion"));
    EXPECT_FALSE(hits.count("passive"));
}

TEST_F(FuzzyMatcherTest, DistanceZeroIsExactMatch) {
    EXPECT_EQ(fuzzy("pasta", 0), (std::set<std::string>{"pasta"}));
    EXPECT_TRUE(fuzzy("pastaa", 0).empty());
}

TEST_F(FuzzyMatcherTest, QueryIsCaseFolded) {
    FuzzyMatcher m(trie);
    std::vector<FuzzyCandidate> out;
    ASSERT_TRUE(m.match("PASTA", 0, out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].word, "pasta");
    EXPECT_EQ(out[0].distance, 0);
}

TEST_F(FuzzyMatcherTest, CarriesTrieScore) {
    FuzzyMatcher m(trie);
    std::vector<FuzzyCandidate> out;
    ASSERT_TRUE(m.match("passion", 0, out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].score, trie.score_of("passion"));
}

TEST_F(FuzzyMatcherTest, RepeatedQueriesAreIdentical) {
    FuzzyMatcher m(trie);
    std::vector<FuzzyCandidate> a, b;
    ASSERT_TRUE(m.match("pas", 2, a));
    ASSERT_TRUE(m.match("pas", 2, b));
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); i++) {
        EXPECT_EQ(a[i].word, b[i].word);
        EXPECT_EQ(a[i].distance, b[i].distance);
    }
}

TEST_F(FuzzyMatcherTest, CancelledWalkReportsFalse) {
    FuzzyMatcher m(trie);
    CancelFlag cancel{true};
    std::vector<FuzzyCandidate> out;
    EXPECT_FALSE(m.match("pas", 3, out, &cancel));
}

TEST_F(FuzzyMatcherTest, EmptyTrie) {
    PrefixTrie empty;
    FuzzyMatcher m(empty);
    std::vector<FuzzyCandidate> out;
    EXPECT_TRUE(m.match("abc", 3, out));
    EXPECT_TRUE(out.empty());
}
