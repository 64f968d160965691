#include "dict_trie.hpp"

#include <gtest/gtest.h>

using namespace dictlsp;

class PrefixTrieTest : public ::testing::Test {
protected:
    PrefixTrie trie;

    void SetUp() override {
        trie.build({{"passion", 10}, {"passing", 50}, {"passive", 5}, {"past", 50},
                    {"pasta", 7}, {"apple", 3}, {"Passage", 20}});
    }

    static std::vector<std::string> words(const std::vector<TrieHit>& hits) {
        std::vector<std::string> out;
        for (const auto& h : hits) out.push_back(h.word);
        return out;
    }
};

TEST_F(PrefixTrieTest, PrefixLimitTwo) {
    auto hits = trie.complete_by_prefix("pass", 2);
    EXPECT_EQ(words(hits), (std::vector<std::string>{"passing", "passage"}));

    PrefixTrie small;
    small.build({{"passion", 10}, {"passing", 50}, {"passive", 5}});
    EXPECT_EQ(words(small.complete_by_prefix("pass", 2)),
              (std::vector<std::string>{"passing", "passion"}));
}

TEST_F(PrefixTrieTest, OrderedByScoreThenWord) {
    auto hits = trie.complete_by_prefix("pas", 100);
    ASSERT_EQ(hits.size(), 6u);
    // passing and past tie on 50; alphabetical breaks the tie
    EXPECT_EQ(words(hits), (std::vector<std::string>{"passing", "past", "passage", "passion",
                                                     "pasta", "passive"}));
    for (size_t i = 1; i < hits.size(); i++) EXPECT_GE(hits[i - 1].score, hits[i].score);
}

TEST_F(PrefixTrieTest, EveryHitStartsWithPrefix) {
    for (size_t k = 1; k <= 8; k++) {
        auto hits = trie.complete_by_prefix("pass", k);
        EXPECT_LE(hits.size(), k);
        for (const auto& h : hits) EXPECT_EQ(h.word.rfind("pass", 0), 0u) << h.word;
    }
}

TEST_F(PrefixTrieTest, UnmatchedPrefixIsEmpty) {
    EXPECT_TRUE(trie.complete_by_prefix("pz", 5).empty());
    EXPECT_TRUE(trie.complete_by_prefix("passions", 5).empty());
    EXPECT_TRUE(trie.complete_by_prefix("", 5).empty());
}

TEST_F(PrefixTrieTest, KeysAreCaseFolded) {
    EXPECT_TRUE(trie.contains("passage"));
    EXPECT_TRUE(trie.contains("PASSAGE"));
    EXPECT_EQ(words(trie.complete_by_prefix("PASSA", 5)), (std::vector<std::string>{"passage"}));
}

TEST_F(PrefixTrieTest, InsertKeepsBestScore) {
    trie.insert("passive", 2);
    EXPECT_EQ(trie.score_of("passive"), 5);
    trie.insert("passive", 500);
    EXPECT_EQ(trie.score_of("passive"), 500);
    EXPECT_EQ(trie.complete_by_prefix("pass", 1)[0].word, "passive");
    EXPECT_EQ(trie.size(), 7u);
}

TEST_F(PrefixTrieTest, LargeLimitMatchesSmallLimitOrder) {
    PrefixTrie big;
    std::unordered_map<std::string, int64_t> vocab;
    for (int i = 0; i < 200; i++) vocab["w" + std::to_string(i)] = i % 17;
    big.build(vocab, 10);

    auto all = big.complete_by_prefix("w", 500);
    ASSERT_EQ(all.size(), 200u);
    auto top = big.complete_by_prefix("w", 5);
    for (size_t i = 0; i < top.size(); i++) EXPECT_EQ(top[i].word, all[i].word);
}

TEST_F(PrefixTrieTest, UnrankedWordsComeLast) {
    trie.insert("passkey", kUnrankedScore);
    auto hits = trie.complete_by_prefix("pass", 10);
    ASSERT_FALSE(hits.empty());
    EXPECT_EQ(hits.back().word, "passkey");
    EXPECT_EQ(hits.back().score, kUnrankedScore);
}

TEST_F(PrefixTrieTest, VisitorStopsEarly) {
    std::vector<std::string> seen;
    trie.visit_prefix("pas", [&](const std::string& w, int64_t) {
        seen.push_back(w);
        return seen.size() < 2;
    });
    EXPECT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "passage"); // code point order
}

TEST_F(PrefixTrieTest, NonAsciiEdges) {
    PrefixTrie t;
    t.build({{"café", 3}, {"cafés", 1}, {"日本", 5}, {"日本語", 9}});
    EXPECT_EQ(words(t.complete_by_prefix("caf", 5)), (std::vector<std::string>{"café", "cafés"}));
    EXPECT_EQ(words(t.complete_by_prefix("日", 5)), (std::vector<std::string>{"日本語", "日本"}));
    EXPECT_TRUE(t.contains("CAFÉ"));
}
