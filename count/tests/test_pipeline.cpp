#include "FrequencyTable.h"
#include "Pipeline.h"
#include "Tokenizer.h"

#include <algorithm>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <gtest/gtest.h>

using namespace corpuscount;

using Counts = std::vector<CountedItem>;

class PipelineTest : public ::testing::Test {
protected:
    CountOptions options;

    void SetUp() override {
        options.min_n = 1;
        options.max_n = 2;
        options.bracket = false;
    }

    CountResult Run(std::string_view corpus) const { return CountPipeline(options).Run(corpus); }

    static bool HasItem(const Counts& counts, const std::string& item) {
        return std::any_of(counts.begin(), counts.end(), [&](const CountedItem& c) { return c.item == item; });
    }
};

TEST_F(PipelineTest, TokenCountsWithoutNGrams) {
    auto result = Run("a b a c b a");

    EXPECT_EQ(result.tokens, (Counts{{"a", 3}, {"b", 2}, {"c", 1}}));
    EXPECT_FALSE(result.ngrams.has_value());
    EXPECT_EQ(result.token_occurrences, 6U);
    EXPECT_EQ(result.distinct_tokens, 3U);
    EXPECT_EQ(result.ngram_occurrences, 0U);
}

TEST_F(PipelineTest, NGramsCountedPerOccurrence) {
    options.count_ngrams = true;
    auto result = Run("ab ab cd");

    EXPECT_EQ(result.tokens, (Counts{{"ab", 2}, {"cd", 1}}));
    ASSERT_TRUE(result.ngrams.has_value());
    EXPECT_EQ(*result.ngrams, (Counts{{"a", 2}, {"b", 2}, {"ab", 2}, {"c", 1}, {"d", 1}, {"cd", 1}}));
    EXPECT_EQ(result.ngram_occurrences, 9U);
    EXPECT_EQ(result.distinct_ngrams, 6U);
}

TEST_F(PipelineTest, RepeatedTokenMultipliesNGrams) {
    options.count_ngrams = true;
    options.min_n = 2;
    options.max_n = 2;
    auto result = Run("to to to to to");

    ASSERT_TRUE(result.ngrams.has_value());
    EXPECT_EQ(*result.ngrams, (Counts{{"to", 5}}));
}

TEST_F(PipelineTest, FilterFirstDropsRareTokensBeforeNGrams) {
    options.count_ngrams = true;
    options.token_min = 2;
    options.order = FilterOrder::FilterFirst;
    options.min_n = 1;
    options.max_n = 3;
    options.bracket = true;

    auto result = Run("x y x z x");

    EXPECT_EQ(result.tokens, (Counts{{"x", 3}}));
    ASSERT_TRUE(result.ngrams.has_value());
    EXPECT_EQ(*result.ngrams, (Counts{{"<", 3}, {"x", 3}, {">", 3}, {"<x", 3}, {"x>", 3}, {"<x>", 3}}));
    EXPECT_FALSE(HasItem(*result.ngrams, "y"));
    EXPECT_FALSE(HasItem(*result.ngrams, "<z"));
}

TEST_F(PipelineTest, CountFirstUsesAllTokensForNGrams) {
    options.count_ngrams = true;
    options.token_min = 2;
    options.order = FilterOrder::CountFirst;

    auto result = Run("x y x z x");

    // Token output is still filtered
    EXPECT_EQ(result.tokens, (Counts{{"x", 3}}));
    ASSERT_TRUE(result.ngrams.has_value());
    EXPECT_EQ(*result.ngrams, (Counts{{"x", 3}, {"y", 1}, {"z", 1}}));
}

TEST_F(PipelineTest, NGramThreshold) {
    options.count_ngrams = true;
    options.ngram_min = 2;

    auto result = Run("ab ab cd");

    ASSERT_TRUE(result.ngrams.has_value());
    EXPECT_EQ(*result.ngrams, (Counts{{"a", 2}, {"b", 2}, {"ab", 2}}));
    // Token output is unaffected by the n-gram threshold
    EXPECT_EQ(result.tokens.size(), 2U);
}

TEST_F(PipelineTest, ModesAgreeWithoutTokenFiltering) {
    options.count_ngrams = true;
    options.min_n = 2;
    options.max_n = 4;
    options.bracket = true;
    options.ngram_min = 2;

    const std::string corpus = "the quick brown fox jumps over the lazy dog\n"
                               "the dog barks and the fox runs\tquick quick\n";

    options.order = FilterOrder::CountFirst;
    auto countFirst = Run(corpus);
    options.order = FilterOrder::FilterFirst;
    auto filterFirst = Run(corpus);

    EXPECT_EQ(countFirst.tokens, filterFirst.tokens);
    ASSERT_TRUE(countFirst.ngrams.has_value());
    ASSERT_TRUE(filterFirst.ngrams.has_value());
    EXPECT_EQ(*countFirst.ngrams, *filterFirst.ngrams);
}

TEST_F(PipelineTest, TokenCountsMatchInputMultiset) {
    const std::string corpus = "  one two\tthree two\n\nthree three  four\r\n";

    std::map<std::string, count_t> expected;
    for (auto token : Tokenize(corpus)) {
        ++expected[std::string{token}];
    }

    auto result = Run(corpus);

    count_t sum = 0;
    std::map<std::string, count_t> actual;
    for (const auto& entry : result.tokens) {
        actual[entry.item] = entry.count;
        sum += entry.count;
    }
    EXPECT_EQ(actual, expected);
    EXPECT_EQ(sum, 7U);
    EXPECT_EQ(result.token_occurrences, 7U);
}

TEST_F(PipelineTest, OutputSortedWithFirstSeenTies) {
    options.count_ngrams = true;
    auto result = Run("b a c a b d");

    EXPECT_EQ(result.tokens, (Counts{{"b", 2}, {"a", 2}, {"c", 1}, {"d", 1}}));
    ASSERT_TRUE(result.ngrams.has_value());
    for (size_t i = 1; i < result.ngrams->size(); ++i) {
        EXPECT_GE((*result.ngrams)[i - 1].count, (*result.ngrams)[i].count);
    }
}

TEST_F(PipelineTest, EmptyCorpus) {
    options.count_ngrams = true;
    auto result = Run("");

    EXPECT_TRUE(result.tokens.empty());
    ASSERT_TRUE(result.ngrams.has_value());
    EXPECT_TRUE(result.ngrams->empty());
}

TEST_F(PipelineTest, CountTokensAndNGramsDirectly) {
    CountPipeline pipeline(options);
    auto tokens = pipeline.CountTokens("ab ab");
    EXPECT_EQ(tokens.Count("ab"), 2U);

    auto ngrams = pipeline.CountNGrams(tokens);
    EXPECT_EQ(ngrams.Count("a"), 2U);
    EXPECT_EQ(ngrams.Count("ab"), 2U);
    EXPECT_EQ(ngrams.Total(), 6U);
}

TEST(StageNameTest, Names) {
    EXPECT_EQ(StageName(Stage::ReadInput), "ReadInput");
    EXPECT_EQ(StageName(Stage::FilterTokensThenCountNGrams), "FilterTokensThenCountNGrams");
    EXPECT_EQ(StageName(Stage::Done), "Done");
}
