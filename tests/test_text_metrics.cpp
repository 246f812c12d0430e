#include <gtest/gtest.h>
#include <visual_chunker/text_metrics.h>

using namespace visual_chunker;

TEST(TextMetricsTest, TrimSpan) {
    std::string text = "  abc \n";
    auto span = trim_span(text, 0, text.size());
    EXPECT_EQ(span.first, 2u);
    EXPECT_EQ(span.second, 5u);

    auto blank = trim_span(text, 5, 7);
    EXPECT_EQ(blank.first, blank.second);
}

TEST(TextMetricsTest, CountWords) {
    EXPECT_EQ(count_words(""), 0u);
    EXPECT_EQ(count_words("  one two\tthree\n"), 3u);
    EXPECT_EQ(count_words("single"), 1u);
}

TEST(TextMetricsTest, TokenEstimateRoundsUp) {
    EXPECT_EQ(estimate_tokens(""), 0u);
    EXPECT_EQ(estimate_tokens("one two three"), 4u);  // 3.9
    EXPECT_EQ(estimate_tokens("a b c d e f g h i j"), 13u);
}

TEST(TextMetricsTest, ReadabilityScore) {
    EXPECT_DOUBLE_EQ(readability_score(""), 1.0);
    EXPECT_DOUBLE_EQ(readability_score("Short one. Another short."), 1.0);

    std::string long_sentence;
    for (int i = 0; i < 45; ++i) long_sentence += "word ";
    long_sentence += ".";
    EXPECT_DOUBLE_EQ(readability_score(long_sentence), 0.0);

    std::string medium_sentence;
    for (int i = 0; i < 30; ++i) medium_sentence += "word ";
    medium_sentence += ".";
    EXPECT_NEAR(readability_score(medium_sentence), 0.5, 1e-9);
}

TEST(TextMetricsTest, SemanticBoundariesKeepSentencePositions) {
    auto boundaries = semantic_boundaries("First. Second! Third?");
    ASSERT_EQ(boundaries.size(), 3u);
    EXPECT_EQ(boundaries[0], "sentence_0");
    EXPECT_EQ(boundaries[2], "sentence_2");

    // Empty pieces are dropped but still count as positions
    auto sparse = semantic_boundaries("A. . B");
    ASSERT_EQ(sparse.size(), 2u);
    EXPECT_EQ(sparse[0], "sentence_0");
    EXPECT_EQ(sparse[1], "sentence_2");

    EXPECT_TRUE(semantic_boundaries("   ").empty());
}

TEST(TextMetricsTest, PoorBoundary) {
    EXPECT_FALSE(is_at_poor_boundary("Ends here."));
    EXPECT_FALSE(is_at_poor_boundary("Question?  "));
    EXPECT_FALSE(is_at_poor_boundary("colon:\n"));
    EXPECT_FALSE(is_at_poor_boundary("semi;"));
    EXPECT_TRUE(is_at_poor_boundary("ends with a comma,"));
    EXPECT_TRUE(is_at_poor_boundary("no punctuation"));
    EXPECT_TRUE(is_at_poor_boundary(""));
}

TEST(TextMetricsTest, ChunkImportance) {
    EXPECT_DOUBLE_EQ(chunk_importance("plain text", 0), 0.5);
    EXPECT_NEAR(chunk_importance("plain text", 2), 0.7, 1e-9);
    EXPECT_NEAR(chunk_importance("a key point", 2), 0.9, 1e-9);
    EXPECT_NEAR(chunk_importance("this is important", 0), 0.7, 1e-9);
    EXPECT_DOUBLE_EQ(chunk_importance("important", 10), 1.0);
}

TEST(TextMetricsTest, ToLowerAndTrim) {
    EXPECT_EQ(to_lower("MiXeD Case"), "mixed case");
    EXPECT_EQ(trim("\t padded \n"), "padded");
    EXPECT_EQ(trim("   "), "");
}
