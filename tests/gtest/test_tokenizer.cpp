// =============================================================================
// Tokenizer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "Tokenizer.h"
#include <sstream>
#include <string>
#include <vector>

TEST(TokenizerTest, SplitsOnWhitespaceRuns) {
    auto words = Tokenizer::tokenize("  The  cat\tsat\n\non the   mat.  ");
    std::vector<std::string> expected = {"The", "cat", "sat", "on", "the", "mat."};
    EXPECT_EQ(words, expected);
}

// Punctuation stays attached, it drives the sentence heuristics
TEST(TokenizerTest, KeepsPunctuationAndCase) {
    auto words = Tokenizer::tokenize("\"Hello,\" she said. WHY?!");
    std::vector<std::string> expected = {"\"Hello,\"", "she", "said.", "WHY?!"};
    EXPECT_EQ(words, expected);
}

TEST(TokenizerTest, LinesAreConcatenatedInOrder) {
    std::vector<std::string> lines = {"one two", "", "   ", "three"};
    std::vector<std::string> expected = {"one", "two", "three"};
    EXPECT_EQ(Tokenizer::tokenize(lines), expected);
}

TEST(TokenizerTest, EmptyInputGivesNoWords) {
    EXPECT_TRUE(Tokenizer::tokenize(std::string()).empty());
    EXPECT_TRUE(Tokenizer::tokenize(std::string(" \n\t ")).empty());
}

TEST(TokenizerTest, WordStreamIsLazyAndForwardOnly) {
    std::istringstream in("alpha beta\ngamma");
    WordStream words(in);

    std::string w;
    ASSERT_TRUE(words.next(w));
    EXPECT_EQ(w, "alpha");
    ASSERT_TRUE(words.next(w));
    EXPECT_EQ(w, "beta");
    ASSERT_TRUE(words.next(w));
    EXPECT_EQ(w, "gamma");
    EXPECT_FALSE(words.next(w));
}
