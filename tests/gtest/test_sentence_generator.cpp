// =============================================================================
// Sentence Generator Tests
// =============================================================================

#include <gtest/gtest.h>
#include "SentenceGenerator.h"
#include "Tokenizer.h"
#include <random>
#include <string>
#include <type_traits>
#include <vector>

namespace {

const char* kCorpus =
    "The quick brown fox jumps over the lazy dog. The dog sleeps in the sun all day. "
    "A cat watches the dog from the fence and waits. Does the fox ever rest? "
    "Nobody knows where the fox goes at night! The farmer says \"the fox is clever.\" "
    "The cat jumps over the fence and runs into the barn. The sun sets over the quiet farm.";

bool endsSentence(const std::string& word) {
    return !word.empty() && SentenceGenerator::kSentenceEnd.find(word.back()) != std::string::npos;
}

}

class SentenceGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        model_ = buildWordModel(std::string(kCorpus), 2);
    }

    WordModel model_;
    std::mt19937 rng_{2024};
};

TEST_F(SentenceGeneratorTest, SentencesEndAtBoundaryAndMeetMinimum) {
    SentenceGenerator gen(model_, rng_);
    for (int i = 0; i < 50; ++i) {
        auto words = Tokenizer::tokenize(gen.generate(30));
        ASSERT_GE(words.size(), 5u);
        EXPECT_LE(words.size(), 30u);
        EXPECT_TRUE(endsSentence(words.back())) << words.back();
        EXPECT_GE(gen.lastAttempts(), 1);
    }
}

TEST_F(SentenceGeneratorTest, StartKeysEndWithFullStop) {
    SentenceGenerator gen(model_, rng_);
    ASSERT_FALSE(gen.startKeys().empty());
    for (const auto &key : gen.startKeys()) {
        EXPECT_EQ(key.back().back(), '.');
        EXPECT_TRUE(model_.contains(key));
    }
}

TEST_F(SentenceGeneratorTest, ExplicitStartKeyIsUsed) {
    SentenceOptions opt;
    opt.minWords = 1;
    SentenceGenerator gen(model_, rng_, opt);
    // "fox ever" is only ever followed by "rest?"
    auto words = Tokenizer::tokenize(gen.generate(20, {"fox", "ever"}));
    ASSERT_FALSE(words.empty());
    EXPECT_EQ(words.front(), "rest?");
}

TEST_F(SentenceGeneratorTest, UnknownStartKeyIsRejected) {
    SentenceGenerator gen(model_, rng_);
    EXPECT_THROW(gen.generate(20, {"no", "such"}), InvalidStartKeyError);
}

// "quiet farm." ends the corpus and has no successors
TEST_F(SentenceGeneratorTest, CorpusFinalStartKeyFollowsDeadEndPolicy) {
    ASSERT_TRUE(model_.isTerminal({"quiet", "farm."}));

    SentenceOptions stop;
    stop.deadEnd = DeadEndPolicy::Stop;
    stop.maxAttempts = 3;
    SentenceGenerator stopping(model_, rng_, stop);
    EXPECT_THROW(stopping.generate(20, {"quiet", "farm."}), SentenceTooShortError);

    SentenceOptions reseed;
    reseed.minWords = 1;
    SentenceGenerator reseeding(model_, rng_, reseed);
    auto words = Tokenizer::tokenize(reseeding.generate(20, {"quiet", "farm."}));
    ASSERT_FALSE(words.empty());
    EXPECT_TRUE(endsSentence(words.back())) << words.back();
}

TEST_F(SentenceGeneratorTest, DoesNotBindTemporaryModels) {
    static_assert(!std::is_constructible<SentenceGenerator, WordModel&&, std::mt19937&>::value,
                  "SentenceGenerator must not bind an rvalue model");
    static_assert(!std::is_constructible<SentenceGenerator, WordModel&&, std::mt19937&, SentenceOptions>::value,
                  "SentenceGenerator must not bind an rvalue model");
    static_assert(std::is_constructible<SentenceGenerator, const WordModel&, std::mt19937&>::value,
                  "SentenceGenerator binds an lvalue model");
    SentenceGenerator gen(model_, rng_);
    EXPECT_FALSE(gen.startKeys().empty());
}

TEST_F(SentenceGeneratorTest, InvalidArgumentsAreRejected) {
    SentenceGenerator gen(model_, rng_);
    EXPECT_THROW(gen.generate(0), InvalidArgumentError);

    SentenceOptions badMin;
    badMin.minWords = 0;
    EXPECT_THROW((SentenceGenerator{model_, rng_, badMin}), InvalidArgumentError);

    SentenceOptions badAttempts;
    badAttempts.maxAttempts = 0;
    EXPECT_THROW((SentenceGenerator{model_, rng_, badAttempts}), InvalidArgumentError);
}

TEST_F(SentenceGeneratorTest, TargetBelowMinimumFails) {
    SentenceGenerator gen(model_, rng_);
    try {
        gen.generate(3);
        FAIL() << "expected SentenceTooShortError";
    } catch (const SentenceTooShortError& e) {
        EXPECT_EQ(e.requestedWords(), 3);
        EXPECT_EQ(e.minWords(), 5);
        EXPECT_EQ(e.code(), ErrorCode::SentenceTooShort);
    }
}

TEST(SentenceScenarioTest, TinyCorpusEndsWithFullStop) {
    auto model = buildWordModel(std::vector<std::string>{"The", "cat", "sat", "."}, 2);
    std::mt19937 rng(3);
    SentenceOptions opt;
    opt.minWords = 2;
    SentenceGenerator gen(model, rng, opt);

    auto words = Tokenizer::tokenize(gen.generate(10));
    ASSERT_GE(words.size(), 2u);
    EXPECT_EQ(words.back().back(), '.');
}

TEST(SentenceScenarioTest, TinyCorpusWithStopPolicyRunsOutOfAttempts) {
    auto model = buildWordModel(std::string("The cat sat ."), 2);
    std::mt19937 rng(3);
    SentenceOptions opt;
    opt.maxAttempts = 10;
    opt.deadEnd = DeadEndPolicy::Stop;
    SentenceGenerator gen(model, rng, opt);

    EXPECT_THROW(gen.generate(30), SentenceTooShortError);
    EXPECT_EQ(gen.lastAttempts(), 10);
}

// No token ends a sentence: trimming always leaves nothing
TEST(SentenceScenarioTest, CorpusWithoutSentenceEndsFails) {
    auto model = buildWordModel(std::string("a b c d e f g h i j k l m n o p"), 2);
    std::mt19937 rng(5);
    SentenceGenerator gen(model, rng);
    EXPECT_TRUE(gen.startKeys().empty());
    EXPECT_THROW(gen.generate(30), SentenceTooShortError);
}

TEST(SentenceScenarioTest, EmptyModelIsRejected) {
    WordModel empty;
    std::mt19937 rng(5);
    SentenceGenerator gen(empty, rng);
    EXPECT_THROW(gen.generate(30), EmptyModelError);
}

TEST(TrimToSentenceEndTest, KeepsChainEndingInBoundary) {
    std::vector<std::string> words = {"it", "works", "!"};
    EXPECT_EQ(SentenceGenerator::trimToSentenceEnd(words), words);

    std::vector<std::string> quoted = {"she", "said", "'go'"};
    EXPECT_EQ(SentenceGenerator::trimToSentenceEnd(quoted), quoted);
}

TEST(TrimToSentenceEndTest, DropsDanglingWords) {
    std::vector<std::string> words = {"one", "two.", "three", "four\"", "five", "six"};
    std::vector<std::string> expected = {"one", "two.", "three", "four\""};
    EXPECT_EQ(SentenceGenerator::trimToSentenceEnd(words), expected);
}

TEST(TrimToSentenceEndTest, NoBoundaryGivesEmpty) {
    EXPECT_TRUE(SentenceGenerator::trimToSentenceEnd({"no", "end", "here"}).empty());
    EXPECT_TRUE(SentenceGenerator::trimToSentenceEnd({}).empty());
}
