#pragma once
#include <string>
#include <vector>
#include <random>
#include "MarkovModel.h"
#include "ChainGenerator.h"

struct SentenceOptions {
    int minWords = 5;
    int maxAttempts = 100;
    DeadEndPolicy deadEnd = DeadEndPolicy::Reseed;
};

class SentenceGenerator {
public:
    static const std::string kSentenceEnd;
    static constexpr char kStartMark = '.';

    SentenceGenerator(const WordModel& model, std::mt19937& rng, SentenceOptions options = SentenceOptions());
    SentenceGenerator(WordModel&&, std::mt19937&, SentenceOptions = SentenceOptions()) = delete;

    std::string generate(int targetWords);
    std::string generate(int targetWords, const WordModel::Key& startKey);

    // Drops the words after the last sentence-ending word; empty if there is none.
    static std::vector<std::string> trimToSentenceEnd(std::vector<std::string> words);

    const std::vector<WordModel::Key>& startKeys() const { return startKeys_; }
    int lastAttempts() const { return lastAttempts_; }

private:
    std::string generateWith(int targetWords, const WordModel::Key* startKey);
    const WordModel::Key& pickStartKey();

    const WordModel& model_;
    std::mt19937& rng_;
    SentenceOptions options_;
    ChainGenerator<std::string> chains_;
    std::vector<WordModel::Key> startKeys_;
    int lastAttempts_ = 0;
};
