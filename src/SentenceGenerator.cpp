#include "SentenceGenerator.h"
#include "Utils.h"
#include <iostream>

const std::string SentenceGenerator::kSentenceEnd = ".!?\"'";

SentenceGenerator::SentenceGenerator(const WordModel& model, std::mt19937& rng, SentenceOptions options)
    : model_(model), rng_(rng), options_(options), chains_(model, rng, options.deadEnd) {
    if (options_.maxAttempts < 1) {
        throw InvalidArgumentError("sentence attempts must be at least 1, got " + std::to_string(options_.maxAttempts));
    }
    if (options_.minWords < 1) {
        throw InvalidArgumentError("minimum sentence length must be at least 1, got " + std::to_string(options_.minWords));
    }

    // Keys ending a sentence are likely followed by the first word of the next one.
    for (const auto &key : model_.keys()) {
        if (!key.empty() && !key.back().empty() && key.back().back() == kStartMark) {
            startKeys_.push_back(key);
        }
    }
    if (startKeys_.empty() && !model_.empty()) {
        std::cerr << "SentenceGenerator: warning - no key ends with '" << kStartMark
                  << "', starting from arbitrary keys\n";
    }
}

std::string SentenceGenerator::generate(int targetWords) {
    return generateWith(targetWords, nullptr);
}

std::string SentenceGenerator::generate(int targetWords, const WordModel::Key& startKey) {
    return generateWith(targetWords, &startKey);
}

const WordModel::Key& SentenceGenerator::pickStartKey() {
    if (startKeys_.empty()) return model_.randomKey(rng_);
    return Utils::randomChoice(startKeys_, rng_);
}

std::string SentenceGenerator::generateWith(int targetWords, const WordModel::Key* startKey) {
    if (targetWords < 1) {
        throw InvalidArgumentError("sentence length must be at least 1, got " + std::to_string(targetWords));
    }
    if (model_.empty()) throw EmptyModelError();
    if (startKey && !model_.contains(*startKey) && !model_.isTerminal(*startKey)) {
        throw InvalidStartKeyError(Utils::describeKey(*startKey));
    }

    for (int attempt = 1; attempt <= options_.maxAttempts; ++attempt) {
        const WordModel::Key& start = startKey ? *startKey : pickStartKey();
        auto words = trimToSentenceEnd(chains_.generate(targetWords, start));
        if (!words.empty() && static_cast<int>(words.size()) >= options_.minWords) {
            lastAttempts_ = attempt;
            return Utils::join(words);
        }
    }

    lastAttempts_ = options_.maxAttempts;
    throw SentenceTooShortError(targetWords, options_.minWords, options_.maxAttempts);
}

std::vector<std::string> SentenceGenerator::trimToSentenceEnd(std::vector<std::string> words) {
    if (words.empty() || Utils::endsWithAny(words.back(), kSentenceEnd)) return words;

    for (size_t i = words.size(); i > 0; --i) {
        if (Utils::endsWithAny(words[i - 1], kSentenceEnd)) {
            words.resize(i);
            return words;
        }
    }
    words.clear();
    return words;
}
