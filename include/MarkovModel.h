#pragma once
#include <vector>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <optional>
#include <random>
#include <istream>
#include "Errors.h"
#include "NGram.h"
#include "Utils.h"

// Maps n-gram keys to the tokens observed right after them. A successor list
// keeps duplicates in corpus order; the duplicates are the frequency weighting.
// Once built the model is read-only.
template <typename Token>
class MarkovModel {
public:
    using Key = std::vector<Token>;
    using Successors = std::vector<Token>;

    MarkovModel() = default;

    template <typename InputIt>
    static MarkovModel build(InputIt first, InputIt last, int order = 2);
    static MarkovModel build(const std::vector<Token>& sequence, int order = 2);

    // Rebuilds a model from stored (key, successors) entries.
    static MarkovModel fromTransitions(int order, std::vector<std::pair<Key, Successors>> entries,
                                       std::optional<Key> terminal = std::nullopt);

    int order() const { return order_; }
    size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }

    bool contains(const Key& key) const { return transitions_.count(key) != 0; }
    const Successors* find(const Key& key) const;
    const Successors& successors(const Key& key) const;

    // Keys in the order they first appeared in the corpus.
    const std::vector<Key>& keys() const { return keys_; }
    const Key& randomKey(std::mt19937& rng) const;

    // The corpus-final n-gram when it never continues anywhere in the corpus.
    // A walk may start there; it has no successors.
    const std::optional<Key>& terminalKey() const { return terminalKey_; }
    bool isTerminal(const Key& key) const { return terminalKey_ && *terminalKey_ == key; }

    size_t transitionCount() const { return transitionCount_; }
    size_t vocabularySize() const;

    bool operator==(const MarkovModel& other) const;
    bool operator!=(const MarkovModel& other) const { return !(*this == other); }

private:
    explicit MarkovModel(int order) : order_(order) {}
    void append(const Key& key, const Token& next);

    int order_ = 0;
    std::vector<Key> keys_;
    std::unordered_map<Key, Successors, NGramHash<Token>> transitions_;
    std::optional<Key> terminalKey_;
    size_t transitionCount_ = 0;
};

template <typename Token>
template <typename InputIt>
MarkovModel<Token> MarkovModel<Token>::build(InputIt first, InputIt last, int order) {
    if (order < 1) {
        throw InvalidArgumentError("n-gram size must be at least 1, got " + std::to_string(order));
    }
    MarkovModel model(order);
    Key finalKey;
    size_t windows = forEachNGram(first, last, static_cast<size_t>(order) + 1, [&model, &finalKey](const std::vector<Token>& gram) {
        Key key(gram.begin(), gram.end() - 1);
        model.append(key, gram.back());
        finalKey.assign(gram.begin() + 1, gram.end());
    });
    if (windows == 0) throw InsufficientCorpusError(order);
    if (!model.contains(finalKey)) model.terminalKey_ = std::move(finalKey);
    return model;
}

template <typename Token>
MarkovModel<Token> MarkovModel<Token>::build(const std::vector<Token>& sequence, int order) {
    return build(sequence.begin(), sequence.end(), order);
}

template <typename Token>
MarkovModel<Token> MarkovModel<Token>::fromTransitions(int order, std::vector<std::pair<Key, Successors>> entries,
                                                       std::optional<Key> terminal) {
    if (order < 1) {
        throw InvalidArgumentError("n-gram size must be at least 1, got " + std::to_string(order));
    }
    MarkovModel model(order);
    for (auto &entry : entries) {
        if (entry.first.size() != static_cast<size_t>(order)) {
            throw InvalidArgumentError("key " + Utils::describeKey(entry.first) + " does not have " + std::to_string(order) + " tokens");
        }
        if (entry.second.empty()) {
            throw InvalidArgumentError("key " + Utils::describeKey(entry.first) + " has no successors");
        }
        if (model.contains(entry.first)) {
            throw InvalidArgumentError("duplicate key " + Utils::describeKey(entry.first));
        }
        model.transitionCount_ += entry.second.size();
        model.keys_.push_back(entry.first);
        model.transitions_.emplace(std::move(entry.first), std::move(entry.second));
    }
    if (terminal) {
        if (terminal->size() != static_cast<size_t>(order)) {
            throw InvalidArgumentError("terminal key " + Utils::describeKey(*terminal) + " does not have " + std::to_string(order) + " tokens");
        }
        if (model.contains(*terminal)) {
            throw InvalidArgumentError("terminal key " + Utils::describeKey(*terminal) + " has successors");
        }
        model.terminalKey_ = std::move(terminal);
    }
    return model;
}

template <typename Token>
void MarkovModel<Token>::append(const Key& key, const Token& next) {
    auto it = transitions_.find(key);
    if (it == transitions_.end()) {
        keys_.push_back(key);
        it = transitions_.emplace(key, Successors{}).first;
    }
    it->second.push_back(next);
    ++transitionCount_;
}

template <typename Token>
const typename MarkovModel<Token>::Successors* MarkovModel<Token>::find(const Key& key) const {
    auto it = transitions_.find(key);
    if (it == transitions_.end()) return nullptr;
    return &it->second;
}

template <typename Token>
const typename MarkovModel<Token>::Successors& MarkovModel<Token>::successors(const Key& key) const {
    const Successors* s = find(key);
    if (!s) throw InvalidStartKeyError(Utils::describeKey(key));
    return *s;
}

template <typename Token>
const typename MarkovModel<Token>::Key& MarkovModel<Token>::randomKey(std::mt19937& rng) const {
    if (keys_.empty()) throw EmptyModelError();
    return Utils::randomChoice(keys_, rng);
}

template <typename Token>
size_t MarkovModel<Token>::vocabularySize() const {
    std::unordered_set<Token> seen;
    for (const auto &kv : transitions_) {
        seen.insert(kv.second.begin(), kv.second.end());
    }
    return seen.size();
}

template <typename Token>
bool MarkovModel<Token>::operator==(const MarkovModel& other) const {
    return order_ == other.order_ && keys_ == other.keys_ && transitions_ == other.transitions_ &&
           terminalKey_ == other.terminalKey_;
}

using WordModel = MarkovModel<std::string>;

WordModel buildWordModel(std::istream& corpus, int order = 2);
WordModel buildWordModel(const std::string& corpus, int order = 2);
WordModel buildWordModel(const std::vector<std::string>& lines, int order = 2);

extern template class MarkovModel<std::string>;
