#pragma once
#include <vector>
#include <random>
#include "MarkovModel.h"
#include "Errors.h"
#include "Utils.h"

// What a walk does when it reaches a key the model has no successors for
// (the corpus-final n-gram when it never occurs earlier).
enum class DeadEndPolicy {
    Reseed,  // continue from a fresh random key
    Stop     // end the chain
};

// Unbounded forward-only random walk over a model.
template <typename Token>
class Chain {
public:
    using Model = MarkovModel<Token>;
    using Key = typename Model::Key;

    Chain(const Model& model, std::mt19937& rng, DeadEndPolicy policy = DeadEndPolicy::Reseed);
    Chain(const Model& model, std::mt19937& rng, const Key& start, DeadEndPolicy policy = DeadEndPolicy::Reseed);
    Chain(Model&&, std::mt19937&, DeadEndPolicy = DeadEndPolicy::Reseed) = delete;
    Chain(Model&&, std::mt19937&, const Key&, DeadEndPolicy = DeadEndPolicy::Reseed) = delete;

    // Emits the next token. Returns false only once a Stop policy hit a dead end.
    bool next(Token& out);

    const Key& key() const { return key_; }
    bool finished() const { return done_; }
    size_t reseeds() const { return reseeds_; }

private:
    const Model& model_;
    std::mt19937& rng_;
    Key key_;
    DeadEndPolicy policy_;
    bool done_ = false;
    size_t reseeds_ = 0;
};

template <typename Token>
Chain<Token>::Chain(const Model& model, std::mt19937& rng, DeadEndPolicy policy)
    : model_(model), rng_(rng), policy_(policy) {
    key_ = model_.randomKey(rng_);
}

template <typename Token>
Chain<Token>::Chain(const Model& model, std::mt19937& rng, const Key& start, DeadEndPolicy policy)
    : model_(model), rng_(rng), key_(start), policy_(policy) {
    if (model_.empty()) throw EmptyModelError();
    if (!model_.contains(key_) && !model_.isTerminal(key_)) throw InvalidStartKeyError(Utils::describeKey(key_));
}

template <typename Token>
bool Chain<Token>::next(Token& out) {
    if (done_) return false;

    const auto* successors = model_.find(key_);
    if (!successors) {
        if (policy_ == DeadEndPolicy::Stop) {
            done_ = true;
            return false;
        }
        key_ = model_.randomKey(rng_);
        ++reseeds_;
        successors = model_.find(key_);
    }

    out = Utils::randomChoice(*successors, rng_);
    key_.erase(key_.begin());
    key_.push_back(out);
    return true;
}

// Bounded generation on top of Chain.
template <typename Token>
class ChainGenerator {
public:
    using Model = MarkovModel<Token>;
    using Key = typename Model::Key;

    ChainGenerator(const Model& model, std::mt19937& rng, DeadEndPolicy policy = DeadEndPolicy::Reseed)
        : model_(model), rng_(rng), policy_(policy) {}
    ChainGenerator(Model&&, std::mt19937&, DeadEndPolicy = DeadEndPolicy::Reseed) = delete;

    std::vector<Token> generate(int length);
    std::vector<Token> generate(int length, const Key& start);

    DeadEndPolicy policy() const { return policy_; }

private:
    std::vector<Token> take(Chain<Token>& chain, int length);

    const Model& model_;
    std::mt19937& rng_;
    DeadEndPolicy policy_;
};

template <typename Token>
std::vector<Token> ChainGenerator<Token>::generate(int length) {
    if (length < 0) throw InvalidArgumentError("chain length must not be negative, got " + std::to_string(length));
    Chain<Token> chain(model_, rng_, policy_);
    return take(chain, length);
}

template <typename Token>
std::vector<Token> ChainGenerator<Token>::generate(int length, const Key& start) {
    if (length < 0) throw InvalidArgumentError("chain length must not be negative, got " + std::to_string(length));
    Chain<Token> chain(model_, rng_, start, policy_);
    return take(chain, length);
}

template <typename Token>
std::vector<Token> ChainGenerator<Token>::take(Chain<Token>& chain, int length) {
    std::vector<Token> out;
    out.reserve(static_cast<size_t>(length));
    Token tok;
    while (static_cast<int>(out.size()) < length && chain.next(tok)) {
        out.push_back(tok);
    }
    return out;
}
