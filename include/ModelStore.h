#pragma once
#include <string>
#include <istream>
#include <ostream>
#include "MarkovModel.h"

// Plain-text persistence for word models. One line per key, key words and
// successor words separated by a tab; successor order and duplicates are kept.
// An optional "terminal" line before the keys holds the corpus-final key.
class ModelStore {
public:
    static const std::string kMagic;
    static constexpr int kVersion = 1;

    void save(const WordModel& model, std::ostream& out) const;
    void saveFile(const WordModel& model, const std::string& path) const;

    WordModel load(std::istream& in) const;
    WordModel loadFile(const std::string& path) const;
};
