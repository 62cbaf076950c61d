#pragma once
#include <string>
#include <vector>
#include <istream>
#include <iterator>

// Lazy whitespace-delimited words from a stream. Single pass; words keep
// their punctuation verbatim.
class WordStream {
public:
    using iterator = std::istream_iterator<std::string>;

    explicit WordStream(std::istream& in) : in_(in) {}

    bool next(std::string& word);
    iterator begin() { return iterator(in_); }
    iterator end() { return iterator(); }

private:
    std::istream& in_;
};

namespace Tokenizer {

    std::vector<std::string> tokenize(const std::string& text);
    std::vector<std::string> tokenize(const std::vector<std::string>& lines);
}
