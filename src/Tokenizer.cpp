#include "Tokenizer.h"
#include <sstream>

bool WordStream::next(std::string& word) {
    return static_cast<bool>(in_ >> word);
}

std::vector<std::string> Tokenizer::tokenize(const std::string& text) {
    std::istringstream in(text);
    WordStream words(in);
    return std::vector<std::string>(words.begin(), words.end());
}

std::vector<std::string> Tokenizer::tokenize(const std::vector<std::string>& lines) {
    std::vector<std::string> out;
    for (const auto &line : lines) {
        std::istringstream in(line);
        WordStream words(in);
        out.insert(out.end(), words.begin(), words.end());
    }
    return out;
}
