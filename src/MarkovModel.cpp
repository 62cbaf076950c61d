#include "MarkovModel.h"
#include "Tokenizer.h"
#include <sstream>

template class MarkovModel<std::string>;

WordModel buildWordModel(std::istream& corpus, int order) {
    WordStream words(corpus);
    return WordModel::build(words.begin(), words.end(), order);
}

WordModel buildWordModel(const std::string& corpus, int order) {
    std::istringstream in(corpus);
    return buildWordModel(in, order);
}

WordModel buildWordModel(const std::vector<std::string>& lines, int order) {
    return WordModel::build(Tokenizer::tokenize(lines), order);
}
