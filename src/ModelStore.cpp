#include "ModelStore.h"
#include "Tokenizer.h"
#include "Errors.h"
#include "Utils.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <cctype>
#include <optional>
#include <utility>
#include <vector>

const std::string ModelStore::kMagic = "textchain-model";

namespace {

void writeWord(std::ostream &out, const std::string &word) {
    if (word.empty()) throw InvalidArgumentError("cannot store an empty word");
    for (char c : word) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            throw InvalidArgumentError("cannot store word containing whitespace: \"" + word + "\"");
        }
    }
    out << word;
}

void writeWords(std::ostream &out, const std::vector<std::string> &words) {
    for (size_t i = 0; i < words.size(); ++i) {
        if (i) out << ' ';
        writeWord(out, words[i]);
    }
}

long readHeaderValue(std::istream &in, size_t &lineNo, const std::string &name) {
    std::string line;
    if (!std::getline(in, line)) throw ModelFormatError(lineNo + 1, "missing '" + name + "' line");
    ++lineNo;
    std::istringstream ls(line);
    std::string label;
    long value = 0;
    std::string rest;
    if (!(ls >> label >> value) || label != name || (ls >> rest)) {
        throw ModelFormatError(lineNo, "expected '" + name + " <number>', got \"" + line + "\"");
    }
    return value;
}

}

void ModelStore::save(const WordModel& model, std::ostream& out) const {
    out << kMagic << ' ' << kVersion << '\n';
    out << "order " << model.order() << '\n';
    out << "keys " << model.size() << '\n';
    if (model.terminalKey()) {
        out << "terminal ";
        writeWords(out, *model.terminalKey());
        out << '\n';
    }
    for (const auto &key : model.keys()) {
        writeWords(out, key);
        out << '\t';
        writeWords(out, model.successors(key));
        out << '\n';
    }
    if (!out) throw IoError("write", "model stream");
}

void ModelStore::saveFile(const WordModel& model, const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "ModelStore::saveFile: Failed to open model file: " << path << '\n';
        throw IoError("open", path);
    }
    save(model, out);
    out.flush();
    if (!out) throw IoError("write", path);
}

WordModel ModelStore::load(std::istream& in) const {
    size_t lineNo = 0;
    std::string line;

    if (!std::getline(in, line)) throw ModelFormatError(1, "empty input");
    ++lineNo;
    {
        std::istringstream ls(line);
        std::string magic;
        int version = 0;
        if (!(ls >> magic >> version) || magic != kMagic) {
            throw ModelFormatError(lineNo, "not a model file");
        }
        if (version != kVersion) {
            throw ModelFormatError(lineNo, "unsupported model version " + std::to_string(version));
        }
    }

    long order = readHeaderValue(in, lineNo, "order");
    if (order < 1) throw ModelFormatError(lineNo, "n-gram size must be at least 1");
    long keyCount = readHeaderValue(in, lineNo, "keys");
    if (keyCount < 1) throw ModelFormatError(lineNo, "model has no keys");

    // keyCount is untrusted; entries grow only with lines actually read.
    std::vector<std::pair<WordModel::Key, WordModel::Successors>> entries;
    std::optional<WordModel::Key> terminal;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;
        size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            auto words = Tokenizer::tokenize(line);
            if (entries.empty() && !terminal && !words.empty() && words.front() == "terminal") {
                terminal = WordModel::Key(words.begin() + 1, words.end());
                if (terminal->size() != static_cast<size_t>(order)) {
                    throw ModelFormatError(lineNo, "terminal key has " + std::to_string(terminal->size()) + " words, expected " + std::to_string(order));
                }
                continue;
            }
            throw ModelFormatError(lineNo, "missing tab between key and successors");
        }

        auto key = Tokenizer::tokenize(line.substr(0, tab));
        auto successors = Tokenizer::tokenize(line.substr(tab + 1));
        if (key.size() != static_cast<size_t>(order)) {
            throw ModelFormatError(lineNo, "key has " + std::to_string(key.size()) + " words, expected " + std::to_string(order));
        }
        if (successors.empty()) throw ModelFormatError(lineNo, "key " + Utils::describeKey(key) + " has no successors");
        entries.emplace_back(std::move(key), std::move(successors));
    }
    if (in.bad()) throw IoError("read", "model stream");

    if (entries.size() != static_cast<size_t>(keyCount)) {
        throw ModelFormatError(lineNo, "expected " + std::to_string(keyCount) + " keys, found " + std::to_string(entries.size()));
    }

    try {
        return WordModel::fromTransitions(static_cast<int>(order), std::move(entries), std::move(terminal));
    } catch (const InvalidArgumentError &e) {
        throw ModelFormatError(lineNo, e.what());
    }
}

WordModel ModelStore::loadFile(const std::string& path) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "ModelStore::loadFile: Failed to open model file: " << path << '\n';
        throw IoError("open", path);
    }
    return load(in);
}
