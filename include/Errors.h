#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

enum class ErrorCode {
    InvalidArgument = 1,
    InsufficientCorpus = 100,
    EmptyModel = 101,
    InvalidStartKey = 102,
    SentenceTooShort = 200,
    ModelFormat = 300,
    Io = 301
};

class MarkovError : public std::runtime_error {
public:
    MarkovError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class InvalidArgumentError : public MarkovError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : MarkovError(ErrorCode::InvalidArgument, message) {}
};

class InsufficientCorpusError : public MarkovError {
public:
    explicit InsufficientCorpusError(int order)
        : MarkovError(ErrorCode::InsufficientCorpus,
                      "corpus needs at least " + std::to_string(order + 1) +
                      " tokens for n-gram size " + std::to_string(order)) {}
};

class EmptyModelError : public MarkovError {
public:
    EmptyModelError()
        : MarkovError(ErrorCode::EmptyModel, "cannot generate from an empty model") {}
};

class InvalidStartKeyError : public MarkovError {
public:
    explicit InvalidStartKeyError(const std::string& detail)
        : MarkovError(ErrorCode::InvalidStartKey, "start key is not in the model: " + detail) {}
};

class SentenceTooShortError : public MarkovError {
public:
    SentenceTooShortError(int requestedWords, int minWords, int attempts)
        : MarkovError(ErrorCode::SentenceTooShort,
                      "could not generate a sentence with at least " + std::to_string(minWords) +
                      " words from " + std::to_string(requestedWords) + " requested words after " +
                      std::to_string(attempts) + " attempts"),
          requestedWords_(requestedWords), minWords_(minWords) {}

    int requestedWords() const noexcept { return requestedWords_; }
    int minWords() const noexcept { return minWords_; }

private:
    int requestedWords_;
    int minWords_;
};

class ModelFormatError : public MarkovError {
public:
    ModelFormatError(size_t line, const std::string& message)
        : MarkovError(ErrorCode::ModelFormat,
                      "model format error at line " + std::to_string(line) + ": " + message),
          line_(line) {}

    size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

class IoError : public MarkovError {
public:
    IoError(const std::string& action, const std::string& path)
        : MarkovError(ErrorCode::Io, "failed to " + action + " " + path) {}
};
