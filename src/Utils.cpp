#include "Utils.h"
#include <chrono>

std::mt19937 Utils::makeRng() {
    std::random_device rd;
    return std::mt19937(rd() ^ static_cast<unsigned long>(std::chrono::high_resolution_clock::now().time_since_epoch().count()));
}

std::mt19937 Utils::makeRng(uint32_t seed) {
    return std::mt19937(seed);
}

bool Utils::endsWithAny(const std::string& word, const std::string& chars) {
    if (word.empty()) return false;
    return chars.find(word.back()) != std::string::npos;
}

std::string Utils::join(const std::vector<std::string>& words, char sep) {
    std::string out;
    size_t total = 0;
    for (const auto &w : words) total += w.size() + 1;
    out.reserve(total);
    for (size_t i = 0; i < words.size(); ++i) {
        if (i) out.push_back(sep);
        out += words[i];
    }
    return out;
}
