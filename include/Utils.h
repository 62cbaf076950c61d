#pragma once
#include <string>
#include <vector>
#include <random>
#include <sstream>
#include <ostream>
#include <type_traits>
#include <utility>
#include <stdint.h>

namespace Utils {

    std::mt19937 makeRng();
    std::mt19937 makeRng(uint32_t seed);

    template <typename T>
    const T& randomChoice(const std::vector<T>& values, std::mt19937& rng) {
        std::uniform_int_distribution<size_t> dist(0, values.size() - 1);
        return values[dist(rng)];
    }

    bool endsWithAny(const std::string& word, const std::string& chars);

    std::string join(const std::vector<std::string>& words, char sep = ' ');

    template <typename T, typename = void>
    struct IsStreamable : std::false_type {};

    template <typename T>
    struct IsStreamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
        : std::true_type {};

    // "(a, b)" for printable tokens, "(2 tokens)" otherwise.
    template <typename T>
    std::string describeKey(const std::vector<T>& key) {
        std::ostringstream os;
        os << '(';
        if constexpr (IsStreamable<T>::value) {
            for (size_t i = 0; i < key.size(); ++i) {
                if (i) os << ", ";
                os << key[i];
            }
        } else {
            os << key.size() << " tokens";
        }
        os << ')';
        return os.str();
    }
}
