#pragma once
#include <vector>
#include <deque>
#include <cstddef>
#include <iterator>
#include <functional>

// Visits every contiguous window of `n` items in [first, last), stride 1.
// Works on single-pass input iterators. Returns the number of windows visited,
// zero when the range holds fewer than `n` items.
template <typename InputIt, typename Fn>
size_t forEachNGram(InputIt first, InputIt last, size_t n, Fn&& fn) {
    using T = typename std::iterator_traits<InputIt>::value_type;
    if (n == 0) return 0;

    std::deque<T> window;
    size_t visited = 0;
    for (; first != last; ++first) {
        window.push_back(*first);
        if (window.size() < n) continue;
        if (window.size() > n) window.pop_front();
        std::vector<T> gram(window.begin(), window.end());
        fn(gram);
        ++visited;
    }
    return visited;
}

// Structural hash for n-gram keys.
template <typename T>
struct NGramHash {
    size_t operator()(const std::vector<T>& v) const noexcept {
        size_t h = 1469598103934665603ULL;
        std::hash<T> hasher;
        for (const auto &x : v) {
            h ^= hasher(x) + 0x9e3779b97f4a7c15ULL + (h<<6) + (h>>2);
        }
        return h;
    }
};
