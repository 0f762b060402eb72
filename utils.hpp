#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <random>
#include <string>

// Every search owns its engine; nothing random is global.
inline int randint(std::mt19937& rng, int a, int b) {
    return std::uniform_int_distribution<int>(a, b)(rng);
}

inline double randreal(std::mt19937& rng) {
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

// FNV-1a, stable across compilers (std::hash is not).
inline std::uint32_t hash_label(const std::string& label) {
    std::uint32_t h = 2166136261u;
    for (unsigned char ch : label) {
        h ^= ch;
        h *= 16777619u;
    }
    return h;
}

// Engine for a named stream of a run, e.g. ("route_a") or ("crossover").
inline std::mt19937 make_engine(unsigned int seed, const std::string& label) {
    std::seed_seq seq{static_cast<std::uint32_t>(seed), hash_label(label)};
    return std::mt19937(seq);
}

// Engine that depends only on a label and an index (seeded initial routes).
inline std::mt19937 make_engine(const std::string& label, int index) {
    std::seed_seq seq{hash_label(label), static_cast<std::uint32_t>(index)};
    return std::mt19937(seq);
}

inline void trim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

#endif // UTILS_HPP
