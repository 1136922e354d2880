#include "domain/Identifiers.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <random>

namespace psyche::domain {

std::string GenerateId() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);

    std::string id;
    id.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) id += '-';
        int v = nibble(rng);
        if (i == 12) v = 4;                 // version
        if (i == 16) v = (v & 0x3) | 0x8;   // variant 10xx
        id += hex[v];
    }
    return id;
}

std::string ComputeHash(const std::string& text) {
    // 64-bit FNV-1a; keys are persisted, so the value must not depend on the
    // standard library.
    std::uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : text) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    static const char hex[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[h & 0xF];
        h >>= 4;
    }
    return out;
}

long long ToMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp FromMillis(long long ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string Trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    if (first >= last) return "";
    return std::string(first, last);
}

} // namespace psyche::domain
