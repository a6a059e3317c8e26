#pragma once

#include "../core/codes.hpp"
#include "../core/errors.hpp"
#include "../core/types.hpp"
#include <cstdint>

namespace hashmv {

namespace detail {

// ============================================================================
// Software Popcount (Portable Fallback)
// ============================================================================

inline uint32_t popcount64_software(uint64_t x) {
    x = x - ((x >> 1) & 0x5555555555555555ULL);
    x = (x & 0x3333333333333333ULL) + ((x >> 2) & 0x3333333333333333ULL);
    x = (x + (x >> 4)) & 0x0F0F0F0F0F0F0F0FULL;
    return static_cast<uint32_t>((x * 0x0101010101010101ULL) >> 56);
}

// Use hardware popcount if available
inline uint32_t popcount64(uint64_t x) {
#if defined(__POPCNT__) || defined(__SSE4_2__)
    return static_cast<uint32_t>(__builtin_popcountll(x));
#else
    return popcount64_software(x);
#endif
}

}  // namespace detail

// ============================================================================
// Hamming Distance over packed sign codes
// ============================================================================

/**
 * Hamming distance between two packed codes of `num_words` words.
 * Returns popcount(a XOR b); tail bits are zero in both codes.
 */
inline HammingDist hamming_words(const uint64_t* a, const uint64_t* b, size_t num_words) {
    HammingDist dist = 0;
    for (size_t w = 0; w < num_words; ++w) {
        dist += detail::popcount64(a[w] ^ b[w]);
    }
    return dist;
}

/**
 * Hamming distance between row `ra` of `a` and row `rb` of `b`.
 * @throws ShapeMismatchError if the code widths differ
 */
inline HammingDist hamming(const SignCodes& a, size_t ra, const SignCodes& b, size_t rb) {
    if (a.bits() != b.bits()) {
        throw ShapeMismatchError("code width " + std::to_string(a.bits()) +
                                 " does not match " + std::to_string(b.bits()));
    }
    return hamming_words(a.row_words(ra), b.row_words(rb), a.words_per_row());
}

}  // namespace hashmv
