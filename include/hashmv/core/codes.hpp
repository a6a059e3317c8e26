#pragma once

#include "memory.hpp"
#include "types.hpp"
#include <cstdint>
#include <cstring>

namespace hashmv {

// ============================================================================
// SignCodes: Packed k-bit sign codes
// ============================================================================

/**
 * SignCodes: A batch of k-bit sign codes, one code per row.
 *
 * Each code stores k entries in {-1, +1} packed into 64-bit words.
 * A set bit encodes -1, a clear bit encodes +1, so a freshly cleared
 * code is all +1 (the sign(0) convention).
 *
 * Memory Layout:
 *   - Row r occupies words [r * words_per_row(), (r + 1) * words_per_row())
 *   - Bits past k in the last word of each row are always zero, so
 *     XOR + popcount over whole words yields the exact Hamming distance.
 */
class SignCodes {
public:
    SignCodes() = default;

    SignCodes(size_t rows, size_t bits)
        : rows_(rows)
        , bits_(bits)
        , words_per_row_(words_for_bits(bits))
        , words_(rows * words_per_row_, 0ULL) {}

    size_t rows() const { return rows_; }
    size_t bits() const { return bits_; }
    size_t words_per_row() const { return words_per_row_; }
    bool empty() const { return rows_ == 0; }

    void set_negative(size_t r, size_t idx, bool negative) {
        uint64_t& w = words_[r * words_per_row_ + idx / 64];
        if (negative) {
            w |= (1ULL << (idx % 64));
        } else {
            w &= ~(1ULL << (idx % 64));
        }
    }

    bool is_negative(size_t r, size_t idx) const {
        return (words_[r * words_per_row_ + idx / 64] >> (idx % 64)) & 1;
    }

    /// Entry as +1 / -1
    int sign(size_t r, size_t idx) const {
        return is_negative(r, idx) ? -1 : 1;
    }

    const uint64_t* row_words(size_t r) const { return words_.data() + r * words_per_row_; }
    uint64_t* row_words(size_t r) { return words_.data() + r * words_per_row_; }

    bool operator==(const SignCodes& other) const {
        return rows_ == other.rows_ && bits_ == other.bits_ &&
               std::memcmp(words_.data(), other.words_.data(),
                           words_.size() * sizeof(uint64_t)) == 0;
    }

    bool operator!=(const SignCodes& other) const { return !(*this == other); }

private:
    size_t rows_ = 0;
    size_t bits_ = 0;
    size_t words_per_row_ = 0;
    AlignedVector<uint64_t> words_;
};

}  // namespace hashmv
