#pragma once

#include "../core/codes.hpp"
#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "../core/types.hpp"
#include "hamming.hpp"
#include <cmath>
#include <cstdint>
#include <vector>

#ifdef HASHMV_USE_OPENMP
#include <omp.h>
#endif

namespace hashmv {

// ============================================================================
// SimilarityReconstructor
// ============================================================================

/**
 * SimilarityReconstructor: Hamming agreement -> cosine -> dot product.
 *
 * For random hyperplane hashing (Charikar), two unit vectors at angle theta
 * agree on a bit with probability 1 - theta / pi. With k bits and
 * agreement s = (a . b) / k = 1 - 2 * hamming / k in [-1, 1]:
 *
 *   theta_hat  = pi/2 * (1 - s)
 *   cos_hat    = cos(theta_hat)
 *   dot_hat    = ||w|| * ||x|| * cos_hat
 *
 * The norms are the original (pre-normalization) norms.
 */
struct SimilarityReconstructor {
    /// s from a Hamming distance over k bits
    static Float agreement(HammingDist hamming, size_t k) {
        return 1.0f - 2.0f * static_cast<Float>(hamming) / static_cast<Float>(k);
    }

    /**
     * s from two codes given as k entries in {-1, +1}.
     * @throws ShapeMismatchError if lengths differ, InvalidConfigError if empty
     */
    static Float agreement(const std::vector<int8_t>& a, const std::vector<int8_t>& b) {
        if (a.size() != b.size()) {
            throw ShapeMismatchError("code lengths " + std::to_string(a.size()) + " and " +
                                     std::to_string(b.size()) + " differ");
        }
        if (a.empty()) {
            throw InvalidConfigError("codes must have k >= 1 entries");
        }
        int32_t sum = 0;
        for (size_t i = 0; i < a.size(); ++i) {
            sum += static_cast<int32_t>(a[i]) * static_cast<int32_t>(b[i]);
        }
        return static_cast<Float>(sum) / static_cast<Float>(a.size());
    }

    /// Angle estimate theta_hat = pi/2 * (1 - s)
    static Float angle(Float s) {
        return HALF_PI * (1.0f - s);
    }

    static Float cosine(Float s) {
        return std::cos(angle(s));
    }

    /// d cos_hat / d s = pi/2 * sin(pi/2 * (1 - s))
    static Float cosine_grad(Float s) {
        return HALF_PI * std::sin(angle(s));
    }

    static Float reconstruct(Float s, Float norm_w, Float norm_x) {
        return norm_w * norm_x * cosine(s);
    }

    /**
     * Agreement matrix between every input code and every weight code.
     * @return (x_codes.rows() x w_codes.rows()) matrix of s values
     */
    static Matrix agreement_matrix(const SignCodes& x_codes, const SignCodes& w_codes) {
        if (x_codes.bits() != w_codes.bits()) {
            throw ShapeMismatchError("input codes have " + std::to_string(x_codes.bits()) +
                                     " bits, weight codes have " +
                                     std::to_string(w_codes.bits()));
        }

        const size_t batch = x_codes.rows();
        const size_t out = w_codes.rows();
        const size_t k = x_codes.bits();
        const size_t num_words = x_codes.words_per_row();
        Matrix s(batch, out);

#ifdef HASHMV_USE_OPENMP
        #pragma omp parallel for schedule(static)
#endif
        for (size_t b = 0; b < batch; ++b) {
            const uint64_t* xb = x_codes.row_words(b);
            Float* srow = s.row(b);
            for (size_t o = 0; o < out; ++o) {
                srow[o] = agreement(hamming_words(xb, w_codes.row_words(o), num_words), k);
            }
        }
        return s;
    }
};

/// s = (a . b) / k for two {-1, +1} codes
inline Float similarity(const std::vector<int8_t>& a, const std::vector<int8_t>& b) {
    return SimilarityReconstructor::agreement(a, b);
}

}  // namespace hashmv
