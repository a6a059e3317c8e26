#pragma once

#include "../core/codes.hpp"
#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "../core/types.hpp"
#include <cstdint>
#include <vector>

#ifdef HASHMV_USE_OPENMP
#include <omp.h>
#endif

namespace hashmv {

// ============================================================================
// SignHasher: Random hyperplane hashing
// ============================================================================

/**
 * SignHasher: Maps unit vectors to k-bit sign codes, code = sign(P * v).
 *
 * Encoding Process (per row v):
 *   1. Project: z = P * v  (k dot products)
 *   2. Extract sign bit per coordinate: z[i] < 0 -> -1, otherwise +1
 *
 * Tie-break: a projection of exactly zero (including -0.0f) maps to +1.
 *
 * The pre-sign projections z can be returned alongside the codes; the
 * straight-through backward pass needs them for its clip mask.
 */
class SignHasher {
public:
    /**
     * Hash a single row into packed words.
     * @param v         Input row (P.cols() values)
     * @param P         Projection matrix (k x in_dim)
     * @param words     Output words (words_for_bits(k) values, cleared here)
     * @param pre_sign  Optional output of k projected values
     */
    static void hash_row(const Float* v, const Matrix& P, uint64_t* words, Float* pre_sign) {
        const size_t k = P.rows();
        const size_t dim = P.cols();
        const size_t num_words = words_for_bits(k);

        for (size_t w = 0; w < num_words; ++w) {
            words[w] = 0ULL;
        }

        for (size_t b = 0; b < k; ++b) {
            Float z = dot(P.row(b), v, dim);
            if (pre_sign) pre_sign[b] = z;
            if (z < 0.0f) {
                words[b / 64] |= (1ULL << (b % 64));
            }
        }
    }

    /**
     * Hash every row of `rows`.
     * @param pre_sign If non-null, resized to (rows x k) and filled with P * v
     * @throws ShapeMismatchError if rows.cols() != P.cols() or P is empty
     */
    static SignCodes hash(const Matrix& rows, const Matrix& P, Matrix* pre_sign = nullptr) {
        check_shapes(rows.cols(), P);

        const size_t n = rows.rows();
        const size_t k = P.rows();
        SignCodes codes(n, k);
        if (pre_sign) {
            *pre_sign = Matrix(n, k);
        }

#ifdef HASHMV_USE_OPENMP
        #pragma omp parallel for schedule(static)
#endif
        for (size_t r = 0; r < n; ++r) {
            hash_row(rows.row(r), P, codes.row_words(r),
                     pre_sign ? pre_sign->row(r) : nullptr);
        }

        return codes;
    }

    /**
     * Hash one vector and return its code as k entries in {-1, +1}.
     */
    static std::vector<int8_t> hash_vector(const std::vector<Float>& v, const Matrix& P) {
        check_shapes(v.size(), P);

        std::vector<uint64_t> words(words_for_bits(P.rows()));
        hash_row(v.data(), P, words.data(), nullptr);

        std::vector<int8_t> code(P.rows());
        for (size_t b = 0; b < P.rows(); ++b) {
            code[b] = ((words[b / 64] >> (b % 64)) & 1) ? -1 : 1;
        }
        return code;
    }

private:
    static void check_shapes(size_t in_dim, const Matrix& P) {
        if (P.rows() == 0) {
            throw InvalidConfigError("projection has k = 0 rows");
        }
        if (in_dim != P.cols()) {
            throw ShapeMismatchError("input dimension " + std::to_string(in_dim) +
                                     " does not match projection " + P.shape_string());
        }
    }
};

}  // namespace hashmv
