#pragma once

#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "../core/types.hpp"
#include <cmath>
#include <string>
#include <vector>

namespace hashmv {

/**
 * NormalizedRows: Unit-norm copy of a row batch plus the original norms.
 *
 * The original norms are kept so reconstruction can reapply the true
 * magnitudes after the cosine estimate is formed.
 */
struct NormalizedRows {
    Matrix unit;
    std::vector<Float> norms;
};

// ============================================================================
// VectorNormalizer
// ============================================================================

/**
 * VectorNormalizer: Rescales rows to unit L2 norm.
 *
 * Never mutates its input. Zero-norm (or non-finite) rows are handled by
 * the NormGuard policy:
 *   - Raise:        throw DegenerateVectorError naming the row
 *   - EpsilonFloor: divide by max(norm, epsilon); the recorded norm stays
 *                   the true norm, so a zero row reconstructs to zero
 */
class VectorNormalizer {
public:
    explicit VectorNormalizer(NormGuard guard = NormGuard::Raise, Float epsilon = 1e-12f)
        : guard_(guard), epsilon_(epsilon) {}

    NormGuard guard() const { return guard_; }
    Float epsilon() const { return epsilon_; }

    /**
     * Normalize one row.
     * @param in   Input row (n values)
     * @param out  Output buffer (n values), may alias `in`
     * @param row_index Row index for error messages
     * @return     The original L2 norm of `in`
     */
    Float normalize_row(const Float* in, Float* out, size_t n, size_t row_index = 0) const {
        // Norm and scale factor are kept in double: squaring a float component
        // near 1e-23 or 1e20 leaves float range even though the row itself
        // normalizes to a perfectly ordinary unit vector.
        const double norm = std::sqrt(squared_norm_wide(in, n));
        double divisor = norm;

        if (!std::isfinite(norm)) {
            throw DegenerateVectorError("row " + std::to_string(row_index) +
                                        " has a non-finite norm");
        }
        if (norm <= 0.0 || (guard_ == NormGuard::EpsilonFloor && norm < epsilon_)) {
            if (guard_ == NormGuard::Raise) {
                throw DegenerateVectorError("row " + std::to_string(row_index) +
                                            " has zero norm and cannot be normalized");
            }
            divisor = epsilon_;
        }

        const double inv = 1.0 / divisor;
        for (size_t i = 0; i < n; ++i) {
            out[i] = static_cast<Float>(in[i] * inv);
        }
        return static_cast<Float>(norm);
    }

    /// Normalize every row of `m` into a fresh matrix
    NormalizedRows normalize(const Matrix& m) const {
        NormalizedRows result{Matrix(m.rows(), m.cols()), std::vector<Float>(m.rows())};
        for (size_t r = 0; r < m.rows(); ++r) {
            result.norms[r] = normalize_row(m.row(r), result.unit.row(r), m.cols(), r);
        }
        return result;
    }

    /// Divisor that normalize_row applied for a row of the given norm
    Float divisor_for(Float norm) const {
        if (guard_ == NormGuard::EpsilonFloor && norm < epsilon_) {
            return epsilon_;
        }
        return norm;
    }

private:
    NormGuard guard_;
    Float epsilon_;
};

/// Convenience: unit-norm copy of a single vector (Raise policy)
inline std::vector<Float> normalize(const std::vector<Float>& v) {
    std::vector<Float> out(v.size());
    VectorNormalizer().normalize_row(v.data(), out.data(), v.size());
    return out;
}

}  // namespace hashmv
