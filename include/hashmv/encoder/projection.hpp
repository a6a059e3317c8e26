#pragma once

#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "../core/parameter.hpp"
#include "../core/types.hpp"
#include <memory>
#include <random>
#include <string>

namespace hashmv {

namespace detail {

/**
 * Draw a (k x in_dim) matrix with i.i.d. N(0, 1) entries.
 * A row that comes out all-zero is redrawn, so no projection row is degenerate.
 */
inline Matrix draw_gaussian_projection(size_t k, size_t in_dim, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<Float> dist(0.0f, 1.0f);

    Matrix P(k, in_dim);
    for (size_t r = 0; r < k; ++r) {
        Float* row = P.row(r);
        do {
            for (size_t c = 0; c < in_dim; ++c) {
                row[c] = dist(rng);
            }
        } while (l2_norm(row, in_dim) == 0.0f);
    }
    return P;
}

}  // namespace detail

// ============================================================================
// ProjectionSource: Abstract supplier of the (k x in_dim) matrix P
// ============================================================================

/**
 * ProjectionSource: Owns the projection matrix used by the sign hasher.
 *
 * Implementations differ only in whether P is frozen or trainable:
 *   - RandomProjection:  fixed N(0, 1) draw, never updated
 *   - LearnedProjection: same initialization, updated by the optimizer
 *
 * P is stored as a Parameter so both variants serialize identically and
 * version-tracking covers optimizer updates.
 */
class ProjectionSource {
public:
    virtual ~ProjectionSource() = default;

    virtual KernelVariant variant() const = 0;
    virtual std::unique_ptr<ProjectionSource> clone() const = 0;

    bool trainable() const { return param_.trainable(); }

    size_t k() const { return param_.value().rows(); }
    size_t in_dim() const { return param_.value().cols(); }

    const Matrix& matrix() const { return param_.value(); }
    Parameter& parameter() { return param_; }
    const Parameter& parameter() const { return param_; }

    /**
     * Replace P (checkpoint restore). Shape must match the current P.
     */
    void set_matrix(Matrix P) {
        if (!P.same_shape(param_.value())) {
            throw ShapeMismatchError("projection shape " + P.shape_string() +
                                     " does not match expected " +
                                     param_.value().shape_string());
        }
        param_.assign(std::move(P));
        validate();
    }

    /**
     * Check that no row of P is zero (a zero row hashes every input to +1).
     * @throws DegenerateVectorError naming the first zero row
     */
    void validate() const { check_rows(param_.value()); }

    /// validate() for a candidate matrix not yet installed
    static void check_rows(const Matrix& P) {
        for (size_t r = 0; r < P.rows(); ++r) {
            if (l2_norm(P.row(r), P.cols()) == 0.0f) {
                throw DegenerateVectorError("projection row " + std::to_string(r) + " is zero");
            }
        }
    }

protected:
    ProjectionSource(size_t k, size_t in_dim, uint64_t seed, bool trainable) {
        if (k == 0) {
            throw InvalidConfigError("projection k must be >= 1");
        }
        if (in_dim == 0) {
            throw ShapeMismatchError("projection in_dim must be >= 1");
        }
        param_ = Parameter(detail::draw_gaussian_projection(k, in_dim, seed),
                           ParamRole::Projection, trainable);
    }

    ProjectionSource(const ProjectionSource&) = default;

private:
    Parameter param_;
};

// ============================================================================
// RandomProjection: Frozen Gaussian hyperplanes
// ============================================================================

class RandomProjection : public ProjectionSource {
public:
    RandomProjection(size_t k, size_t in_dim, uint64_t seed)
        : ProjectionSource(k, in_dim, seed, false) {}
    RandomProjection(const RandomProjection&) = default;

    KernelVariant variant() const override { return KernelVariant::RandomProj; }

    std::unique_ptr<ProjectionSource> clone() const override {
        return std::make_unique<RandomProjection>(*this);
    }
};

// ============================================================================
// LearnedProjection: Trainable hyperplanes
// ============================================================================

class LearnedProjection : public ProjectionSource {
public:
    LearnedProjection(size_t k, size_t in_dim, uint64_t seed)
        : ProjectionSource(k, in_dim, seed, true) {}
    LearnedProjection(const LearnedProjection&) = default;

    KernelVariant variant() const override { return KernelVariant::LearnedProj; }

    std::unique_ptr<ProjectionSource> clone() const override {
        return std::make_unique<LearnedProjection>(*this);
    }
};

/**
 * Create the projection source for a kernel variant.
 */
inline std::unique_ptr<ProjectionSource> make_projection(
    KernelVariant variant, size_t k, size_t in_dim, uint64_t seed) {

    switch (variant) {
        case KernelVariant::RandomProj:
            return std::make_unique<RandomProjection>(k, in_dim, seed);
        case KernelVariant::LearnedProj:
            return std::make_unique<LearnedProjection>(k, in_dim, seed);
    }
    throw InvalidConfigError("unknown kernel variant");
}

}  // namespace hashmv
