#pragma once

#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "../core/types.hpp"
#include <cmath>
#include <limits>

namespace hashmv {

// ============================================================================
// StraightThroughSign: Surrogate gradient for sign()
// ============================================================================

/**
 * StraightThroughSign: sign() forward, identity backward.
 *
 *   forward(v)              = v < 0 ? -1 : +1
 *   backward(v, upstream)   = upstream            if |v| <= clip
 *                             0                   otherwise
 *
 * With the default clip (+inf) the backward pass is the pure identity.
 * The gradient this produces is a surrogate: sign() has zero derivative
 * almost everywhere, and this rule replaces it with the derivative of the
 * (optionally clipped) identity so errors reach P and W.
 */
class StraightThroughSign {
public:
    explicit StraightThroughSign(Float clip = std::numeric_limits<Float>::infinity())
        : clip_(clip) {
        if (!(clip > 0.0f)) {
            throw InvalidConfigError("straight-through clip must be > 0");
        }
    }

    Float clip() const { return clip_; }
    bool clipping() const { return std::isfinite(clip_); }

    Float forward(Float v) const {
        return v < 0.0f ? -1.0f : 1.0f;
    }

    Float backward(Float v, Float upstream) const {
        return std::abs(v) <= clip_ ? upstream : 0.0f;
    }

    /**
     * Element-wise backward over a matrix of pre-sign values.
     * @throws ShapeMismatchError if the shapes differ
     */
    Matrix backward(const Matrix& pre_sign, const Matrix& upstream) const {
        if (!pre_sign.same_shape(upstream)) {
            throw ShapeMismatchError("straight-through backward: pre-sign " +
                                     pre_sign.shape_string() + " vs upstream " +
                                     upstream.shape_string());
        }
        Matrix grad(pre_sign.rows(), pre_sign.cols());
        const Float* v = pre_sign.data();
        const Float* g = upstream.data();
        Float* out = grad.data();
        for (size_t i = 0; i < grad.size(); ++i) {
            out[i] = backward(v[i], g[i]);
        }
        return grad;
    }

private:
    Float clip_;
};

}  // namespace hashmv
