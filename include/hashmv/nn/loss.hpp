#pragma once

#include "../core/errors.hpp"
#include "../core/matrix.hpp"

namespace hashmv {

/**
 * Mean squared error over all entries, and its gradient w.r.t. `pred`.
 */
inline Float mse_loss(const Matrix& pred, const Matrix& target, Matrix* grad = nullptr) {
    if (!pred.same_shape(target)) {
        throw ShapeMismatchError("mse_loss: prediction " + pred.shape_string() +
                                 " vs target " + target.shape_string());
    }
    const size_t n = pred.size();
    if (grad) *grad = Matrix(pred.rows(), pred.cols());

    Float loss = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        const Float diff = pred.data()[i] - target.data()[i];
        loss += diff * diff;
        if (grad) grad->data()[i] = 2.0f * diff / static_cast<Float>(n);
    }
    return n == 0 ? 0.0f : loss / static_cast<Float>(n);
}

}  // namespace hashmv
