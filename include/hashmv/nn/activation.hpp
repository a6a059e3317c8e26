#pragma once

#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "layer.hpp"
#include <memory>
#include <string>

namespace hashmv {

/**
 * ReLU: y = max(x, 0), element-wise.
 */
class ReLU : public Layer {
public:
    std::string type_name() const override { return "ReLU"; }

    Matrix forward(const Matrix& x) override {
        Matrix y = x;
        Float* v = y.data();
        for (size_t i = 0; i < y.size(); ++i) {
            if (v[i] < 0.0f) v[i] = 0.0f;
        }
        if (is_training()) last_input_ = x;
        return y;
    }

    Matrix backward(const Matrix& grad_out) override {
        if (!grad_out.same_shape(last_input_)) {
            throw ShapeMismatchError("ReLU::backward: gradient " + grad_out.shape_string() +
                                     " does not match input " + last_input_.shape_string());
        }
        Matrix dx = grad_out;
        const Float* x = last_input_.data();
        Float* g = dx.data();
        for (size_t i = 0; i < dx.size(); ++i) {
            if (x[i] <= 0.0f) g[i] = 0.0f;
        }
        return dx;
    }

    std::unique_ptr<Layer> clone() const override {
        return std::make_unique<ReLU>(*this);
    }

private:
    Matrix last_input_;
};

}  // namespace hashmv
