#pragma once

#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "../core/parameter.hpp"
#include "layer.hpp"
#include <cmath>
#include <memory>
#include <optional>
#include <random>
#include <string>

#ifdef HASHMV_USE_OPENMP
#include <omp.h>
#endif

namespace hashmv {

namespace detail {

/// y = x * W^T (+ b); x is (batch x in), W is (out x in), b is (1 x out)
inline Matrix affine_forward(const Matrix& x, const Matrix& W, const Parameter* bias) {
    const size_t batch = x.rows();
    const size_t out = W.rows();
    const size_t in = W.cols();
    Matrix y(batch, out);

#ifdef HASHMV_USE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (size_t b = 0; b < batch; ++b) {
        const Float* xb = x.row(b);
        Float* yb = y.row(b);
        for (size_t o = 0; o < out; ++o) {
            yb[o] = dot(W.row(o), xb, in);
            if (bias) yb[o] += bias->value()(0, o);
        }
    }
    return y;
}

inline void check_input(const Matrix& x, size_t in_dim, const std::string& who) {
    if (x.cols() != in_dim) {
        throw ShapeMismatchError(who + ": input has " + std::to_string(x.cols()) +
                                 " features, expected " + std::to_string(in_dim));
    }
}

}  // namespace detail

// ============================================================================
// Linear: y = x W^T + b
// ============================================================================

/**
 * Linear: Ordinary dense layer, the layer HashKernel replaces.
 *
 * W has shape (out_dim x in_dim); the optional bias is (1 x out_dim).
 * Default initialization is uniform in [-1/sqrt(in), 1/sqrt(in)].
 */
class Linear : public Layer {
public:
    Linear(size_t in_features, size_t out_features, bool bias = true, uint64_t seed = 42)
        : in_(in_features), out_(out_features) {
        if (in_features == 0 || out_features == 0) {
            throw ShapeMismatchError("Linear: dimensions must be > 0, got " +
                                     detail::shape_str(out_features, in_features));
        }

        std::mt19937_64 rng(seed);
        Float bound = 1.0f / std::sqrt(static_cast<Float>(in_features));
        std::uniform_real_distribution<Float> dist(-bound, bound);

        Matrix W(out_features, in_features);
        for (size_t i = 0; i < W.size(); ++i) W.data()[i] = dist(rng);
        weight_ = Parameter(std::move(W), ParamRole::Weight);

        if (bias) {
            Matrix b(1, out_features);
            for (size_t i = 0; i < b.size(); ++i) b.data()[i] = dist(rng);
            bias_ = Parameter(std::move(b), ParamRole::Bias);
        }
    }

    /// Build from explicit weights (out x in) and optional bias (1 x out)
    Linear(Matrix weight, std::optional<Matrix> bias = std::nullopt)
        : in_(weight.cols()), out_(weight.rows()) {
        if (weight.empty()) {
            throw ShapeMismatchError("Linear: empty weight matrix");
        }
        if (bias && (bias->rows() != 1 || bias->cols() != out_)) {
            throw ShapeMismatchError("Linear: bias " + bias->shape_string() +
                                     " does not match " + detail::shape_str(1, out_));
        }
        weight_ = Parameter(std::move(weight), ParamRole::Weight);
        if (bias) bias_ = Parameter(std::move(*bias), ParamRole::Bias);
    }

    std::string type_name() const override { return "Linear"; }

    size_t in_features() const override { return in_; }
    size_t out_features() const override { return out_; }

    bool has_bias() const { return bias_.has_value(); }

    Parameter& weight() { return weight_; }
    const Parameter& weight() const { return weight_; }
    Parameter* bias() { return bias_ ? &*bias_ : nullptr; }
    const Parameter* bias() const { return bias_ ? &*bias_ : nullptr; }

    Matrix forward(const Matrix& x) override {
        detail::check_input(x, in_, "Linear");
        if (is_training()) last_input_ = x;
        return detail::affine_forward(x, weight_.value(), bias());
    }

    Matrix backward(const Matrix& grad_out) override {
        if (last_input_.empty() || grad_out.rows() != last_input_.rows() ||
            grad_out.cols() != out_) {
            throw ShapeMismatchError("Linear::backward: gradient " + grad_out.shape_string() +
                                     " does not follow a training-mode forward");
        }

        const Matrix& W = weight_.value();
        const size_t batch = grad_out.rows();
        Matrix& dW = weight_.grad();
        Matrix dx(batch, in_);

        for (size_t b = 0; b < batch; ++b) {
            const Float* g = grad_out.row(b);
            const Float* xb = last_input_.row(b);
            Float* dxb = dx.row(b);
            for (size_t o = 0; o < out_; ++o) {
                const Float go = g[o];
                if (go == 0.0f) continue;
                Float* dWo = dW.row(o);
                const Float* Wo = W.row(o);
                for (size_t i = 0; i < in_; ++i) {
                    dWo[i] += go * xb[i];
                    dxb[i] += go * Wo[i];
                }
            }
            if (bias_) {
                Float* db = bias_->grad().row(0);
                for (size_t o = 0; o < out_; ++o) db[o] += g[o];
            }
        }
        return dx;
    }

    std::unique_ptr<Layer> clone() const override {
        return std::make_unique<Linear>(*this);
    }

    std::vector<NamedParameter> local_parameters() override {
        std::vector<NamedParameter> params{{"weight", &weight_}};
        if (bias_) params.emplace_back("bias", &*bias_);
        return params;
    }

private:
    size_t in_;
    size_t out_;
    Parameter weight_;
    std::optional<Parameter> bias_;
    Matrix last_input_;
};

}  // namespace hashmv
