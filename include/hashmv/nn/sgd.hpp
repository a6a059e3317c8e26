#pragma once

#include "../core/errors.hpp"
#include "../core/parameter.hpp"
#include "layer.hpp"
#include <utility>
#include <vector>

namespace hashmv {

/**
 * SGDConfig: Plain SGD with per-role learning rates.
 *
 * Projection matrices usually want a smaller rate than weights; frozen
 * parameters are never updated regardless of their rate.
 */
struct SGDConfig {
    Float lr_weight = 0.01f;
    Float lr_bias = 0.01f;
    Float lr_projection = 0.001f;
    Float momentum = 0.0f;

    // Builder pattern
    SGDConfig& set_lr(Float lr) { lr_weight = lr; lr_bias = lr; return *this; }
    SGDConfig& set_lr_weight(Float lr) { lr_weight = lr; return *this; }
    SGDConfig& set_lr_bias(Float lr) { lr_bias = lr; return *this; }
    SGDConfig& set_lr_projection(Float lr) { lr_projection = lr; return *this; }
    SGDConfig& set_momentum(Float m) { momentum = m; return *this; }

    Float lr_for(ParamRole role) const {
        switch (role) {
            case ParamRole::Weight: return lr_weight;
            case ParamRole::Bias: return lr_bias;
            case ParamRole::Projection: return lr_projection;
        }
        return 0.0f;
    }
};

// ============================================================================
// SGD
// ============================================================================

class SGD {
public:
    SGD(Layer& model, SGDConfig config)
        : config_(std::move(config)) {
        if (config_.momentum < 0.0f || config_.momentum >= 1.0f) {
            throw InvalidConfigError("SGD momentum must be in [0, 1)");
        }
        for (auto& [name, param] : named_parameters(model)) {
            if (param->trainable()) {
                params_.push_back(param);
            }
        }
        velocity_.resize(params_.size());
    }

    const SGDConfig& config() const { return config_; }
    size_t num_parameters() const { return params_.size(); }

    void zero_grad() {
        for (Parameter* p : params_) p->zero_grad();
    }

    /**
     * value -= lr * (momentum * velocity + grad). Parameters without a
     * gradient are left alone (and keep their version).
     */
    void step() {
        for (size_t i = 0; i < params_.size(); ++i) {
            Parameter& p = *params_[i];
            if (!p.has_grad()) continue;

            const Float lr = config_.lr_for(p.role());
            const Matrix& g = p.grad();
            Matrix& v = velocity_[i];
            if (!v.same_shape(g)) v = Matrix(g.rows(), g.cols());

            Matrix& value = p.mutable_value();
            for (size_t j = 0; j < value.size(); ++j) {
                v.data()[j] = config_.momentum * v.data()[j] + g.data()[j];
                value.data()[j] -= lr * v.data()[j];
            }
        }
    }

private:
    SGDConfig config_;
    std::vector<Parameter*> params_;
    std::vector<Matrix> velocity_;
};

}  // namespace hashmv
