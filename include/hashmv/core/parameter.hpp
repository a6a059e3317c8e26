#pragma once

#include "matrix.hpp"
#include "types.hpp"
#include <cstdint>
#include <utility>

namespace hashmv {

/**
 * ParamRole: What a parameter is, so an optimizer can apply
 * independently configured learning rates.
 */
enum class ParamRole : uint8_t {
    Weight = 0,
    Bias = 1,
    Projection = 2,
};

// ============================================================================
// Parameter: Value + gradient + version counter
// ============================================================================

/**
 * Parameter: A named tensor owned by a layer.
 *
 * Every mutable access bumps version(), which lets derived caches (the
 * weight hash codes of a HashKernel) detect that the value may have
 * changed since they were built. Frozen parameters (trainable() == false)
 * still serialize but are skipped by the optimizer.
 */
class Parameter {
public:
    Parameter() = default;

    Parameter(Matrix value, ParamRole role, bool trainable = true)
        : value_(std::move(value)), role_(role), trainable_(trainable) {}

    const Matrix& value() const { return value_; }

    Matrix& mutable_value() {
        ++version_;
        return value_;
    }

    void assign(Matrix value) {
        value_ = std::move(value);
        ++version_;
    }

    /// Gradient buffer, allocated on first use with the value's shape
    Matrix& grad() {
        if (!grad_.same_shape(value_)) {
            grad_ = Matrix(value_.rows(), value_.cols());
        }
        return grad_;
    }

    const Matrix& grad() const { return grad_; }

    bool has_grad() const { return !grad_.empty() && grad_.same_shape(value_); }

    void zero_grad() {
        if (has_grad()) grad_.fill(0.0f);
    }

    ParamRole role() const { return role_; }
    bool trainable() const { return trainable_; }
    void set_trainable(bool trainable) { trainable_ = trainable; }

    uint64_t version() const { return version_; }

private:
    Matrix value_;
    Matrix grad_;
    ParamRole role_ = ParamRole::Weight;
    bool trainable_ = true;
    uint64_t version_ = 0;
};

}  // namespace hashmv
