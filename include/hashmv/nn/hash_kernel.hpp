#pragma once

#include "../api/config.hpp"
#include "../autograd/straight_through.hpp"
#include "../core/codes.hpp"
#include "../core/debug.hpp"
#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "../core/parameter.hpp"
#include "../distance/similarity.hpp"
#include "../encoder/normalizer.hpp"
#include "../encoder/projection.hpp"
#include "../encoder/sign_hasher.hpp"
#include "layer.hpp"
#include "linear.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifdef HASHMV_USE_OPENMP
#include <omp.h>
#endif

namespace hashmv {

/**
 * KernelStats: Counters that make weight-code caching observable.
 */
struct KernelStats {
    uint64_t forward_calls = 0;
    uint64_t weight_code_builds = 0;
    uint64_t weight_code_reuses = 0;
};

// ============================================================================
// HashKernel: Hash-based drop-in replacement for Linear
// ============================================================================

/**
 * HashKernel: Approximates y = x W^T + b with sign codes and Hamming
 * agreement instead of multiply-accumulate.
 *
 * Forward Process (per input row x, output row o):
 *   1. u = x / ||x||,  v_o = W_o / ||W_o||     (original norms retained)
 *   2. h_x = sign(P u),  h_W[o] = sign(P v_o)   (k bits each)
 *   3. s = 1 - 2 * hamming(h_x, h_W[o]) / k
 *   4. y[o] = ||W_o|| * ||x|| * cos(pi/2 * (1 - s)) + b[o]
 *
 * The projection source decides the variant: RandomProj keeps P frozen,
 * LearnedProj trains it. Both share every other step.
 *
 * Weight codes h_W:
 *   - training mode: rebuilt on every forward call
 *   - evaluation mode: cached, rebuilt when the version of W or P changed
 *     (or always, when cache_in_eval is off)
 *
 * Backward:
 *   - bias and the norm path (||W_o||, ||x||) receive exact gradients
 *   - with straight-through enabled (always for LearnedProj), gradients
 *     pass through sign() as identity (clipped to |v| <= ste_clip) and
 *     reach P, W and x through the codes
 */
class HashKernel : public Layer {
public:
    /**
     * Construct with uninitialized weights; forward() throws
     * UntrainedStateError until set_weights() or a checkpoint load.
     */
    HashKernel(size_t in_features, size_t out_features, bool bias,
               const KernelConfig& config, uint64_t seed)
        : in_(in_features)
        , out_(out_features)
        , normalizer_(config.norm_guard, config.epsilon)
        , ste_(config.ste_clip)
        , straight_through_(config.uses_straight_through())
        , cache_in_eval_(config.cache_in_eval) {

        config.validate();
        if (in_features == 0 || out_features == 0) {
            throw ShapeMismatchError("HashKernel: dimensions must be > 0, got " +
                                     detail::shape_str(out_features, in_features));
        }

        projection_ = make_projection(config.variant, config.k, in_features, seed);
        weight_ = Parameter(Matrix(out_features, in_features), ParamRole::Weight);
        if (bias) {
            bias_ = Parameter(Matrix(1, out_features), ParamRole::Bias);
        }
    }

    /// Construct seeded with a copy of `weight` (out x in) and `bias` (1 x out)
    HashKernel(const Matrix& weight, const std::optional<Matrix>& bias,
               const KernelConfig& config, uint64_t seed)
        : HashKernel(weight.cols(), weight.rows(), bias.has_value(), config, seed) {
        set_weights(weight, bias);
    }

    /// Copy W and b out of a Linear layer
    static std::unique_ptr<HashKernel> from_linear(const Linear& linear,
                                                   const KernelConfig& config,
                                                   uint64_t seed) {
        std::optional<Matrix> bias;
        if (linear.bias()) bias = linear.bias()->value();
        auto kernel = std::make_unique<HashKernel>(linear.weight().value(), bias, config, seed);
        kernel->train(linear.is_training());
        return kernel;
    }

    HashKernel(const HashKernel& other)
        : Layer(other)
        , in_(other.in_)
        , out_(other.out_)
        , normalizer_(other.normalizer_)
        , ste_(other.ste_)
        , straight_through_(other.straight_through_)
        , cache_in_eval_(other.cache_in_eval_)
        , weights_initialized_(other.weights_initialized_)
        , projection_(other.projection_->clone())
        , weight_(other.weight_)
        , bias_(other.bias_)
        , weight_codes_(other.weight_codes_)
        , stats_(other.stats_) {}

    HashKernel& operator=(const HashKernel&) = delete;

    // ------------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------------

    /**
     * Replace W (and b). Shapes must match the kernel.
     * @throws ShapeMismatchError on shape mismatch
     * @throws DegenerateVectorError on a zero weight row under NormGuard::Raise
     */
    void set_weights(const Matrix& weight, const std::optional<Matrix>& bias = std::nullopt) {
        if (weight.rows() != out_ || weight.cols() != in_) {
            throw ShapeMismatchError("HashKernel: weight " + weight.shape_string() +
                                     " does not match " + detail::shape_str(out_, in_));
        }
        if (bias) {
            if (!bias_) {
                throw ShapeMismatchError("HashKernel: bias given to a kernel without bias");
            }
            if (bias->rows() != 1 || bias->cols() != out_) {
                throw ShapeMismatchError("HashKernel: bias " + bias->shape_string() +
                                         " does not match " + detail::shape_str(1, out_));
            }
        }

        check_weight_rows(weight);
        weight_.assign(weight);
        if (bias) bias_->assign(*bias);
        weights_initialized_ = true;
        weight_codes_.reset();
    }

    bool initialized() const { return weights_initialized_; }

    KernelVariant variant() const { return projection_->variant(); }
    size_t k() const { return projection_->k(); }
    bool uses_straight_through() const { return straight_through_; }
    Float ste_clip() const { return ste_.clip(); }
    NormGuard norm_guard() const { return normalizer_.guard(); }

    Parameter& weight() { return weight_; }
    const Parameter& weight() const { return weight_; }
    Parameter* bias() { return bias_ ? &*bias_ : nullptr; }
    const Parameter* bias() const { return bias_ ? &*bias_ : nullptr; }
    ProjectionSource& projection() { return *projection_; }
    const ProjectionSource& projection() const { return *projection_; }

    const KernelStats& stats() const { return stats_; }

    /// Drop cached weight codes; the next use rebuilds them
    void invalidate_codes() { weight_codes_.reset(); }

    // ------------------------------------------------------------------------
    // Layer interface
    // ------------------------------------------------------------------------

    std::string type_name() const override { return "HashKernel"; }

    size_t in_features() const override { return in_; }
    size_t out_features() const override { return out_; }

    Matrix forward(const Matrix& x) override {
        require_initialized();
        detail::check_input(x, in_, "HashKernel");
        ++stats_.forward_calls;

        std::shared_ptr<const WeightCodes> wc =
            refresh_weight_codes(is_training() || !cache_in_eval_);

        NormalizedRows xn = normalizer_.normalize(x);
        Matrix x_pre;
        SignCodes x_codes = SignHasher::hash(xn.unit, projection_->matrix(),
                                             is_training() ? &x_pre : nullptr);
        Matrix s = SimilarityReconstructor::agreement_matrix(x_codes, wc->codes);
        Matrix y = reconstruct(s, xn.norms, wc->rows.norms);

        if (is_training()) {
            last_ = std::make_unique<ForwardCache>(ForwardCache{
                x, std::move(xn), std::move(x_pre), std::move(x_codes), std::move(s), wc});
        }
        return y;
    }

    Matrix backward(const Matrix& grad_out) override {
        if (!last_) {
            throw UntrainedStateError("HashKernel::backward requires a training-mode forward");
        }
        const ForwardCache& fc = *last_;
        const WeightCodes& wc = *fc.weights;
        const size_t batch = fc.input.rows();
        if (grad_out.rows() != batch || grad_out.cols() != out_) {
            throw ShapeMismatchError("HashKernel::backward: gradient " + grad_out.shape_string() +
                                     " does not match " + detail::shape_str(batch, out_));
        }

        // Reconstruction: y = nw * nx * cos(s) + b
        Matrix gs(batch, out_);
        std::vector<Float> d_nx(batch, 0.0f);
        std::vector<Float> d_nw(out_, 0.0f);
        Float* db = bias_ ? bias_->grad().row(0) : nullptr;

        for (size_t b = 0; b < batch; ++b) {
            const Float* g = grad_out.row(b);
            const Float* s = fc.s.row(b);
            const Float nx = fc.x.norms[b];
            for (size_t o = 0; o < out_; ++o) {
                if (db) db[o] += g[o];
                if (g[o] == 0.0f) continue;
                const Float nw = wc.rows.norms[o];
                const Float c = SimilarityReconstructor::cosine(s[o]);
                d_nw[o] += g[o] * nx * c;
                d_nx[b] += g[o] * nw * c;
                gs(b, o) = g[o] * nw * nx * SimilarityReconstructor::cosine_grad(s[o]);
            }
        }

        Matrix d_ux(batch, in_);
        Matrix d_uw(out_, in_);
        if (straight_through_) {
            straight_through_backward(fc, wc, gs, d_ux, d_uw);
        }

        // Normalization: u = v / ||v||
        Matrix& dW = weight_.grad();
        const Matrix& W = weight_.value();
        for (size_t o = 0; o < out_; ++o) {
            norm_backward(W.row(o), wc.rows.unit.row(o), wc.rows.norms[o],
                          d_uw.row(o), d_nw[o], dW.row(o));
        }

        Matrix dx(batch, in_);
        for (size_t b = 0; b < batch; ++b) {
            norm_backward(fc.input.row(b), fc.x.unit.row(b), fc.x.norms[b],
                          d_ux.row(b), d_nx[b], dx.row(b));
        }
        return dx;
    }

    std::unique_ptr<Layer> clone() const override {
        return std::make_unique<HashKernel>(*this);
    }

    std::vector<NamedParameter> local_parameters() override {
        std::vector<NamedParameter> params{{"weight", &weight_}};
        if (bias_) params.emplace_back("bias", &*bias_);
        params.emplace_back("projection", &projection_->parameter());
        return params;
    }

    void validate_state(const LocalState& incoming) const override {
        if (auto it = incoming.find("projection"); it != incoming.end()) {
            ProjectionSource::check_rows(*it->second);
        }
        if (auto it = incoming.find("weight"); it != incoming.end()) {
            check_weight_rows(*it->second);
        }
    }

    void on_state_loaded() override {
        projection_->validate();
        check_weight_rows(weight_.value());
        weights_initialized_ = true;
        weight_codes_.reset();
        last_.reset();
    }

    // ------------------------------------------------------------------------
    // Inspection
    // ------------------------------------------------------------------------

    /**
     * Current weight codes h_W (out x k), rebuilt if W or P changed.
     */
    const SignCodes& weight_codes() {
        require_initialized();
        return refresh_weight_codes(false)->codes;
    }

    /**
     * Input codes h_x (batch x k) for `x`; no state is touched.
     */
    SignCodes input_codes(const Matrix& x) const {
        detail::check_input(x, in_, "HashKernel");
        NormalizedRows xn = normalizer_.normalize(x);
        return SignHasher::hash(xn.unit, projection_->matrix());
    }

    /// Exact x W^T + b with the kernel's current parameters
    Matrix exact_forward(const Matrix& x) const {
        require_initialized();
        detail::check_input(x, in_, "HashKernel");
        return detail::affine_forward(x, weight_.value(), bias());
    }

protected:
    void on_mode_change() override {
        if (!is_training()) last_.reset();
    }

private:
    struct WeightCodes {
        NormalizedRows rows;
        Matrix pre_sign;   // P v_o for every row (out x k)
        SignCodes codes;
        uint64_t weight_version = 0;
        uint64_t projection_version = 0;
    };

    struct ForwardCache {
        Matrix input;
        NormalizedRows x;
        Matrix x_pre_sign;  // P u for every input row (batch x k)
        SignCodes x_codes;
        Matrix s;
        std::shared_ptr<const WeightCodes> weights;
    };

    void require_initialized() const {
        if (!weights_initialized_) {
            throw UntrainedStateError("HashKernel: weights are not initialized");
        }
        if (projection_->k() == 0 || projection_->in_dim() != in_) {
            throw UntrainedStateError("HashKernel: projection is not initialized");
        }
    }

    void check_weight_rows(const Matrix& W) const {
        if (normalizer_.guard() != NormGuard::Raise) return;
        for (size_t o = 0; o < W.rows(); ++o) {
            if (l2_norm(W.row(o), W.cols()) == 0.0f) {
                throw DegenerateVectorError("HashKernel: weight row " + std::to_string(o) +
                                            " has zero norm");
            }
        }
    }

    std::shared_ptr<const WeightCodes> refresh_weight_codes(bool force) {
        const uint64_t wv = weight_.version();
        const uint64_t pv = projection_->parameter().version();
        const bool stale = !weight_codes_ ||
                           weight_codes_->weight_version != wv ||
                           weight_codes_->projection_version != pv;

        if (!force && !stale) {
            ++stats_.weight_code_reuses;
            return weight_codes_;
        }

        if (!weight_codes_ || weight_codes_->projection_version != pv) {
            projection_->validate();
        }

        auto wc = std::make_shared<WeightCodes>();
        wc->rows = normalizer_.normalize(weight_.value());
        wc->codes = SignHasher::hash(wc->rows.unit, projection_->matrix(), &wc->pre_sign);
        wc->weight_version = wv;
        wc->projection_version = pv;
        weight_codes_ = std::move(wc);

        ++stats_.weight_code_builds;
        HASHMV_DEBUG_DETAIL("HashKernel: rebuilt " << out_ << "x" << k()
                            << " weight codes (build " << stats_.weight_code_builds << ")");
        return weight_codes_;
    }

    Matrix reconstruct(const Matrix& s, const std::vector<Float>& x_norms,
                       const std::vector<Float>& w_norms) const {
        const size_t batch = s.rows();
        Matrix y(batch, out_);
        const Float* b = bias_ ? bias_->value().row(0) : nullptr;

#ifdef HASHMV_USE_OPENMP
        #pragma omp parallel for schedule(static)
#endif
        for (size_t r = 0; r < batch; ++r) {
            const Float* srow = s.row(r);
            Float* yrow = y.row(r);
            for (size_t o = 0; o < out_; ++o) {
                yrow[o] = SimilarityReconstructor::reconstruct(srow[o], w_norms[o], x_norms[r]);
                if (b) yrow[o] += b[o];
            }
        }
        return y;
    }

    /**
     * s = (h_x . h_W[o]) / k, so ds/dh_x = h_W[o] / k and ds/dh_W[o] = h_x / k.
     * sign() passes the gradient through unchanged inside the clip range.
     */
    void straight_through_backward(const ForwardCache& fc, const WeightCodes& wc,
                                   const Matrix& gs, Matrix& d_ux, Matrix& d_uw) {
        const Matrix& P = projection_->matrix();
        const size_t batch = gs.rows();
        const size_t k = P.rows();
        const Float inv_k = 1.0f / static_cast<Float>(k);

        Matrix d_hx(batch, k);
        Matrix d_hw(out_, k);
        for (size_t b = 0; b < batch; ++b) {
            const Float* g = gs.row(b);
            Float* dhx = d_hx.row(b);
            for (size_t o = 0; o < out_; ++o) {
                if (g[o] == 0.0f) continue;
                const Float scaled = g[o] * inv_k;
                Float* dhw = d_hw.row(o);
                for (size_t i = 0; i < k; ++i) {
                    dhx[i] += scaled * static_cast<Float>(wc.codes.sign(o, i));
                    dhw[i] += scaled * static_cast<Float>(fc.x_codes.sign(b, i));
                }
            }
        }

        const Matrix d_px = ste_.backward(fc.x_pre_sign, d_hx);
        const Matrix d_pw = ste_.backward(wc.pre_sign, d_hw);

        // z = P u: dL/dP += dz^T u, dL/du = dz P
        if (projection_->trainable()) {
            Matrix& dP = projection_->parameter().grad();
            accumulate_outer(d_px, fc.x.unit, dP);
            accumulate_outer(d_pw, wc.rows.unit, dP);
        }
        accumulate_product(d_px, P, d_ux);
        accumulate_product(d_pw, P, d_uw);
    }

    /// out (k x n) += dz^T (k x rows) * u (rows x n)
    static void accumulate_outer(const Matrix& dz, const Matrix& u, Matrix& out) {
        for (size_t r = 0; r < dz.rows(); ++r) {
            const Float* dzr = dz.row(r);
            const Float* ur = u.row(r);
            for (size_t i = 0; i < dz.cols(); ++i) {
                if (dzr[i] == 0.0f) continue;
                Float* orow = out.row(i);
                for (size_t c = 0; c < u.cols(); ++c) {
                    orow[c] += dzr[i] * ur[c];
                }
            }
        }
    }

    /// out (rows x n) += dz (rows x k) * P (k x n)
    static void accumulate_product(const Matrix& dz, const Matrix& P, Matrix& out) {
#ifdef HASHMV_USE_OPENMP
        #pragma omp parallel for schedule(static)
#endif
        for (size_t r = 0; r < dz.rows(); ++r) {
            const Float* dzr = dz.row(r);
            Float* orow = out.row(r);
            for (size_t i = 0; i < dz.cols(); ++i) {
                if (dzr[i] == 0.0f) continue;
                const Float* prow = P.row(i);
                for (size_t c = 0; c < P.cols(); ++c) {
                    orow[c] += dzr[i] * prow[c];
                }
            }
        }
    }

    /**
     * Backward of u = v / ||v|| plus the retained-norm path:
     *   dv += (du - u (u . du)) / ||v|| + u * dnorm
     * Under an epsilon floor the divisor is constant, so dv += du / eps.
     */
    void norm_backward(const Float* v, const Float* u, Float norm,
                       const Float* du, Float d_norm, Float* dv) const {
        const Float divisor = normalizer_.divisor_for(norm);
        if (norm > 0.0f && divisor == norm) {
            const Float proj = dot(u, du, in_);
            for (size_t i = 0; i < in_; ++i) {
                dv[i] += (du[i] - u[i] * proj) / norm + u[i] * d_norm;
            }
            return;
        }
        for (size_t i = 0; i < in_; ++i) {
            dv[i] += du[i] / divisor;
            if (norm > 0.0f) dv[i] += v[i] / norm * d_norm;
        }
    }

    size_t in_;
    size_t out_;
    VectorNormalizer normalizer_;
    StraightThroughSign ste_;
    bool straight_through_;
    bool cache_in_eval_;
    bool weights_initialized_ = false;

    std::unique_ptr<ProjectionSource> projection_;
    Parameter weight_;
    std::optional<Parameter> bias_;

    std::shared_ptr<const WeightCodes> weight_codes_;
    std::unique_ptr<ForwardCache> last_;
    KernelStats stats_;
};

}  // namespace hashmv
