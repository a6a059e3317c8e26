#include <gtest/gtest.h>
#include "hashmv/nn/hash_kernel.hpp"
#include "hashmv/nn/loss.hpp"
#include "hashmv/nn/sgd.hpp"
#include <cmath>
#include <random>
#include <vector>

using namespace hashmv;

// ============================================================================
// Test Utilities
// ============================================================================

Matrix random_matrix(size_t rows, size_t cols, std::mt19937_64& rng, Float stddev = 1.0f) {
    std::normal_distribution<Float> dist(0.0f, stddev);
    Matrix m(rows, cols);
    for (size_t i = 0; i < m.size(); ++i) m.data()[i] = dist(rng);
    return m;
}

/// Rows = scale_r * (direction + noise), so every pair of rows is nearly parallel
Matrix aligned_rows(const std::vector<Float>& direction, size_t rows, Float noise,
                    std::mt19937_64& rng) {
    std::normal_distribution<Float> dist(0.0f, noise);
    std::uniform_real_distribution<Float> scale(0.5f, 2.0f);
    Matrix m(rows, direction.size());
    for (size_t r = 0; r < rows; ++r) {
        const Float s = scale(rng);
        for (size_t c = 0; c < direction.size(); ++c) {
            m(r, c) = s * (direction[c] + dist(rng));
        }
    }
    return m;
}

std::vector<Float> random_direction(size_t dim, std::mt19937_64& rng) {
    std::normal_distribution<Float> dist(0.0f, 1.0f);
    std::vector<Float> d(dim);
    for (auto& v : d) v = dist(rng);
    return d;
}

Float frobenius(const Matrix& m) {
    return l2_norm(m.data(), m.size());
}

Float relative_error(const Matrix& approx, const Matrix& exact) {
    Matrix diff = approx;
    for (size_t i = 0; i < diff.size(); ++i) diff.data()[i] -= exact.data()[i];
    return frobenius(diff) / frobenius(exact);
}

Float elementwise_dot(const Matrix& a, const Matrix& b) {
    return dot(a.data(), b.data(), a.size());
}

// ============================================================================
// Forward
// ============================================================================

TEST(HashKernelTest, ForwardShapeMatchesLinear) {
    std::mt19937_64 rng(1);
    HashKernel kernel(random_matrix(7, 12, rng), random_matrix(1, 7, rng),
                      KernelConfig().set_k(32), 5);

    Matrix y = kernel.forward(random_matrix(3, 12, rng));
    EXPECT_EQ(y.rows(), 3u);
    EXPECT_EQ(y.cols(), 7u);
    EXPECT_EQ(kernel.in_features(), 12u);
    EXPECT_EQ(kernel.out_features(), 7u);
    EXPECT_EQ(kernel.k(), 32u);
    EXPECT_EQ(kernel.type_name(), "HashKernel");
    EXPECT_EQ(kernel.norm_guard(), NormGuard::Raise);
    EXPECT_TRUE(std::isinf(kernel.ste_clip()));
}

// With k = 512 the reconstruction stays within a few percent of W x + b
TEST(HashKernelTest, LargeKApproximatesExactOutput) {
    std::mt19937_64 rng(2);
    const size_t dim = 32;
    std::vector<Float> d = random_direction(dim, rng);
    Matrix W = aligned_rows(d, 6, 0.1f, rng);
    Matrix x = aligned_rows(d, 4, 0.1f, rng);

    for (KernelVariant variant : {KernelVariant::RandomProj, KernelVariant::LearnedProj}) {
        HashKernel kernel(W, random_matrix(1, 6, rng, 0.1f),
                          KernelConfig().set_variant(variant).set_k(512), 17);
        kernel.eval();

        Matrix approx = kernel.forward(x);
        Matrix exact = kernel.exact_forward(x);
        EXPECT_LT(relative_error(approx, exact), 0.05f) << variant_name(variant);
    }
}

// Output magnitude is exactly ||W_o|| * ||x|| * cos(...) + b
TEST(HashKernelTest, SingleBitStillProducesValidOutput) {
    std::mt19937_64 rng(3);
    Matrix W = random_matrix(5, 9, rng);
    Matrix b = random_matrix(1, 5, rng);
    Matrix x = random_matrix(4, 9, rng);

    HashKernel kernel(W, b, KernelConfig().set_k(1), 3);
    Matrix y = kernel.forward(x);

    for (size_t r = 0; r < x.rows(); ++r) {
        const Float nx = l2_norm(x.row(r), 9);
        for (size_t o = 0; o < W.rows(); ++o) {
            const Float nw = l2_norm(W.row(o), 9);
            ASSERT_TRUE(std::isfinite(y(r, o)));
            EXPECT_NEAR(std::abs(y(r, o) - b(0, o)), nw * nx, 1e-4f * nw * nx);
        }
    }
}

TEST(HashKernelTest, IdenticalDirectionsReconstructExactly) {
    Matrix W = Matrix::from_rows({{1.0f, 2.0f, -1.0f}, {-2.0f, -4.0f, 2.0f}});
    Matrix x = Matrix::from_rows({{0.5f, 1.0f, -0.5f}});

    HashKernel kernel(W, std::nullopt, KernelConfig().set_k(64), 8);
    Matrix y = kernel.forward(x);

    // Row 0 is parallel to x, row 1 anti-parallel
    EXPECT_NEAR(y(0, 0), dot(W.row(0), x.row(0), 3), 1e-4f);
    EXPECT_NEAR(y(0, 1), dot(W.row(1), x.row(0), 3), 1e-4f);
}

// ============================================================================
// Weight-code caching
// ============================================================================

TEST(HashKernelTest, EvalModeCachesWeightCodes) {
    std::mt19937_64 rng(4);
    HashKernel kernel(random_matrix(4, 6, rng), std::nullopt, KernelConfig().set_k(16), 1);
    kernel.eval();
    Matrix x = random_matrix(2, 6, rng);

    Matrix y1 = kernel.forward(x);
    Matrix y2 = kernel.forward(x);

    EXPECT_EQ(kernel.stats().forward_calls, 2u);
    EXPECT_EQ(kernel.stats().weight_code_builds, 1u);
    EXPECT_EQ(kernel.stats().weight_code_reuses, 1u);
    EXPECT_EQ(y1, y2);

    kernel.invalidate_codes();
    EXPECT_EQ(kernel.forward(x), y1);
    EXPECT_EQ(kernel.stats().weight_code_builds, 2u);
}

TEST(HashKernelTest, WeightMutationInvalidatesCache) {
    std::mt19937_64 rng(5);
    HashKernel kernel(random_matrix(4, 6, rng), std::nullopt, KernelConfig().set_k(64), 1);
    kernel.eval();
    Matrix x = random_matrix(2, 6, rng);

    kernel.forward(x);
    Matrix& W = kernel.weight().mutable_value();
    for (size_t i = 0; i < W.size(); ++i) W.data()[i] = -W.data()[i];
    kernel.forward(x);

    EXPECT_EQ(kernel.stats().weight_code_builds, 2u);

    // Cached codes now describe the negated weights
    SignCodes fresh = SignHasher::hash(VectorNormalizer().normalize(kernel.weight().value()).unit,
                                       kernel.projection().matrix());
    EXPECT_EQ(kernel.weight_codes(), fresh);
    EXPECT_EQ(kernel.stats().weight_code_builds, 2u);
}

TEST(HashKernelTest, ProjectionMutationInvalidatesCache) {
    std::mt19937_64 rng(6);
    HashKernel kernel(random_matrix(4, 6, rng), std::nullopt,
                      KernelConfig().set_variant(KernelVariant::LearnedProj).set_k(16), 1);
    kernel.eval();
    Matrix x = random_matrix(2, 6, rng);

    kernel.forward(x);
    kernel.projection().parameter().mutable_value()(0, 0) += 0.5f;
    kernel.forward(x);

    EXPECT_EQ(kernel.stats().weight_code_builds, 2u);
}

TEST(HashKernelTest, TrainingModeRebuildsEveryForward) {
    std::mt19937_64 rng(7);
    HashKernel kernel(random_matrix(4, 6, rng), std::nullopt, KernelConfig().set_k(16), 1);
    ASSERT_TRUE(kernel.is_training());
    Matrix x = random_matrix(2, 6, rng);

    kernel.forward(x);
    kernel.forward(x);
    kernel.forward(x);

    EXPECT_EQ(kernel.stats().weight_code_builds, 3u);
    EXPECT_EQ(kernel.stats().weight_code_reuses, 0u);
}

TEST(HashKernelTest, CacheCanBeDisabledInEval) {
    std::mt19937_64 rng(8);
    HashKernel kernel(random_matrix(4, 6, rng), std::nullopt,
                      KernelConfig().set_k(16).set_cache_in_eval(false), 1);
    kernel.eval();
    Matrix x = random_matrix(2, 6, rng);

    kernel.forward(x);
    kernel.forward(x);

    EXPECT_EQ(kernel.stats().weight_code_builds, 2u);
}

// ============================================================================
// Errors
// ============================================================================

TEST(HashKernelTest, UninitializedKernelRaises) {
    HashKernel kernel(4, 3, true, KernelConfig().set_k(8), 1);
    EXPECT_FALSE(kernel.initialized());
    EXPECT_THROW(kernel.forward(Matrix(1, 4, 1.0f)), UntrainedStateError);
    EXPECT_THROW(kernel.exact_forward(Matrix(1, 4, 1.0f)), UntrainedStateError);
    EXPECT_THROW(kernel.weight_codes(), UntrainedStateError);

    kernel.set_weights(Matrix(3, 4, 1.0f), Matrix(1, 3, 0.5f));
    EXPECT_TRUE(kernel.initialized());
    Matrix y = kernel.forward(Matrix(1, 4, 1.0f));
    // Every weight row is parallel to the input
    for (size_t o = 0; o < 3; ++o) EXPECT_NEAR(y(0, o), 4.5f, 1e-4f);
}

TEST(HashKernelTest, BackwardWithoutTrainingForwardRaises) {
    std::mt19937_64 rng(9);
    HashKernel kernel(random_matrix(3, 4, rng), std::nullopt, KernelConfig().set_k(8), 1);
    EXPECT_THROW(kernel.backward(Matrix(1, 3, 1.0f)), UntrainedStateError);

    kernel.eval();
    kernel.forward(random_matrix(1, 4, rng));
    EXPECT_THROW(kernel.backward(Matrix(1, 3, 1.0f)), UntrainedStateError);
}

TEST(HashKernelTest, ShapeMismatchRaises) {
    std::mt19937_64 rng(10);
    HashKernel kernel(random_matrix(3, 4, rng), std::nullopt, KernelConfig().set_k(8), 1);

    EXPECT_THROW(kernel.forward(Matrix(2, 5, 1.0f)), ShapeMismatchError);
    EXPECT_THROW(kernel.set_weights(Matrix(4, 3, 1.0f)), ShapeMismatchError);
    EXPECT_THROW(kernel.set_weights(Matrix(3, 4, 1.0f), Matrix(1, 3, 1.0f)), ShapeMismatchError);

    kernel.forward(Matrix(2, 4, 1.0f));
    EXPECT_THROW(kernel.backward(Matrix(2, 4, 1.0f)), ShapeMismatchError);
}

TEST(HashKernelTest, InvalidConfigRaises) {
    EXPECT_THROW((void)HashKernel(4, 3, false, KernelConfig().set_k(0), 1), InvalidConfigError);
    EXPECT_THROW((void)HashKernel(4, 3, false, KernelConfig().set_ste_clip(0.0f), 1), InvalidConfigError);
    EXPECT_THROW((void)HashKernel(0, 3, false, KernelConfig(), 1), ShapeMismatchError);
}

// Both variants treat a zero input row the same way
TEST(HashKernelTest, ZeroInputRaisesInBothVariants) {
    std::mt19937_64 rng(11);
    Matrix W = random_matrix(3, 4, rng);
    Matrix x = random_matrix(2, 4, rng);
    for (size_t c = 0; c < 4; ++c) x(1, c) = 0.0f;

    for (KernelVariant variant : {KernelVariant::RandomProj, KernelVariant::LearnedProj}) {
        HashKernel kernel(W, std::nullopt, KernelConfig().set_variant(variant).set_k(16), 1);
        EXPECT_THROW(kernel.forward(x), DegenerateVectorError) << variant_name(variant);
    }
}

TEST(HashKernelTest, EpsilonFloorMapsZeroInputToBias) {
    std::mt19937_64 rng(12);
    Matrix W = random_matrix(3, 4, rng);
    Matrix b = random_matrix(1, 3, rng);
    Matrix x = random_matrix(2, 4, rng);
    for (size_t c = 0; c < 4; ++c) x(1, c) = 0.0f;

    for (KernelVariant variant : {KernelVariant::RandomProj, KernelVariant::LearnedProj}) {
        HashKernel kernel(W, b, KernelConfig()
                                    .set_variant(variant)
                                    .set_k(16)
                                    .set_norm_guard(NormGuard::EpsilonFloor), 1);
        Matrix y = kernel.forward(x);
        for (size_t o = 0; o < 3; ++o) {
            EXPECT_TRUE(std::isfinite(y(0, o)));
            EXPECT_EQ(y(1, o), b(0, o));
        }
    }
}

TEST(HashKernelTest, ZeroWeightRowFollowsNormGuard) {
    Matrix W = Matrix::from_rows({{1.0f, 2.0f}, {0.0f, 0.0f}});
    EXPECT_THROW((void)HashKernel(W, std::nullopt, KernelConfig().set_k(8), 1), DegenerateVectorError);

    HashKernel guarded(W, Matrix::from_rows({{0.0f, 0.25f}}),
                       KernelConfig().set_k(8).set_norm_guard(NormGuard::EpsilonFloor), 1);
    Matrix y = guarded.forward(Matrix::from_rows({{3.0f, -1.0f}}));
    EXPECT_EQ(y(0, 1), 0.25f);
}

// ============================================================================
// Backward
// ============================================================================

// Output is homogeneous in ||W_o|| and ||x||, so sum(dW * W) = sum(dx * x) = sum(G * (y - b))
TEST(HashKernelTest, GradientsRespectScaleInvariance) {
    std::mt19937_64 rng(13);
    Matrix W = random_matrix(5, 8, rng);
    Matrix b = random_matrix(1, 5, rng);
    Matrix x = random_matrix(3, 8, rng);
    Matrix G = random_matrix(3, 5, rng);

    for (KernelVariant variant : {KernelVariant::RandomProj, KernelVariant::LearnedProj}) {
        HashKernel kernel(W, b, KernelConfig().set_variant(variant).set_k(32), 21);
        Matrix y = kernel.forward(x);
        Matrix dx = kernel.backward(G);

        Float expected = 0.0f;
        for (size_t r = 0; r < y.rows(); ++r) {
            for (size_t o = 0; o < y.cols(); ++o) expected += G(r, o) * (y(r, o) - b(0, o));
        }

        const Float tol = 1e-3f * (1.0f + std::abs(expected));
        EXPECT_NEAR(elementwise_dot(kernel.weight().grad(), W), expected, tol) << variant_name(variant);
        EXPECT_NEAR(elementwise_dot(dx, x), expected, tol) << variant_name(variant);

        for (size_t o = 0; o < 5; ++o) {
            Float col = 0.0f;
            for (size_t r = 0; r < 3; ++r) col += G(r, o);
            EXPECT_NEAR(kernel.bias()->grad()(0, o), col, 1e-5f);
        }
    }
}

// Without straight-through the weight gradient only rescales rows
TEST(HashKernelTest, RandomProjGradientIsRadialWithoutStraightThrough) {
    std::mt19937_64 rng(14);
    Matrix W = random_matrix(4, 6, rng);
    HashKernel kernel(W, std::nullopt, KernelConfig().set_k(32), 2);
    ASSERT_FALSE(kernel.uses_straight_through());

    kernel.forward(random_matrix(3, 6, rng));
    kernel.backward(random_matrix(3, 4, rng));

    const Matrix& dW = kernel.weight().grad();
    for (size_t o = 0; o < 4; ++o) {
        const Float nw = l2_norm(W.row(o), 6);
        const Float radial = dot(dW.row(o), W.row(o), 6) / nw;
        for (size_t c = 0; c < 6; ++c) {
            EXPECT_NEAR(dW(o, c), radial * W(o, c) / nw, 1e-4f);
        }
    }
    EXPECT_FALSE(kernel.projection().parameter().has_grad());
}

TEST(HashKernelTest, StraightThroughReachesProjectionAndWeights) {
    std::mt19937_64 rng(15);
    Matrix W = random_matrix(4, 6, rng);
    Matrix x = random_matrix(3, 6, rng);
    Matrix G = random_matrix(3, 4, rng);

    HashKernel learned(W, std::nullopt,
                       KernelConfig().set_variant(KernelVariant::LearnedProj).set_k(32), 2);
    ASSERT_TRUE(learned.uses_straight_through());
    learned.forward(x);
    learned.backward(G);

    const Parameter& P = learned.projection().parameter();
    ASSERT_TRUE(P.has_grad());
    EXPECT_GT(frobenius(P.grad()), 0.0f);

    // Tangential component of dW is non-zero once gradients pass through sign()
    const Matrix& dW = learned.weight().grad();
    Float tangential = 0.0f;
    for (size_t o = 0; o < 4; ++o) {
        const Float nw = l2_norm(W.row(o), 6);
        const Float radial = dot(dW.row(o), W.row(o), 6) / nw;
        for (size_t c = 0; c < 6; ++c) {
            const Float t = dW(o, c) - radial * W(o, c) / nw;
            tangential += t * t;
        }
    }
    EXPECT_GT(tangential, 0.0f);

    // RandomProj with straight-through: W gets the same path, P stays frozen
    HashKernel frozen(W, std::nullopt, KernelConfig().set_k(32).set_straight_through(true), 2);
    frozen.forward(x);
    frozen.backward(G);
    EXPECT_FALSE(frozen.projection().parameter().has_grad());
    for (size_t i = 0; i < dW.size(); ++i) {
        EXPECT_NEAR(frozen.weight().grad().data()[i], dW.data()[i], 1e-5f);
    }
}

// A clip range below every pre-sign magnitude zeroes the straight-through path
TEST(HashKernelTest, TightClipReducesToNormPath) {
    std::mt19937_64 rng(16);
    Matrix W = random_matrix(4, 6, rng);
    Matrix x = random_matrix(3, 6, rng);
    Matrix G = random_matrix(3, 4, rng);

    HashKernel plain(W, std::nullopt, KernelConfig().set_k(32), 4);
    HashKernel clipped(W, std::nullopt,
                       KernelConfig()
                           .set_variant(KernelVariant::LearnedProj)
                           .set_k(32)
                           .set_ste_clip(1e-30f), 4);
    ASSERT_EQ(plain.projection().matrix(), clipped.projection().matrix());

    plain.forward(x);
    clipped.forward(x);
    Matrix dx_plain = plain.backward(G);
    Matrix dx_clipped = clipped.backward(G);

    EXPECT_EQ(frobenius(clipped.projection().parameter().grad()), 0.0f);
    for (size_t i = 0; i < dx_plain.size(); ++i) {
        EXPECT_NEAR(dx_clipped.data()[i], dx_plain.data()[i], 1e-5f);
    }
    for (size_t i = 0; i < W.size(); ++i) {
        EXPECT_NEAR(clipped.weight().grad().data()[i], plain.weight().grad().data()[i], 1e-5f);
    }
}

// ============================================================================
// Training
// ============================================================================

TEST(HashKernelTest, SGDOnNormPathReducesLoss) {
    std::mt19937_64 rng(17);
    Matrix W = random_matrix(4, 6, rng);
    Matrix x = random_matrix(8, 6, rng);

    HashKernel kernel(W, Matrix(1, 4), KernelConfig().set_k(64), 3);
    Matrix target = kernel.exact_forward(x);
    for (size_t i = 0; i < target.size(); ++i) target.data()[i] = 2.0f * target.data()[i] + 0.5f;

    SGD sgd(kernel, SGDConfig().set_lr(0.01f));
    EXPECT_EQ(sgd.num_parameters(), 2u);  // projection is frozen

    Float first = 0.0f, last = 0.0f;
    for (int step = 0; step < 50; ++step) {
        sgd.zero_grad();
        Matrix grad;
        Float loss = mse_loss(kernel.forward(x), target, &grad);
        kernel.backward(grad);
        sgd.step();
        if (step == 0) first = loss;
        last = loss;
    }
    EXPECT_LT(last, first);
}

TEST(HashKernelTest, ProjectionLearningRateIsIndependent) {
    std::mt19937_64 rng(18);
    const KernelConfig config = KernelConfig().set_variant(KernelVariant::LearnedProj).set_k(16);
    Matrix x = random_matrix(4, 6, rng);
    Matrix G = random_matrix(4, 3, rng);

    HashKernel kernel(random_matrix(3, 6, rng), std::nullopt, config, 9);
    const Matrix P0 = kernel.projection().matrix();
    const Matrix W0 = kernel.weight().value();

    SGD frozen_p(kernel, SGDConfig().set_lr_weight(0.1f).set_lr_projection(0.0f));
    EXPECT_EQ(frozen_p.num_parameters(), 2u);
    kernel.forward(x);
    kernel.backward(G);
    frozen_p.step();
    EXPECT_EQ(kernel.projection().matrix(), P0);
    EXPECT_NE(kernel.weight().value(), W0);

    frozen_p.zero_grad();
    SGD moving_p(kernel, SGDConfig().set_lr_weight(0.0f).set_lr_projection(0.1f));
    const Matrix W1 = kernel.weight().value();
    kernel.forward(x);
    kernel.backward(G);
    moving_p.step();
    EXPECT_NE(kernel.projection().matrix(), P0);
    EXPECT_EQ(kernel.weight().value(), W1);

    // Next forward sees the updated projection
    const uint64_t builds = kernel.stats().weight_code_builds;
    kernel.eval();
    kernel.forward(x);
    EXPECT_EQ(kernel.stats().weight_code_builds, builds + 1);
}

TEST(HashKernelTest, CloneOwnsIndependentState) {
    std::mt19937_64 rng(19);
    HashKernel kernel(random_matrix(3, 5, rng), random_matrix(1, 3, rng),
                      KernelConfig().set_variant(KernelVariant::LearnedProj).set_k(16), 1);
    kernel.eval();
    Matrix x = random_matrix(2, 5, rng);
    Matrix before = kernel.forward(x);

    std::unique_ptr<Layer> copy = kernel.clone();
    kernel.weight().mutable_value().fill(1.0f);
    kernel.projection().parameter().mutable_value().fill(1.0f);

    EXPECT_EQ(copy->forward(x), before);
    EXPECT_FALSE(copy->is_training());
}
