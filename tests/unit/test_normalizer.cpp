#include <gtest/gtest.h>
#include "hashmv/encoder/normalizer.hpp"
#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace hashmv;

// Every non-zero row comes out with unit L2 norm
TEST(NormalizerTest, RowsHaveUnitNorm) {
    std::mt19937_64 rng(42);
    std::normal_distribution<Float> dist(0.0f, 3.0f);

    for (size_t dim : {1, 2, 7, 64, 300}) {
        Matrix m(16, dim);
        for (size_t i = 0; i < m.size(); ++i) m.data()[i] = dist(rng);

        NormalizedRows n = VectorNormalizer().normalize(m);
        ASSERT_EQ(n.norms.size(), m.rows());
        for (size_t r = 0; r < m.rows(); ++r) {
            EXPECT_NEAR(l2_norm(n.unit.row(r), dim), 1.0f, 1e-5f) << "dim=" << dim;
            EXPECT_NEAR(n.norms[r], l2_norm(m.row(r), dim), 1e-4f);
        }
    }
}

// The input matrix is copied, never rescaled in place
TEST(NormalizerTest, DoesNotMutateInput) {
    Matrix m = Matrix::from_rows({{3.0f, 4.0f}, {0.0f, 2.0f}});
    Matrix before = m;

    NormalizedRows n = VectorNormalizer().normalize(m);

    EXPECT_EQ(m, before);
    EXPECT_FLOAT_EQ(n.unit(0, 0), 0.6f);
    EXPECT_FLOAT_EQ(n.unit(0, 1), 0.8f);
    EXPECT_FLOAT_EQ(n.norms[0], 5.0f);
    EXPECT_FLOAT_EQ(n.norms[1], 2.0f);
}

TEST(NormalizerTest, ZeroRowRaises) {
    Matrix m = Matrix::from_rows({{1.0f, 1.0f}, {0.0f, 0.0f}});
    EXPECT_THROW(VectorNormalizer().normalize(m), DegenerateVectorError);
    EXPECT_THROW(normalize(std::vector<Float>{0.0f, 0.0f, 0.0f}), DegenerateVectorError);
}

TEST(NormalizerTest, NonFiniteRowRaises) {
    Matrix m = Matrix::from_rows({{std::numeric_limits<Float>::infinity(), 1.0f}});
    EXPECT_THROW(VectorNormalizer().normalize(m), DegenerateVectorError);
    EXPECT_THROW(VectorNormalizer(NormGuard::EpsilonFloor).normalize(m), DegenerateVectorError);
}

// Epsilon floor: zero row stays zero, no NaN, true norm retained
TEST(NormalizerTest, EpsilonFloorGuardsZeroRow) {
    Matrix m = Matrix::from_rows({{0.0f, 0.0f, 0.0f}, {0.0f, 2.0f, 0.0f}});
    NormalizedRows n = VectorNormalizer(NormGuard::EpsilonFloor, 1e-6f).normalize(m);

    for (size_t c = 0; c < 3; ++c) {
        EXPECT_FALSE(std::isnan(n.unit(0, c)));
        EXPECT_EQ(n.unit(0, c), 0.0f);
    }
    EXPECT_EQ(n.norms[0], 0.0f);
    EXPECT_FLOAT_EQ(n.unit(1, 1), 1.0f);
    EXPECT_FLOAT_EQ(n.norms[1], 2.0f);
}

TEST(NormalizerTest, SingleVectorHelper) {
    std::vector<Float> u = normalize({0.0f, -5.0f});
    ASSERT_EQ(u.size(), 2u);
    EXPECT_FLOAT_EQ(u[0], 0.0f);
    EXPECT_FLOAT_EQ(u[1], -1.0f);
}

// Components whose squares leave float range still normalize to unit length
TEST(NormalizerTest, TinyAndHugeComponentsNormalize) {
    const Float inv_sqrt2 = 0.70710678f;
    for (Float scale : {1e-23f, 1e-30f, 1e20f, 1e30f}) {
        std::vector<Float> u = normalize({scale, scale});
        ASSERT_EQ(u.size(), 2u);
        EXPECT_NEAR(u[0], inv_sqrt2, 1e-6f) << "scale=" << scale;
        EXPECT_NEAR(u[1], inv_sqrt2, 1e-6f) << "scale=" << scale;

        const double len = std::sqrt(static_cast<double>(u[0]) * u[0] +
                                     static_cast<double>(u[1]) * u[1]);
        EXPECT_NEAR(len, 1.0, 1e-6) << "scale=" << scale;

        Matrix m = Matrix::from_rows({{scale, -scale, 0.0f}});
        NormalizedRows n = VectorNormalizer().normalize(m);
        EXPECT_NEAR(n.norms[0] / scale, 1.41421356f, 1e-5f) << "scale=" << scale;
        EXPECT_NEAR(l2_norm(n.unit.row(0), 3), 1.0f, 1e-6f) << "scale=" << scale;
    }
}
