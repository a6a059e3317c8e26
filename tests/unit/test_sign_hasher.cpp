#include <gtest/gtest.h>
#include "hashmv/encoder/projection.hpp"
#include "hashmv/encoder/sign_hasher.hpp"
#include <cstdint>
#include <random>
#include <vector>

using namespace hashmv;

std::vector<Float> random_vector(size_t dim, std::mt19937_64& rng) {
    std::normal_distribution<Float> dist(0.0f, 1.0f);
    std::vector<Float> v(dim);
    for (auto& x : v) x = dist(rng);
    return v;
}

// hash(v, P) has exactly k entries, each -1 or +1
TEST(SignHasherTest, CodeHasKEntriesOfUnitSign) {
    std::mt19937_64 rng(7);
    for (size_t k : {1, 2, 31, 64, 65, 128, 512}) {
        RandomProjection proj(k, 24, 100 + k);
        std::vector<int8_t> code = SignHasher::hash_vector(random_vector(24, rng), proj.matrix());
        ASSERT_EQ(code.size(), k);
        for (int8_t c : code) {
            EXPECT_TRUE(c == 1 || c == -1);
        }
    }
}

// A projection of exactly zero maps to +1
TEST(SignHasherTest, ZeroProjectionBreaksTieToPlusOne) {
    Matrix P = Matrix::from_rows({{1.0f, 0.0f}, {0.0f, 1.0f}, {0.0f, -1.0f}});

    std::vector<int8_t> pos = SignHasher::hash_vector({1.0f, 0.0f}, P);
    EXPECT_EQ(pos, (std::vector<int8_t>{1, 1, 1}));

    std::vector<int8_t> neg = SignHasher::hash_vector({-1.0f, 0.0f}, P);
    EXPECT_EQ(neg, (std::vector<int8_t>{-1, 1, 1}));

    std::vector<int8_t> negzero = SignHasher::hash_vector({-0.0f, -0.0f}, P);
    EXPECT_EQ(negzero, (std::vector<int8_t>{1, 1, 1}));
}

TEST(SignHasherTest, SignMatchesProjection) {
    Matrix P = Matrix::from_rows({{1.0f, 2.0f}, {-1.0f, 0.5f}, {0.25f, -3.0f}});
    Matrix x = Matrix::from_rows({{1.0f, 1.0f}, {2.0f, -1.0f}});

    Matrix pre;
    SignCodes codes = SignHasher::hash(x, P, &pre);

    ASSERT_EQ(codes.rows(), 2u);
    ASSERT_EQ(codes.bits(), 3u);
    ASSERT_EQ(pre.rows(), 2u);
    ASSERT_EQ(pre.cols(), 3u);

    EXPECT_FLOAT_EQ(pre(0, 0), 3.0f);
    EXPECT_FLOAT_EQ(pre(0, 1), -0.5f);
    EXPECT_FLOAT_EQ(pre(0, 2), -2.75f);
    EXPECT_EQ(codes.sign(0, 0), 1);
    EXPECT_EQ(codes.sign(0, 1), -1);
    EXPECT_EQ(codes.sign(0, 2), -1);

    EXPECT_FLOAT_EQ(pre(1, 0), 0.0f);
    EXPECT_EQ(codes.sign(1, 0), 1);
    EXPECT_EQ(codes.sign(1, 1), -1);
    EXPECT_EQ(codes.sign(1, 2), 1);
}

// Batch hashing agrees with hashing each row on its own
TEST(SignHasherTest, BatchMatchesSingleVector) {
    std::mt19937_64 rng(11);
    const size_t dim = 40, k = 100;
    RandomProjection proj(k, dim, 5);

    Matrix x(9, dim);
    for (size_t r = 0; r < x.rows(); ++r) {
        auto v = random_vector(dim, rng);
        std::copy(v.begin(), v.end(), x.row(r));
    }

    SignCodes codes = SignHasher::hash(x, proj.matrix());
    for (size_t r = 0; r < x.rows(); ++r) {
        std::vector<Float> v(x.row(r), x.row(r) + dim);
        std::vector<int8_t> single = SignHasher::hash_vector(v, proj.matrix());
        for (size_t b = 0; b < k; ++b) {
            EXPECT_EQ(codes.sign(r, b), single[b]) << "row " << r << " bit " << b;
        }
    }
}

// Positive rescaling does not change the code
TEST(SignHasherTest, ScaleInvariant) {
    std::mt19937_64 rng(3);
    RandomProjection proj(64, 16, 9);
    std::vector<Float> v = random_vector(16, rng);
    std::vector<Float> scaled = v;
    for (auto& x : scaled) x *= 37.5f;

    EXPECT_EQ(SignHasher::hash_vector(v, proj.matrix()),
              SignHasher::hash_vector(scaled, proj.matrix()));
}

TEST(SignHasherTest, ShapeMismatchRaises) {
    RandomProjection proj(8, 4, 1);
    EXPECT_THROW(SignHasher::hash_vector({1.0f, 2.0f, 3.0f}, proj.matrix()), ShapeMismatchError);
    EXPECT_THROW(SignHasher::hash(Matrix(2, 5, 1.0f), proj.matrix()), ShapeMismatchError);
}

TEST(ProjectionTest, VariantsDifferOnlyInTrainability) {
    RandomProjection frozen(32, 10, 77);
    LearnedProjection learned(32, 10, 77);

    EXPECT_FALSE(frozen.trainable());
    EXPECT_TRUE(learned.trainable());
    EXPECT_EQ(frozen.variant(), KernelVariant::RandomProj);
    EXPECT_EQ(learned.variant(), KernelVariant::LearnedProj);
    EXPECT_EQ(frozen.matrix(), learned.matrix());
    EXPECT_EQ(frozen.parameter().role(), ParamRole::Projection);

    RandomProjection other_seed(32, 10, 78);
    EXPECT_NE(frozen.matrix(), other_seed.matrix());
}

TEST(ProjectionTest, RejectsInvalidShapes) {
    EXPECT_THROW(RandomProjection(0, 10, 1), InvalidConfigError);
    EXPECT_THROW(LearnedProjection(4, 0, 1), ShapeMismatchError);
    EXPECT_THROW(make_projection(KernelVariant::LearnedProj, 0, 3, 1), InvalidConfigError);
}

TEST(ProjectionTest, SetMatrixValidates) {
    LearnedProjection proj(2, 3, 1);

    EXPECT_THROW(proj.set_matrix(Matrix(3, 2, 1.0f)), ShapeMismatchError);
    EXPECT_THROW(proj.set_matrix(Matrix::from_rows({{1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}})),
                 DegenerateVectorError);

    const uint64_t before = proj.parameter().version();
    proj.set_matrix(Matrix::from_rows({{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}}));
    EXPECT_GT(proj.parameter().version(), before);
    EXPECT_FLOAT_EQ(proj.matrix()(1, 1), 1.0f);
}

TEST(ProjectionTest, CloneIsDeep) {
    LearnedProjection proj(4, 4, 2);
    std::unique_ptr<ProjectionSource> copy = proj.clone();

    proj.parameter().mutable_value()(0, 0) = 123.0f;
    EXPECT_NE(copy->matrix()(0, 0), 123.0f);
    EXPECT_EQ(copy->variant(), KernelVariant::LearnedProj);
    EXPECT_TRUE(copy->trainable());
}

TEST(ProjectionTest, CopiesKeepVariantAndMatrix) {
    RandomProjection random(3, 5, 9);
    std::unique_ptr<ProjectionSource> random_copy = random.clone();
    EXPECT_EQ(random_copy->variant(), KernelVariant::RandomProj);
    EXPECT_FALSE(random_copy->trainable());
    EXPECT_EQ(random_copy->matrix(), random.matrix());

    LearnedProjection learned(3, 5, 9);
    LearnedProjection direct(learned);
    EXPECT_EQ(direct.matrix(), learned.matrix());
    EXPECT_TRUE(direct.trainable());
}

// Matrix rows and code words start on the storage alignment boundary
TEST(StorageTest, BuffersAreAligned) {
    for (size_t cols : {1, 3, 17, 300}) {
        Matrix m(5, cols, 1.0f);
        EXPECT_EQ(reinterpret_cast<std::uintptr_t>(m.data()) % STORAGE_ALIGNMENT, 0u);
    }
    for (size_t bits : {1, 64, 65, 512}) {
        SignCodes codes(7, bits);
        EXPECT_EQ(reinterpret_cast<std::uintptr_t>(codes.row_words(0)) % STORAGE_ALIGNMENT, 0u);
    }
}
