#include <gtest/gtest.h>
#include "hierarchy/Similarity.hpp"

#include <cmath>
#include <limits>

using namespace hierarchy;

TEST(SimilarityTest, IdenticalVectorsScoreOne) {
    const Embedding v{0.3f, -1.2f, 4.0f, 0.5f};
    EXPECT_NEAR(cosine_similarity(v, v), 1.0f, 1e-6f);
}

TEST(SimilarityTest, ScaleInvariant) {
    const Embedding a{1.0f, 2.0f, 3.0f};
    const Embedding b{2.0f, 4.0f, 6.0f};
    EXPECT_NEAR(cosine_similarity(a, b), 1.0f, 1e-6f);
}

TEST(SimilarityTest, OrthogonalAndOpposite) {
    EXPECT_NEAR(cosine_similarity({1.0f, 0.0f}, {0.0f, 1.0f}), 0.0f, 1e-6f);
    EXPECT_NEAR(cosine_similarity({1.0f, 1.0f}, {-1.0f, -1.0f}), -1.0f, 1e-6f);
}

TEST(SimilarityTest, KnownAngle) {
    // 45 degrees
    EXPECT_NEAR(cosine_similarity({1.0f, 0.0f}, {1.0f, 1.0f}), std::sqrt(0.5f), 1e-6f);
}

TEST(SimilarityTest, AbsentVectorScoresZero) {
    const Embedding v{1.0f, 2.0f};
    EXPECT_EQ(cosine_similarity(v, {}), 0.0f);
    EXPECT_EQ(cosine_similarity({}, v), 0.0f);
    EXPECT_EQ(cosine_similarity({}, {}), 0.0f);
}

TEST(SimilarityTest, ZeroVectorScoresZero) {
    EXPECT_EQ(cosine_similarity({0.0f, 0.0f, 0.0f}, {1.0f, 2.0f, 3.0f}), 0.0f);
}

TEST(SimilarityTest, DimensionMismatchThrows) {
    EXPECT_THROW(cosine_similarity({1.0f, 2.0f}, {1.0f, 2.0f, 3.0f}), SimilarityError);
}

TEST(SimilarityTest, NonFiniteComponentThrows) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    EXPECT_THROW(cosine_similarity({1.0f, nan}, {1.0f, 1.0f}), SimilarityError);
    EXPECT_THROW(cosine_similarity({1.0f, 1.0f}, {inf, 1.0f}), SimilarityError);
}

TEST(SimilarityTest, StaysWithinUnitRange) {
    const Embedding a{1e-3f, 3e-3f, 7e-3f};
    const float s = cosine_similarity(a, a);
    EXPECT_LE(s, 1.0f);
    EXPECT_GE(s, -1.0f);
}
