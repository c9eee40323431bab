// File: tests/similarity/similarity_metric_test.cpp
#include "similarity/similarity_metric.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

namespace itemrec {
namespace {

// ============================================================================
// Cosine Tests
// ============================================================================

TEST(CosineSimilarityTest, IdenticalVectorsScoreOne) {
    CosineSimilarity cosine;
    std::vector<double> v = {1.0, 2.0, 3.0};

    EXPECT_NEAR(1.0, cosine.Compute(v, v), 1e-12);
}

TEST(CosineSimilarityTest, OrthogonalVectorsScoreZero) {
    CosineSimilarity cosine;

    EXPECT_DOUBLE_EQ(0.0, cosine.Compute({1.0, 0.0}, {0.0, 4.0}));
}

TEST(CosineSimilarityTest, MatchesHandComputedValue) {
    CosineSimilarity cosine;

    // 2 / (sqrt(5) * sqrt(10))
    double expected = 2.0 / (std::sqrt(5.0) * std::sqrt(10.0));
    EXPECT_NEAR(expected, cosine.Compute({2.0, 0.0, 1.0}, {1.0, 3.0, 0.0}), 1e-12);
    EXPECT_NEAR(0.28284, cosine.Compute({2.0, 0.0, 1.0}, {1.0, 3.0, 0.0}), 1e-5);
}

TEST(CosineSimilarityTest, ZeroVectorScoresZero) {
    CosineSimilarity cosine;

    EXPECT_DOUBLE_EQ(0.0, cosine.Compute({0.0, 0.0}, {1.0, 1.0}));
    EXPECT_DOUBLE_EQ(0.0, cosine.Compute({0.0, 0.0}, {0.0, 0.0}));
}

TEST(CosineSimilarityTest, IsSymmetric) {
    CosineSimilarity cosine;
    std::vector<double> a = {3.0, 1.0, 0.0, 7.0};
    std::vector<double> b = {0.0, 2.0, 5.0, 1.0};

    EXPECT_EQ(cosine.Compute(a, b), cosine.Compute(b, a));
}

TEST(CosineSimilarityTest, RejectsMismatchedSizes) {
    CosineSimilarity cosine;

    EXPECT_THROW(cosine.Compute({1.0}, {1.0, 2.0}), std::invalid_argument);
}

// ============================================================================
// Jaccard Tests
// ============================================================================

TEST(JaccardSimilarityTest, CountsNonZeroOverlap) {
    JaccardSimilarity jaccard;

    // Non-zero positions {0, 2} and {0, 1}: 1 shared of 3
    EXPECT_NEAR(1.0 / 3.0, jaccard.Compute({2.0, 0.0, 1.0}, {1.0, 3.0, 0.0}), 1e-12);
}

TEST(JaccardSimilarityTest, IgnoresMagnitudes) {
    JaccardSimilarity jaccard;

    EXPECT_DOUBLE_EQ(1.0, jaccard.Compute({1.0, 9.0}, {5.0, 1.0}));
}

TEST(JaccardSimilarityTest, TwoEmptyRowsAreIdentical) {
    JaccardSimilarity jaccard;

    EXPECT_DOUBLE_EQ(1.0, jaccard.Compute({0.0, 0.0}, {0.0, 0.0}));
}

TEST(JaccardSimilarityTest, RejectsMismatchedSizes) {
    JaccardSimilarity jaccard;

    EXPECT_THROW(jaccard.Compute({}, {1.0}), std::invalid_argument);
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST(SimilarityMetricTest, FactoryByKind) {
    auto cosine = CreateSimilarityMetric(SimilarityKind::COSINE);
    auto jaccard = CreateSimilarityMetric(SimilarityKind::JACCARD);

    EXPECT_EQ("cosine", cosine->GetName());
    EXPECT_EQ(SimilarityKind::JACCARD, jaccard->GetKind());
}

TEST(SimilarityMetricTest, FactoryByName) {
    EXPECT_EQ(SimilarityKind::COSINE, CreateSimilarityMetric("cosine")->GetKind());
    EXPECT_EQ(SimilarityKind::JACCARD, CreateSimilarityMetric("Jaccard")->GetKind());
    EXPECT_THROW(CreateSimilarityMetric("euclidean"), UnsupportedSimilarityMetric);
}

} // namespace
} // namespace itemrec
