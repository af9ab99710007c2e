// Tests for embedding/tsne_embedding.h -- affinities and local structure.

#include "embedding/tsne_embedding.h"

#include <gtest/gtest.h>

#include <limits>

namespace moodspace {
namespace {

/// Two tight groups of `per_group` samples, far apart in every dimension.
Matrix twoGroups(Eigen::Index per_group, Eigen::Index dims) {
  Matrix data(per_group * 2, dims);
  for (Eigen::Index row = 0; row < per_group * 2; ++row) {
    double base = row < per_group ? 0.0 : 10.0;
    for (Eigen::Index col = 0; col < dims; ++col) {
      data(row, col) = base + 0.05 * static_cast<double>((row * 7 + col * 3) % 5);
    }
  }
  return data;
}

Eigen::Index nearestOther(const Matrix& layout, Eigen::Index row) {
  Eigen::Index best = -1;
  double best_dist = std::numeric_limits<double>::max();
  for (Eigen::Index other = 0; other < layout.rows(); ++other) {
    if (other == row) continue;
    double dist = (layout.row(row) - layout.row(other)).squaredNorm();
    if (dist < best_dist) {
      best_dist = dist;
      best = other;
    }
  }
  return best;
}

// ---------------------------------------------------------------------------
// Perplexity
// ---------------------------------------------------------------------------

TEST(TsneEmbeddingTest, PerplexityScalesWithSamples) {
  EXPECT_DOUBLE_EQ(TsneEmbedding::perplexityFor(8, 30.0), 2.0);
  EXPECT_DOUBLE_EQ(TsneEmbedding::perplexityFor(15, 30.0), 3.0);
  EXPECT_DOUBLE_EQ(TsneEmbedding::perplexityFor(400, 30.0), 30.0);
  EXPECT_DOUBLE_EQ(TsneEmbedding::perplexityFor(2, 30.0), 1.0);
}

// ---------------------------------------------------------------------------
// Joint probabilities
// ---------------------------------------------------------------------------

TEST(TsneEmbeddingTest, JointProbabilitiesAreSymmetricDistribution) {
  Matrix data = twoGroups(4, 3);
  Matrix joint = TsneEmbedding::jointProbabilities(data, 2.0);
  ASSERT_EQ(joint.rows(), 8);
  EXPECT_NEAR(joint.sum(), 1.0, 1e-6);
  for (Eigen::Index row = 0; row < joint.rows(); ++row) {
    EXPECT_DOUBLE_EQ(joint(row, row), 0.0);
    for (Eigen::Index col = 0; col < joint.cols(); ++col) {
      EXPECT_NEAR(joint(row, col), joint(col, row), 1e-15);
    }
  }
}

TEST(TsneEmbeddingTest, JointProbabilitiesFavorSameGroup) {
  Matrix data = twoGroups(4, 3);
  Matrix joint = TsneEmbedding::jointProbabilities(data, 2.0);
  EXPECT_GT(joint(0, 1), joint(0, 5) * 100.0);
}

// ---------------------------------------------------------------------------
// Embedding
// ---------------------------------------------------------------------------

TEST(TsneEmbeddingTest, OutputShapeAndFinite) {
  TsneParams params;
  params.perplexity = 2.0;
  params.iterations = 300;
  params.exaggeration_iterations = 100;
  Matrix layout = TsneEmbedding(params).embed(twoGroups(5, 6));
  ASSERT_EQ(layout.rows(), 10);
  ASSERT_EQ(layout.cols(), 3);
  EXPECT_TRUE(layout.allFinite());
}

TEST(TsneEmbeddingTest, KeepsGroupsApart) {
  TsneParams params;
  params.perplexity = 2.0;
  Matrix layout = TsneEmbedding(params).embed(twoGroups(5, 6));
  for (Eigen::Index row = 0; row < layout.rows(); ++row) {
    Eigen::Index other = nearestOther(layout, row);
    EXPECT_EQ(row < 5, other < 5) << "row " << row;
  }
}

TEST(TsneEmbeddingTest, Deterministic) {
  TsneParams params;
  params.perplexity = 2.0;
  params.iterations = 200;
  Matrix data = twoGroups(4, 5);
  Matrix first = TsneEmbedding(params).embed(data);
  Matrix second = TsneEmbedding(params).embed(data);
  EXPECT_TRUE(first.isApprox(second));
}

TEST(TsneEmbeddingTest, PreReductionHandlesWideInput) {
  TsneParams params;
  params.perplexity = 2.0;
  params.pre_reduce_dims = 4;
  params.iterations = 200;
  Matrix layout = TsneEmbedding(params).embed(twoGroups(4, 20));
  EXPECT_EQ(layout.rows(), 8);
  EXPECT_TRUE(layout.allFinite());
}

}  // namespace
}  // namespace moodspace
