// Tests for analysis/cluster_analyzer.h -- k-means and cluster reports.

#include "analysis/cluster_analyzer.h"

#include <gtest/gtest.h>

#include <set>
#include <string>

namespace moodspace {
namespace {

/// Three well separated groups of `per_group` points each.
std::vector<EmotionVector> threeGroups(size_t per_group) {
  std::vector<EmotionVector> points;
  const EmotionVector centers[3] = {
      {0.1, 0.1, 0.1, 0.1}, {0.9, 0.1, 0.5, 0.5}, {0.5, 0.9, 0.9, 0.1}};
  for (const auto& center : centers) {
    for (size_t idx = 0; idx < per_group; ++idx) {
      double jitter = 0.01 * static_cast<double>(idx);
      points.push_back({center[0] + jitter, center[1] - jitter, center[2], center[3] + jitter});
    }
  }
  return points;
}

// ---------------------------------------------------------------------------
// kMeans
// ---------------------------------------------------------------------------

TEST(KMeansTest, RecoversSeparatedGroups) {
  std::vector<EmotionVector> points = threeGroups(4);
  KMeansResult fit = kMeans(points, 3, 42, 10);
  ASSERT_EQ(fit.labels.size(), 12u);
  ASSERT_EQ(fit.centroids.size(), 3u);
  std::set<size_t> labels_seen;
  for (size_t group = 0; group < 3; ++group) {
    size_t label = fit.labels[group * 4];
    labels_seen.insert(label);
    for (size_t idx = 1; idx < 4; ++idx) {
      EXPECT_EQ(fit.labels[group * 4 + idx], label);
    }
  }
  EXPECT_EQ(labels_seen.size(), 3u);
  EXPECT_LT(fit.inertia, 0.01);
}

TEST(KMeansTest, DeterministicForSeed) {
  std::vector<EmotionVector> points = threeGroups(5);
  KMeansResult first = kMeans(points, 3, 7, 5);
  KMeansResult second = kMeans(points, 3, 7, 5);
  EXPECT_EQ(first.labels, second.labels);
  EXPECT_DOUBLE_EQ(first.inertia, second.inertia);
}

TEST(KMeansTest, KClampedToPointCount) {
  std::vector<EmotionVector> points = {{0, 0, 0, 0}, {1, 1, 1, 1}};
  KMeansResult fit = kMeans(points, 5, 42, 3);
  EXPECT_EQ(fit.centroids.size(), 2u);
  EXPECT_NE(fit.labels[0], fit.labels[1]);
  EXPECT_DOUBLE_EQ(fit.inertia, 0.0);
}

TEST(KMeansTest, EmptyInput) {
  KMeansResult fit = kMeans({}, 3, 42, 10);
  EXPECT_TRUE(fit.labels.empty());
  EXPECT_TRUE(fit.centroids.empty());
}

// ---------------------------------------------------------------------------
// ClusterAnalyzer
// ---------------------------------------------------------------------------

TEST(ClusterAnalyzerTest, FewerThanTwoTracksIsEmpty) {
  ClusterAnalyzer analyzer(5, 42, 10);
  ClusterReport report = analyzer.analyze({"a"}, {makeCoordinate(0.1, 0.2, 0.3, 0.4)});
  EXPECT_TRUE(report.empty);
  EXPECT_EQ(report.toJson(), "{}");
  EXPECT_TRUE(analyzer.analyze({}, {}).empty);
}

TEST(ClusterAnalyzerTest, ReportCoversEveryTrack) {
  std::vector<EmotionVector> points = threeGroups(3);
  std::vector<std::string> ids;
  std::vector<EmotionalCoordinate> coords;
  for (size_t idx = 0; idx < points.size(); ++idx) {
    ids.push_back("t" + std::to_string(idx));
    coords.push_back(makeCoordinate(points[idx][0], points[idx][1], points[idx][2],
                                    points[idx][3]));
  }
  ClusterAnalyzer analyzer(5, 42, 10);
  ClusterReport report = analyzer.analyze(ids, coords);

  ASSERT_FALSE(report.empty);
  EXPECT_EQ(report.total_tracks, 9u);
  EXPECT_EQ(report.clusters.size(), 5u);
  size_t assigned = 0;
  for (const auto& cluster : report.clusters) {
    EXPECT_EQ(cluster.size, cluster.track_ids.size());
    assigned += cluster.size;
  }
  EXPECT_EQ(assigned, 9u);
  EXPECT_EQ(report.clusters[0].id, "cluster_0");

  EXPECT_EQ(report.pca_explained_variance.size(), 4u);
  ASSERT_EQ(report.pca_coordinates.size(), 9u);
  EXPECT_EQ(report.pca_coordinates[0].size(), 4u);
}

TEST(ClusterAnalyzerTest, ClusterCountLimitedByTracks) {
  ClusterAnalyzer analyzer(5, 42, 10);
  ClusterReport report = analyzer.analyze(
      {"a", "b", "c"}, {makeCoordinate(0, 0, 0, 0), makeCoordinate(0.5, 0.5, 0.5, 0.5),
                        makeCoordinate(1, 1, 1, 1)});
  EXPECT_EQ(report.clusters.size(), 3u);
  EXPECT_EQ(report.pca_explained_variance.size(), 3u);
}

TEST(ClusterAnalyzerTest, JsonLayout) {
  ClusterAnalyzer analyzer(2, 42, 4);
  ClusterReport report = analyzer.analyze(
      {"a", "b"}, {makeCoordinate(0, 0, 0, 0), makeCoordinate(1, 1, 1, 1)});
  std::string json = report.toJson();
  EXPECT_NE(json.find(R"("pca_explained_variance":[)"), std::string::npos);
  EXPECT_NE(json.find(R"("clusters":{"cluster_0":{"tracks":[)"), std::string::npos);
  EXPECT_NE(json.find(R"("size":1)"), std::string::npos);
  EXPECT_NE(json.find(R"("total_tracks":2)"), std::string::npos);
}

}  // namespace
}  // namespace moodspace
