// Tests for the EmotionalSpace rebuild pipeline and its queries.

#include "emotional_space.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "core/json_parser.h"
#include "test_helpers.h"

namespace moodspace {
namespace {

using test_helpers::makeChain;
using test_helpers::makeProfile;

JsonValue parseBundle(const std::string& json) {
  JsonParseResult parsed = parseJson(json.data(), json.size());
  EXPECT_TRUE(parsed.success) << parsed.error_message;
  return parsed.root;
}

// ---------------------------------------------------------------------------
// rebuild
// ---------------------------------------------------------------------------

TEST(EmotionalSpaceTest, EmptyProfilesFail) {
  EmotionalSpace space;
  RebuildResult result = space.rebuild({});
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error_message.empty());
  EXPECT_FALSE(space.isBuilt());
}

TEST(EmotionalSpaceTest, RebuildPopulatesCacheAndGraph) {
  EmotionalSpace space;
  RebuildResult result = space.rebuild(makeChain(5, 0.2));
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.track_count, 5u);
  EXPECT_EQ(result.edge_count, 4u);
  EXPECT_EQ(result.strategy, "tsne");
  EXPECT_TRUE(space.isBuilt());
  EXPECT_EQ(space.trackCount(), 5u);

  auto coord = space.coordinate("t2");
  ASSERT_TRUE(coord.has_value());
  EXPECT_NEAR(coord->valence, 0.5, 1e-12);
  EXPECT_FALSE(space.coordinate("missing").has_value());
}

TEST(EmotionalSpaceTest, PositionsWithinRadius) {
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(makeChain(6, 0.1)).success);
  double max_abs = 0.0;
  for (const auto& coord : space.cache().coordinates()) {
    max_abs = std::max({max_abs, std::fabs(coord.x), std::fabs(coord.y), std::fabs(coord.z)});
  }
  EXPECT_NEAR(max_abs, 25.0, 1e-9);
}

TEST(EmotionalSpaceTest, DuplicateIdsKeepFirst) {
  std::vector<DnaProfile> profiles = makeChain(3, 0.2);
  profiles.push_back(makeProfile("t1", 0.9, 0.9, 0.9, 0.9));
  EmotionalSpace space;
  RebuildResult result = space.rebuild(profiles);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.duplicates_skipped, 1u);
  EXPECT_EQ(result.track_count, 3u);
  EXPECT_NEAR(space.coordinate("t1")->valence, 0.3, 1e-12);
}

TEST(EmotionalSpaceTest, RebuildReplacesPreviousState) {
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(makeChain(4, 0.2)).success);
  ASSERT_TRUE(space.rebuild({makeProfile("solo", 0.5, 0.5, 0.5, 0.5)}).success);
  EXPECT_EQ(space.trackCount(), 1u);
  EXPECT_FALSE(space.coordinate("t0").has_value());
  EXPECT_EQ(space.graph().edgeCount(), 0u);
}

TEST(EmotionalSpaceTest, SameSeedSameLayout) {
  std::vector<DnaProfile> profiles;
  for (size_t idx = 0; idx < 18; ++idx) {
    profiles.push_back(test_helpers::makeGeneticProfile("g" + std::to_string(idx),
                                                        0.1 * static_cast<double>(idx)));
  }
  EmotionalSpace first;
  EmotionalSpace second;
  ASSERT_TRUE(first.rebuild(profiles).success);
  ASSERT_TRUE(second.rebuild(profiles).success);
  EXPECT_EQ(first.embeddingStrategy(), "umap");
  for (const auto& profile : profiles) {
    auto lhs = first.coordinate(profile.track_id);
    auto rhs = second.coordinate(profile.track_id);
    ASSERT_TRUE(lhs && rhs);
    EXPECT_DOUBLE_EQ(lhs->x, rhs->x);
    EXPECT_DOUBLE_EQ(lhs->y, rhs->y);
    EXPECT_DOUBLE_EQ(lhs->z, rhs->z);
  }
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

TEST(EmotionalSpaceTest, NearestSortedByEmotionDistance) {
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(makeChain(5, 0.2)).success);
  auto result = space.nearest(makeCoordinate(0.52, 0.5, 0.5, 0.5), 3);
  ASSERT_EQ(result.size(), 3u);
  EXPECT_EQ(result[0].first, "t2");
  EXPECT_LE(result[0].second, result[1].second);
  EXPECT_LE(result[1].second, result[2].second);
}

TEST(EmotionalSpaceTest, FindPathUsesDefaultMaxSteps) {
  SpaceConfig config;
  config.default_max_steps = 3;
  EmotionalSpace space(config);
  ASSERT_TRUE(space.rebuild(makeChain(5, 0.2)).success);
  PathResult result = space.findPath("t0", "t4");
  EXPECT_EQ(result.kind, PathKind::GraphPath);
  std::vector<std::string> expected = {"t0", "t2", "t4"};
  EXPECT_EQ(result.tracks, expected);
  EXPECT_EQ(space.findPath("t0", "t4", 10).tracks.size(), 5u);
}

TEST(EmotionalSpaceTest, JourneyCarriesPositions) {
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(makeChain(5, 0.2)).success);
  JourneyRequest request;
  request.start_track = "t0";
  request.end_track = "t4";
  request.duration = 120.0;
  Journey journey = space.createJourney(request);
  ASSERT_EQ(journey.points.size(), 5u);
  EXPECT_DOUBLE_EQ(journey.points.back().timestamp, 120.0);
  auto cached = space.coordinate("t3");
  EXPECT_DOUBLE_EQ(journey.points[3].coordinate.x, cached->x);
}

TEST(EmotionalSpaceTest, StatisticsAndClusters) {
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(makeChain(6, 0.1)).success);
  SpaceStatistics stats = space.statistics();
  ASSERT_FALSE(stats.empty);
  EXPECT_NEAR(stats.dimensions[0].min, 0.1, 1e-12);
  EXPECT_NEAR(stats.dimensions[0].max, 0.6, 1e-12);
  EXPECT_DOUBLE_EQ(stats.dimensions[1].std_dev, 0.0);

  ClusterReport report = space.clusters();
  ASSERT_FALSE(report.empty);
  EXPECT_EQ(report.clusters.size(), 5u);
  EXPECT_EQ(report.total_tracks, 6u);
}

TEST(EmotionalSpaceTest, GeneticRelatives) {
  std::vector<DnaProfile> profiles = {test_helpers::makeGeneticProfile("a", 0.0),
                                      test_helpers::makeGeneticProfile("b", 0.1),
                                      test_helpers::makeGeneticProfile("c", 2.0)};
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(profiles).success);
  auto relatives = space.geneticRelatives("a", 5);
  ASSERT_EQ(relatives.size(), 2u);
  EXPECT_EQ(relatives[0].first, "b");
  EXPECT_TRUE(space.geneticRelatives("missing", 5).empty());
}

// ---------------------------------------------------------------------------
// Export bundle
// ---------------------------------------------------------------------------

TEST(EmotionalSpaceTest, ExportBundleLayout) {
  std::vector<DnaProfile> profiles = makeChain(4, 0.2);
  profiles[0].key_signature = "D";
  profiles[0].mode = "minor";
  profiles[0].tempo = 96.0;
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(profiles).success);

  JsonValue root = parseBundle(space.exportBundleJson(100));
  const JsonValue* tracks = root.find("tracks");
  ASSERT_NE(tracks, nullptr);
  ASSERT_EQ(tracks->array_val.size(), 4u);
  const JsonValue& first = tracks->array_val[0];
  EXPECT_EQ(first.find("id")->asString(), "t0");
  EXPECT_EQ(first.find("track_id")->asString(), "t0");
  EXPECT_NEAR(first.find("coordinates")->find("valence")->asDouble(), 0.1, 1e-9);
  ASSERT_NE(first.find("position")->find("z"), nullptr);
  const JsonValue* metadata = first.find("metadata");
  EXPECT_DOUBLE_EQ(metadata->find("tempo")->asDouble(), 96.0);
  EXPECT_EQ(metadata->find("key")->asInt(), 2);
  EXPECT_EQ(metadata->find("key_name")->asString(), "D");
  EXPECT_EQ(metadata->find("mode")->asInt(), 0);
  EXPECT_EQ(metadata->find("mode_name")->asString(), "minor");

  const JsonValue& second = tracks->array_val[1];
  EXPECT_EQ(second.find("metadata")->find("key_name")->asString(), "C");
  EXPECT_EQ(second.find("metadata")->find("mode_name")->asString(), "Major");

  EXPECT_EQ(root.find("connections")->array_val.size(), 3u);
  EXPECT_EQ(root.find("total_connections")->asInt(), 3);
  EXPECT_TRUE(root.find("statistics")->find("emotional_ranges") != nullptr);
  EXPECT_TRUE(root.find("clusters")->find("clusters") != nullptr);
  EXPECT_EQ(root.find("embedding")->asString(), "tsne");
}

TEST(EmotionalSpaceTest, ExportNumericKeyAndMode) {
  std::vector<DnaProfile> profiles = makeChain(2, 0.2);
  profiles[0].key_signature = "5";
  profiles[0].mode = "1";
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(profiles).success);

  JsonValue root = parseBundle(space.exportBundleJson(10));
  const JsonValue* metadata = root.find("tracks")->array_val[0].find("metadata");
  EXPECT_EQ(metadata->find("key")->asInt(), 5);
  EXPECT_EQ(metadata->find("key_name")->asString(), "5");
  EXPECT_EQ(metadata->find("mode")->asInt(), 1);
  EXPECT_EQ(metadata->find("mode_name")->asString(), "1");
}

TEST(EmotionalSpaceTest, ExportCapsConnectionsByWeight) {
  std::vector<DnaProfile> profiles = {makeProfile("a", 0.0, 0.5, 0.5, 0.5),
                                      makeProfile("b", 0.05, 0.5, 0.5, 0.5),
                                      makeProfile("c", 0.25, 0.5, 0.5, 0.5),
                                      makeProfile("d", 0.45, 0.5, 0.5, 0.5)};
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(profiles).success);
  ASSERT_GT(space.graph().edgeCount(), 2u);

  JsonValue root = parseBundle(space.exportBundleJson(2));
  const JsonValue* connections = root.find("connections");
  ASSERT_EQ(connections->array_val.size(), 2u);
  double first_weight = connections->array_val[0].find("weight")->asDouble();
  double second_weight = connections->array_val[1].find("weight")->asDouble();
  EXPECT_GE(first_weight, second_weight);
  EXPECT_EQ(connections->array_val[0].find("source")->asString(), "a");
  EXPECT_EQ(connections->array_val[0].find("target")->asString(), "b");
  EXPECT_EQ(root.find("total_connections")->asInt(),
            static_cast<int>(space.graph().edgeCount()));
}

TEST(EmotionalSpaceTest, WriteExportBundle) {
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(makeChain(3, 0.2)).success);
  std::string path = ::testing::TempDir() + "moodspace_bundle_test.json";
  ASSERT_TRUE(space.writeExportBundle(path, 10));

  std::ifstream file(path);
  std::ostringstream oss;
  oss << file.rdbuf();
  std::remove(path.c_str());
  JsonValue root = parseBundle(oss.str());
  EXPECT_EQ(root.find("tracks")->array_val.size(), 3u);
}

TEST(EmotionalSpaceTest, WriteExportBundleBadPath) {
  EmotionalSpace space;
  ASSERT_TRUE(space.rebuild(makeChain(2, 0.2)).success);
  EXPECT_FALSE(space.writeExportBundle("/nonexistent/dir/bundle.json", 10));
}

}  // namespace
}  // namespace moodspace
