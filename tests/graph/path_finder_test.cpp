// Tests for graph/path_finder.h -- graph routing, downsampling and fallbacks.

#include "graph/path_finder.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>

namespace moodspace {
namespace {

/// Graph and cache over tracks on a valence line, `step` apart.
struct LineSpace {
  CoordinateCache cache;
  SimilarityGraph graph;

  LineSpace(size_t count, double step) {
    std::vector<std::string> ids;
    std::vector<EmotionVector> emotions;
    for (size_t idx = 0; idx < count; ++idx) {
      std::string track_id = "t" + std::to_string(idx);
      EmotionalCoordinate coord =
          makeCoordinate(0.1 + step * static_cast<double>(idx), 0.5, 0.5, 0.5);
      cache.put(track_id, coord);
      ids.push_back(track_id);
      emotions.push_back(coord.emotions());
    }
    graph = SimilarityGraph::build(ids, emotions, 0.3, 1e-6);
  }
};

// ---------------------------------------------------------------------------
// downsamplePath
// ---------------------------------------------------------------------------

TEST(PathFinderTest, DownsampleKeepsShortPaths) {
  std::vector<std::string> path = {"a", "b", "c"};
  EXPECT_EQ(downsamplePath(path, 10), path);
  EXPECT_EQ(downsamplePath(path, 3), path);
}

TEST(PathFinderTest, DownsampleEvenlySpaced) {
  std::vector<std::string> path = {"a", "b", "c", "d", "e", "f", "g"};
  std::vector<std::string> expected = {"a", "d", "g"};
  EXPECT_EQ(downsamplePath(path, 3), expected);
  std::vector<std::string> four = downsamplePath(path, 4);
  ASSERT_EQ(four.size(), 4u);
  EXPECT_EQ(four.front(), "a");
  EXPECT_EQ(four[1], "c");
  EXPECT_EQ(four[2], "e");
  EXPECT_EQ(four.back(), "g");
}

TEST(PathFinderTest, DownsampleNeverDropsEndpoints) {
  std::vector<std::string> path = {"a", "b", "c", "d"};
  std::vector<std::string> result = downsamplePath(path, 1);
  ASSERT_EQ(result.size(), 2u);
  EXPECT_EQ(result.front(), "a");
  EXPECT_EQ(result.back(), "d");
}

// ---------------------------------------------------------------------------
// findPath
// ---------------------------------------------------------------------------

TEST(PathFinderTest, ChainFollowsEveryTrack) {
  LineSpace space(5, 0.2);
  PathFinder finder(space.graph, space.cache);
  PathResult result = finder.findPath("t0", "t4", 10);
  EXPECT_EQ(result.kind, PathKind::GraphPath);
  std::vector<std::string> expected = {"t0", "t1", "t2", "t3", "t4"};
  EXPECT_EQ(result.tracks, expected);
}

TEST(PathFinderTest, ChainDownsampledToMaxSteps) {
  LineSpace space(5, 0.2);
  PathFinder finder(space.graph, space.cache);
  PathResult result = finder.findPath("t0", "t4", 3);
  std::vector<std::string> expected = {"t0", "t2", "t4"};
  EXPECT_EQ(result.tracks, expected);
}

TEST(PathFinderTest, MaxStepsBelowTwoClampedToEndpoints) {
  LineSpace space(5, 0.2);
  PathFinder finder(space.graph, space.cache);
  for (size_t max_steps : {0u, 1u}) {
    PathResult result = finder.findPath("t0", "t4", max_steps);
    std::vector<std::string> expected = {"t0", "t4"};
    EXPECT_EQ(result.tracks, expected);
  }
}

TEST(PathFinderTest, PrefersDirectCheaperEdge) {
  CoordinateCache cache;
  cache.put("a", makeCoordinate(0.0, 0.0, 0.0, 0.0));
  cache.put("b", makeCoordinate(0.14, 0.14, 0.0, 0.0));
  cache.put("c", makeCoordinate(0.28, 0.0, 0.0, 0.0));
  SimilarityGraph graph = SimilarityGraph::build(
      cache.ids(), {cache.coordinates()[0].emotions(), cache.coordinates()[1].emotions(),
                    cache.coordinates()[2].emotions()},
      0.3, 1e-6);
  ASSERT_EQ(graph.edgeCount(), 3u);
  PathFinder finder(graph, cache);
  std::vector<std::string> expected = {"a", "c"};
  EXPECT_EQ(finder.findPath("a", "c", 10).tracks, expected);
}

TEST(PathFinderTest, ShortestRouteThroughIntermediate) {
  CoordinateCache cache;
  // a and c are beyond the threshold, so the route must pass through b.
  cache.put("a", makeCoordinate(0.0, 0.0, 0.0, 0.0));
  cache.put("b", makeCoordinate(0.2, 0.0, 0.0, 0.0));
  cache.put("c", makeCoordinate(0.4, 0.0, 0.0, 0.0));
  std::vector<EmotionVector> emotions;
  for (const auto& coord : cache.coordinates()) emotions.push_back(coord.emotions());
  SimilarityGraph graph = SimilarityGraph::build(cache.ids(), emotions, 0.3, 1e-6);
  PathFinder finder(graph, cache);
  auto route = finder.shortestRoute(0, 2);
  ASSERT_TRUE(route.has_value());
  std::vector<size_t> expected = {0, 1, 2};
  EXPECT_EQ(*route, expected);
  EXPECT_FALSE(finder.shortestRoute(0, 5).has_value());
}

TEST(PathFinderTest, SameStartAndEnd) {
  LineSpace space(3, 0.2);
  PathFinder finder(space.graph, space.cache);
  PathResult result = finder.findPath("t1", "t1", 10);
  EXPECT_EQ(result.kind, PathKind::GraphPath);
  ASSERT_EQ(result.tracks.size(), 1u);
  EXPECT_EQ(result.tracks[0], "t1");
}

TEST(PathFinderTest, DisconnectedFallsBackToInterpolation) {
  LineSpace space(5, 0.5);
  ASSERT_EQ(space.graph.edgeCount(), 0u);
  PathFinder finder(space.graph, space.cache);
  PathResult result = finder.findPath("t0", "t4", 5);
  EXPECT_EQ(result.kind, PathKind::Interpolated);
  std::vector<std::string> expected = {"t0", "t1", "t2", "t3", "t4"};
  EXPECT_EQ(result.tracks, expected);
}

TEST(PathFinderTest, InterpolationHasNoDuplicates) {
  LineSpace space(4, 0.5);
  PathFinder finder(space.graph, space.cache);
  std::vector<std::string> path = finder.interpolatedPath("t0", "t3", 10);
  ASSERT_GE(path.size(), 2u);
  EXPECT_EQ(path.front(), "t0");
  EXPECT_EQ(path.back(), "t3");
  EXPECT_LE(path.size(), 10u);
  std::set<std::string> unique(path.begin(), path.end());
  EXPECT_EQ(unique.size(), path.size());
  EXPECT_EQ(std::count(path.begin(), path.end(), "t3"), 1);
}

TEST(PathFinderTest, UnknownEndpointIsDirect) {
  LineSpace space(3, 0.2);
  PathFinder finder(space.graph, space.cache);
  PathResult result = finder.findPath("t0", "missing", 10);
  EXPECT_EQ(result.kind, PathKind::Direct);
  std::vector<std::string> expected = {"t0", "missing"};
  EXPECT_EQ(result.tracks, expected);
}

TEST(PathFinderTest, PathKindNames) {
  EXPECT_STREQ(pathKindToString(PathKind::GraphPath), "graph");
  EXPECT_STREQ(pathKindToString(PathKind::Interpolated), "interpolated");
  EXPECT_STREQ(pathKindToString(PathKind::Direct), "direct");
}

}  // namespace
}  // namespace moodspace
