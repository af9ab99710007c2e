// Path finding through the similarity graph with interpolation fallback.

#ifndef MOODSPACE_GRAPH_PATH_FINDER_H
#define MOODSPACE_GRAPH_PATH_FINDER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/coordinate_cache.h"
#include "graph/similarity_graph.h"

namespace moodspace {

/// How a path was produced.
enum class PathKind : uint8_t {
  GraphPath,     ///< Minimum-cost route through the similarity graph.
  Interpolated,  ///< Endpoints disconnected; nearest tracks along a straight line.
  Direct         ///< An endpoint is unknown; [start, end] returned as-is.
};

/// @brief Convert PathKind to string.
const char* pathKindToString(PathKind kind);

/// @brief Ordered track ids plus the branch that produced them.
struct PathResult {
  PathKind kind = PathKind::Direct;
  std::vector<std::string> tracks;
};

/// @brief Evenly spaced subsequence keeping the first and last element.
///
/// Index i of the result is floor(i * (len - 1) / (max_steps - 1)). Paths
/// already within max_steps are returned unchanged.
///
/// @param path Input path.
/// @param max_steps Target length (values below 2 are treated as 2).
std::vector<std::string> downsamplePath(const std::vector<std::string>& path,
                                        size_t max_steps);

/// @brief Route queries over a graph and its coordinate cache.
///
/// Traversal cost of an edge is 1 / weight (= distance + epsilon), so the
/// cheapest route is the chain with the smallest summed emotional distance,
/// which favours steps between strongly similar tracks.
class PathFinder {
 public:
  PathFinder(const SimilarityGraph& graph, const CoordinateCache& cache)
      : graph_(graph), cache_(cache) {}

  /// @brief Find a path between two tracks.
  ///
  /// Unknown endpoint: Direct [start, end]. Connected: cheapest graph route,
  /// downsampled to max_steps. Disconnected: interpolatedPath().
  ///
  /// Both endpoints are always kept, so max_steps below 2 is clamped to 2 and
  /// the result holds at most max(max_steps, 2) tracks.
  PathResult findPath(const std::string& start, const std::string& end,
                      size_t max_steps) const;

  /// @brief Straight-line interpolation snapped to the nearest tracks.
  ///
  /// For i in 1 .. max_steps - 2 the 4D point at t = i / (max_steps - 1) is
  /// snapped to its nearest track; tracks already on the path (and the end
  /// track) are skipped. Always starts with start and ends with end.
  std::vector<std::string> interpolatedPath(const std::string& start, const std::string& end,
                                            size_t max_steps) const;

  /// @brief Cheapest route as node indices, or std::nullopt when disconnected.
  std::optional<std::vector<size_t>> shortestRoute(size_t from, size_t to) const;

 private:
  const SimilarityGraph& graph_;
  const CoordinateCache& cache_;
};

}  // namespace moodspace

#endif  // MOODSPACE_GRAPH_PATH_FINDER_H
