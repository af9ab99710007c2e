// Turns a track path into a time-stamped emotional journey.

#ifndef MOODSPACE_JOURNEY_JOURNEY_SYNTHESIZER_H
#define MOODSPACE_JOURNEY_JOURNEY_SYNTHESIZER_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/coordinate_cache.h"
#include "graph/path_finder.h"

namespace moodspace {

/// @brief Parameters of a journey request.
struct JourneyRequest {
  std::string start_track;
  std::string end_track;
  std::vector<EmotionalCoordinate> waypoints;  ///< Optional intermediate moods.
  double duration = 60.0;                      ///< Seconds.
  size_t max_steps = 10;                       ///< Clamped to at least 2.
};

/// @brief Synthesized journey and the branch that produced its path.
struct Journey {
  std::vector<JourneyPoint> points;
  PathKind path_kind = PathKind::Direct;
  bool used_waypoints = false;

  /// @brief Serialize as {"path_kind", "used_waypoints", "points": [...]}.
  ///
  /// Each point carries track_id, timestamp, transition_type and coordinate.
  std::string toJson() const;
};

/// @brief Test whether an interior track sits efficiently between its neighbours.
///
/// True when d(prev, curr) + d(curr, next) < d(prev, next) * ratio, using 4D
/// emotional distance.
bool isBridgeTrack(const EmotionalCoordinate& prev, const EmotionalCoordinate& curr,
                   const EmotionalCoordinate& next, double bridge_ratio);

/// @brief Bridge test on precomputed distances.
/// @param via d(prev, curr) + d(curr, next).
/// @param direct d(prev, next).
bool isBridgeTrack(double via, double direct, double bridge_ratio);

/// @brief Timestamp of point index of total over a duration.
///
/// index / (total - 1) * duration; 0 when total <= 1.
double journeyTimestamp(size_t index, size_t total, double duration);

/// @brief Builds journeys from paths and optional waypoints.
class JourneySynthesizer {
 public:
  JourneySynthesizer(const PathFinder& finder, const CoordinateCache& cache,
                     double bridge_ratio)
      : finder_(finder), cache_(cache), bridge_ratio_(bridge_ratio) {}

  /// @brief Create a journey.
  ///
  /// The base path comes from PathFinder::findPath. With waypoints the path
  /// is replaced by start, the nearest track to each waypoint (skipping
  /// tracks already included and the end track), then end. Tracks without a
  /// coordinate are dropped before timestamps and transitions are assigned.
  Journey create(const JourneyRequest& request) const;

  /// @brief Waypoint path: start, nearest track per waypoint, end.
  std::vector<std::string> waypointPath(const std::string& start, const std::string& end,
                                        const std::vector<EmotionalCoordinate>& waypoints) const;

  /// @brief Time-stamp and classify an explicit path.
  std::vector<JourneyPoint> timestampPath(const std::vector<std::string>& path,
                                          double duration) const;

 private:
  const PathFinder& finder_;
  const CoordinateCache& cache_;
  double bridge_ratio_;
};

}  // namespace moodspace

#endif  // MOODSPACE_JOURNEY_JOURNEY_SYNTHESIZER_H
