// Spread and center statistics over the emotional coordinates of a space.

#ifndef MOODSPACE_ANALYSIS_SPACE_STATISTICS_H
#define MOODSPACE_ANALYSIS_SPACE_STATISTICS_H

#include <array>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace moodspace {

class JsonWriter;

/// @brief Range statistics for one emotion dimension.
struct DimensionStats {
  double min = 0.0;
  double max = 0.0;
  double mean = 0.0;
  double std_dev = 0.0;  ///< Population standard deviation.
};

/// @brief Statistics over every cached coordinate.
struct SpaceStatistics {
  bool empty = true;  ///< True when computed over no coordinates.
  std::array<DimensionStats, kEmotionDims> dimensions{};  ///< valence, energy, complexity, tension.
  EmotionalCoordinate center;  ///< Per-dimension mean.

  /// @brief Serialize as emotional_ranges / emotional_center / emotional_spread.
  ///
  /// An empty result serializes as {}.
  void writeJson(JsonWriter& writer) const;

  /// @brief Serialize to a standalone JSON string.
  std::string toJson() const;

  /// @brief Human-readable summary, one dimension per line.
  std::string toTextSummary() const;
};

/// @brief Compute per-dimension min, max, mean, std and the 4D center.
SpaceStatistics computeStatistics(const std::vector<EmotionalCoordinate>& coords);

}  // namespace moodspace

#endif  // MOODSPACE_ANALYSIS_SPACE_STATISTICS_H
