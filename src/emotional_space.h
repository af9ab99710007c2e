// Emotional space engine: owns the coordinate cache and similarity graph of
// one full rebuild and answers coordinate, neighbour, path, journey and
// report queries against them.

#ifndef MOODSPACE_EMOTIONAL_SPACE_H
#define MOODSPACE_EMOTIONAL_SPACE_H

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "analysis/cluster_analyzer.h"
#include "analysis/space_statistics.h"
#include "core/coordinate_cache.h"
#include "core/space_config.h"
#include "dna/dna_profile.h"
#include "graph/path_finder.h"
#include "graph/similarity_graph.h"
#include "journey/journey_synthesizer.h"

namespace moodspace {

class JsonWriter;

/// @brief Outcome of EmotionalSpace::rebuild().
struct RebuildResult {
  bool success = false;
  size_t track_count = 0;
  size_t edge_count = 0;
  size_t duplicates_skipped = 0;
  std::string strategy;    ///< Embedding strategy actually used.
  bool fell_back = false;  ///< Embedding degraded to PCA.
  std::string error_message;
};

/// @brief Single-writer, read-many emotional space.
///
/// rebuild() replaces the coordinate cache and graph wholesale; there is no
/// incremental update. Const queries may run concurrently with each other
/// but callers must serialize them against rebuild().
class EmotionalSpace {
 public:
  explicit EmotionalSpace(const SpaceConfig& config = SpaceConfig());

  /// @brief Embed profiles and rebuild the coordinate cache and graph.
  ///
  /// Fails without touching the current state when the profile set is empty
  /// or the embedding input is malformed. Duplicate track ids keep their
  /// first occurrence.
  RebuildResult rebuild(const std::vector<DnaProfile>& profiles);

  bool isBuilt() const { return !cache_.empty(); }
  size_t trackCount() const { return cache_.size(); }

  /// @brief Coordinate lookup.
  std::optional<EmotionalCoordinate> coordinate(const std::string& track_id) const;

  /// @brief k nearest tracks to a 4D target, ascending distance.
  std::vector<TrackDistance> nearest(const EmotionalCoordinate& target, size_t k) const;

  /// @brief Path between two tracks (see PathFinder::findPath).
  PathResult findPath(const std::string& start, const std::string& end,
                      size_t max_steps) const;

  /// @brief Path with the configured default step count.
  PathResult findPath(const std::string& start, const std::string& end) const;

  /// @brief Time-stamped journey between two tracks.
  Journey createJourney(const JourneyRequest& request) const;

  /// @brief Statistics over all cached coordinates.
  SpaceStatistics statistics() const;

  /// @brief Cluster report over all cached coordinates.
  ClusterReport clusters() const;

  /// @brief Tracks most genetically similar to a cached track.
  /// @return Empty when the track has no profile.
  std::vector<std::pair<std::string, double>> geneticRelatives(const std::string& track_id,
                                                               size_t k) const;

  /// @brief Full export bundle for visualization.
  ///
  /// Contains every track (emotions, position, metadata), the strongest
  /// max_edges graph edges by descending weight, statistics and clusters.
  std::string exportBundleJson(size_t max_edges) const;

  /// @brief Write the pretty-printed export bundle to a file.
  /// @return False if the file cannot be written.
  bool writeExportBundle(const std::string& path, size_t max_edges) const;

  const SpaceConfig& config() const { return config_; }
  const CoordinateCache& cache() const { return cache_; }
  const SimilarityGraph& graph() const { return graph_; }
  const std::string& embeddingStrategy() const { return strategy_; }

 private:
  const DnaProfile* profileFor(const std::string& track_id) const;
  void writeBundle(JsonWriter& writer, size_t max_edges) const;

  SpaceConfig config_;
  CoordinateCache cache_;
  SimilarityGraph graph_;
  std::vector<DnaProfile> profiles_;
  std::unordered_map<std::string, size_t> profile_index_;
  std::string strategy_;
};

}  // namespace moodspace

#endif  // MOODSPACE_EMOTIONAL_SPACE_H
