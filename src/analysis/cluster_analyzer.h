// K-means clustering and PCA diagnostics over emotional coordinates.

#ifndef MOODSPACE_ANALYSIS_CLUSTER_ANALYZER_H
#define MOODSPACE_ANALYSIS_CLUSTER_ANALYZER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace moodspace {

class JsonWriter;

/// @brief Output of a k-means run over 4D points.
struct KMeansResult {
  std::vector<size_t> labels;           ///< Cluster index per point.
  std::vector<EmotionVector> centroids;
  double inertia = 0.0;                 ///< Sum of squared distances to centroids.
};

/// @brief Lloyd's k-means with k-means++ seeding and several restarts.
///
/// Each restart uses its own seed derived from seed; the restart with the
/// lowest inertia wins. Empty clusters are re-seeded with the point farthest
/// from its centroid.
///
/// @param points Input points (non-empty, k <= points.size()).
/// @param k Number of clusters.
/// @param seed Base random seed.
/// @param restarts Number of independent initialisations (at least 1).
KMeansResult kMeans(const std::vector<EmotionVector>& points, size_t k, uint32_t seed,
                    size_t restarts);

/// @brief Cluster report for a coordinate set.
struct ClusterReport {
  bool empty = true;  ///< True when fewer than 2 tracks were analysed.
  std::vector<Cluster> clusters;
  std::vector<double> pca_explained_variance;      ///< Up to 4 ratios.
  std::vector<std::vector<double>> pca_coordinates;  ///< One row per track.
  size_t total_tracks = 0;

  /// @brief Serialize; an empty report serializes as {}.
  void writeJson(JsonWriter& writer) const;
  std::string toJson() const;
};

/// @brief Groups tracks by their raw 4D coordinates.
class ClusterAnalyzer {
 public:
  /// @param max_clusters Cluster cap (k = min(max_clusters, N)).
  /// @param seed Random seed for k-means.
  /// @param restarts k-means restarts.
  ClusterAnalyzer(size_t max_clusters, uint32_t seed, size_t restarts)
      : max_clusters_(max_clusters), seed_(seed), restarts_(restarts) {}

  /// @brief Cluster tracks and project them onto their principal components.
  /// @param track_ids Track identifiers.
  /// @param coords Coordinates parallel to track_ids.
  /// @return Report; empty when fewer than 2 tracks.
  ClusterReport analyze(const std::vector<std::string>& track_ids,
                        const std::vector<EmotionalCoordinate>& coords) const;

 private:
  size_t max_clusters_;
  uint32_t seed_;
  size_t restarts_;
};

}  // namespace moodspace

#endif  // MOODSPACE_ANALYSIS_CLUSTER_ANALYZER_H
