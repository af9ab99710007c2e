// Undirected weighted graph linking emotionally close tracks.

#ifndef MOODSPACE_GRAPH_SIMILARITY_GRAPH_H
#define MOODSPACE_GRAPH_SIMILARITY_GRAPH_H

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/basic_types.h"

namespace moodspace {

/// @brief One undirected edge, stored once with source added before target.
struct GraphEdge {
  size_t source = 0;  ///< Node index.
  size_t target = 0;  ///< Node index.
  double weight = 0.0;    ///< 1 / (distance + epsilon), strictly positive.
  double distance = 0.0;  ///< 4D emotional distance.
};

/// @brief Neighbour entry in a node's adjacency list.
struct GraphNeighbor {
  size_t node = 0;
  size_t edge = 0;  ///< Index into edges().
};

/// @brief Similarity graph over raw 4D emotional coordinates.
///
/// Nodes keep insertion order; edges keep the order in which the pairwise
/// scan discovered them. No self-loops and no parallel edges.
class SimilarityGraph {
 public:
  /// @brief Build a graph from scratch.
  ///
  /// An edge joins two tracks iff epsilon < distance < threshold, with
  /// weight 1 / (distance + epsilon). Distances at or below epsilon count as
  /// duplicates and stay unconnected.
  ///
  /// @param track_ids Node identifiers (duplicates after the first are ignored).
  /// @param emotions 4D coordinates, parallel to track_ids.
  /// @param threshold Distance threshold (exclusive).
  /// @param epsilon Weight regulariser and duplicate cutoff.
  static SimilarityGraph build(const std::vector<std::string>& track_ids,
                               const std::vector<EmotionVector>& emotions,
                               double threshold, double epsilon);

  size_t nodeCount() const { return ids_.size(); }
  size_t edgeCount() const { return edges_.size(); }

  bool contains(const std::string& track_id) const;

  /// @brief Node index of a track, or nodeCount() if absent.
  size_t indexOf(const std::string& track_id) const;

  const std::string& idAt(size_t index) const { return ids_[index]; }
  const EmotionVector& emotionAt(size_t index) const { return emotions_[index]; }
  const std::vector<GraphEdge>& edges() const { return edges_; }
  const std::vector<GraphNeighbor>& neighbors(size_t index) const { return adjacency_[index]; }

  /// @brief Weight of the edge between two tracks, or 0 when not adjacent.
  double weightBetween(const std::string& lhs, const std::string& rhs) const;

  /// @brief Edges sorted by descending weight, ties kept in insertion order.
  /// @param limit Maximum number of edges returned.
  std::vector<GraphEdge> strongestEdges(size_t limit) const;

 private:
  std::vector<std::string> ids_;
  std::vector<EmotionVector> emotions_;
  std::unordered_map<std::string, size_t> index_;
  std::vector<GraphEdge> edges_;
  std::vector<std::vector<GraphNeighbor>> adjacency_;
};

/// @brief Euclidean distance between two 4D emotion vectors.
double emotionDistance(const EmotionVector& lhs, const EmotionVector& rhs);

}  // namespace moodspace

#endif  // MOODSPACE_GRAPH_SIMILARITY_GRAPH_H
