// Pairwise similarity graph construction.

#include "graph/similarity_graph.h"

#include <algorithm>
#include <cmath>

namespace moodspace {

double emotionDistance(const EmotionVector& lhs, const EmotionVector& rhs) {
  double sum = 0.0;
  for (size_t dim = 0; dim < kEmotionDims; ++dim) {
    double diff = lhs[dim] - rhs[dim];
    sum += diff * diff;
  }
  return std::sqrt(sum);
}

SimilarityGraph SimilarityGraph::build(const std::vector<std::string>& track_ids,
                                       const std::vector<EmotionVector>& emotions,
                                       double threshold, double epsilon) {
  SimilarityGraph graph;
  size_t count = std::min(track_ids.size(), emotions.size());
  for (size_t idx = 0; idx < count; ++idx) {
    if (graph.index_.count(track_ids[idx]) > 0) continue;
    graph.index_.emplace(track_ids[idx], graph.ids_.size());
    graph.ids_.push_back(track_ids[idx]);
    graph.emotions_.push_back(emotions[idx]);
  }
  graph.adjacency_.resize(graph.ids_.size());

  // O(N^2) scan over unordered pairs.
  for (size_t lhs = 0; lhs < graph.ids_.size(); ++lhs) {
    for (size_t rhs = lhs + 1; rhs < graph.ids_.size(); ++rhs) {
      double distance = emotionDistance(graph.emotions_[lhs], graph.emotions_[rhs]);
      if (distance >= threshold || distance <= epsilon) continue;
      GraphEdge edge;
      edge.source = lhs;
      edge.target = rhs;
      edge.distance = distance;
      edge.weight = 1.0 / (distance + epsilon);
      size_t edge_index = graph.edges_.size();
      graph.edges_.push_back(edge);
      graph.adjacency_[lhs].push_back({rhs, edge_index});
      graph.adjacency_[rhs].push_back({lhs, edge_index});
    }
  }
  return graph;
}

bool SimilarityGraph::contains(const std::string& track_id) const {
  return index_.count(track_id) > 0;
}

size_t SimilarityGraph::indexOf(const std::string& track_id) const {
  auto iter = index_.find(track_id);
  return iter == index_.end() ? ids_.size() : iter->second;
}

double SimilarityGraph::weightBetween(const std::string& lhs, const std::string& rhs) const {
  size_t from = indexOf(lhs);
  size_t to = indexOf(rhs);
  if (from >= ids_.size() || to >= ids_.size()) return 0.0;
  for (const auto& neighbor : adjacency_[from]) {
    if (neighbor.node == to) return edges_[neighbor.edge].weight;
  }
  return 0.0;
}

std::vector<GraphEdge> SimilarityGraph::strongestEdges(size_t limit) const {
  std::vector<GraphEdge> sorted = edges_;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const GraphEdge& lhs, const GraphEdge& rhs) {
                     return lhs.weight > rhs.weight;
                   });
  if (sorted.size() > limit) sorted.resize(limit);
  return sorted;
}

}  // namespace moodspace
