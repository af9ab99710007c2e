// UMAP-style embedding preserving both local and global structure.

#ifndef MOODSPACE_EMBEDDING_UMAP_EMBEDDING_H
#define MOODSPACE_EMBEDDING_UMAP_EMBEDDING_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "embedding/embedding_strategy.h"

namespace moodspace {

/// @brief Parameters for UmapEmbedding.
struct UmapParams {
  size_t n_neighbors = 15;  ///< Includes the sample itself.
  uint32_t seed = 42;
  size_t epochs = 0;  ///< 0 = 500 for N <= 10000, else 200.
  size_t negative_sample_rate = 5;
  // Curve parameters fitted for min_dist = 0.1, spread = 1.0.
  double curve_a = 1.576943460405378;
  double curve_b = 0.8950608781227859;
};

/// @brief Weighted undirected edge of the fuzzy neighbour graph.
struct FuzzyEdge {
  size_t head = 0;
  size_t tail = 0;
  double weight = 0.0;
};

/// @brief Manifold embedding via a fuzzy k-NN graph and stochastic layout.
///
/// Steps: exact k-nearest neighbours; per-sample bandwidth calibrated so the
/// membership mass equals log2(k); fuzzy-union symmetrisation
/// (w = a + b - ab); spectral initialisation from the normalised graph
/// Laplacian (PCA for very large N or when the solver fails); then SGD with
/// attractive moves along edges and seeded negative sampling.
class UmapEmbedding : public EmbeddingStrategy {
 public:
  explicit UmapEmbedding(const UmapParams& params) : params_(params) {}

  const char* name() const override { return "umap"; }
  Matrix embed(const Matrix& data) const override;

  /// @brief Neighbour count for a sample count: min(cap, N / 3), within [2, N - 1].
  static size_t neighborsFor(size_t num_samples, size_t cap);

  /// @brief Build the symmetric fuzzy neighbour graph (one entry per unordered pair).
  static std::vector<FuzzyEdge> fuzzyGraph(const Matrix& data, size_t n_neighbors);

 private:
  Matrix initialLayout(const Matrix& data, const std::vector<FuzzyEdge>& edges) const;
  void optimizeLayout(const std::vector<FuzzyEdge>& edges, Matrix& layout) const;

  UmapParams params_;
};

}  // namespace moodspace

#endif  // MOODSPACE_EMBEDDING_UMAP_EMBEDDING_H
