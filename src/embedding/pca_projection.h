// Principal component projection (linear, variance-maximizing).

#ifndef MOODSPACE_EMBEDDING_PCA_PROJECTION_H
#define MOODSPACE_EMBEDDING_PCA_PROJECTION_H

#include <cstddef>
#include <vector>

#include "embedding/embedding_strategy.h"

namespace moodspace {

/// @brief Result of a principal component analysis.
struct PcaResult {
  bool success = false;
  Matrix projected;  ///< N x k scores on the leading components.
  std::vector<double> explained_variance_ratio;  ///< Length k, descending.
};

/// @brief Project samples onto their leading principal components.
///
/// Columns are centered, the covariance matrix is decomposed with a
/// symmetric eigen-solver and the k = min(n_components, N, D) components of
/// largest variance are kept. Each component's sign is fixed so that its
/// largest-magnitude loading is positive, making the output deterministic.
///
/// @param data N x D samples.
/// @param n_components Requested number of components.
/// @return Projection with k columns (k may be less than n_components).
PcaResult computePca(const Matrix& data, size_t n_components);

/// @brief PCA as an embedding strategy, zero-padded to 3 columns.
class PcaProjection : public EmbeddingStrategy {
 public:
  const char* name() const override { return "pca"; }
  Matrix embed(const Matrix& data) const override;
};

}  // namespace moodspace

#endif  // MOODSPACE_EMBEDDING_PCA_PROJECTION_H
