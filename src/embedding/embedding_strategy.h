// Common interface for 3D embedding strategies.

#ifndef MOODSPACE_EMBEDDING_EMBEDDING_STRATEGY_H
#define MOODSPACE_EMBEDDING_EMBEDDING_STRATEGY_H

#include <Eigen/Core>

namespace moodspace {

/// Sample matrix: one row per track, one column per feature.
using Matrix = Eigen::MatrixXd;

/// @brief Maps an N x D sample matrix to N x 3 positions.
///
/// Implementations must be deterministic for identical input. A strategy
/// signals numerical failure by returning a matrix of the wrong shape or
/// containing non-finite values; the engine then falls back to PCA.
class EmbeddingStrategy {
 public:
  virtual ~EmbeddingStrategy() = default;

  /// @brief Short identifier used in logs and reports ("pca", "tsne", "umap").
  virtual const char* name() const = 0;

  /// @brief Embed standardized samples.
  /// @param data N x D standardized feature matrix.
  /// @return N x 3 positions (not yet centered or scaled).
  virtual Matrix embed(const Matrix& data) const = 0;
};

}  // namespace moodspace

#endif  // MOODSPACE_EMBEDDING_EMBEDDING_STRATEGY_H
