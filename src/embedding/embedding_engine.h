// Embedding engine: standardizes feature vectors, selects a strategy by
// sample count and scales the result into a fixed-radius cube.

#ifndef MOODSPACE_EMBEDDING_EMBEDDING_ENGINE_H
#define MOODSPACE_EMBEDDING_EMBEDDING_ENGINE_H

#include <memory>
#include <string>
#include <vector>

#include "core/space_config.h"
#include "embedding/embedding_strategy.h"

namespace moodspace {

/// @brief Result of one embedding run.
struct EmbeddingResult {
  bool success = false;
  Matrix positions;        ///< N x 3, centered, max |coordinate| == target radius.
  std::string strategy;    ///< Strategy that produced the positions.
  bool fell_back = false;  ///< True if the selected strategy failed and PCA was used.
  std::string error_message;
};

/// @brief Standardize each column to zero mean and unit (population) variance.
///
/// Columns with zero variance become all-zero.
Matrix standardizeColumns(const Matrix& data);

/// @brief Center positions at the origin and scale to a target radius.
///
/// After scaling the largest absolute coordinate across all axes equals
/// target_radius. If every point coincides the centered (all-zero) matrix is
/// returned unscaled.
Matrix scalePositions(const Matrix& positions, double target_radius);

/// @brief Pack equal-length vectors into a sample matrix.
/// @return False (and leaves out untouched) if the set is empty, ragged,
///         zero-width or contains non-finite values.
bool toSampleMatrix(const std::vector<std::vector<double>>& vectors, Matrix& out,
                    std::string& error_message);

/// @brief Embeds full track sets into 3D.
class EmbeddingEngine {
 public:
  explicit EmbeddingEngine(const SpaceConfig& config) : config_(config) {}

  /// @brief Strategy used for a given sample count.
  ///
  /// N <= pca_max_samples: PCA. N > umap_min_samples with the global
  /// strategy enabled: UMAP. Otherwise t-SNE.
  std::unique_ptr<EmbeddingStrategy> selectStrategy(size_t num_samples) const;

  /// @brief Embed one feature vector per track.
  ///
  /// Fails (success == false) only for structurally invalid input. Numerical
  /// failure of the selected strategy degrades to PCA.
  ///
  /// @param vectors One equal-length feature vector per track.
  EmbeddingResult embed(const std::vector<std::vector<double>>& vectors) const;

  /// @brief Embed with an explicit strategy instead of selectStrategy().
  ///
  /// Same standardization, PCA fallback and scaling as embed(vectors).
  EmbeddingResult embed(const std::vector<std::vector<double>>& vectors,
                        const EmbeddingStrategy& strategy) const;

 private:
  SpaceConfig config_;
};

}  // namespace moodspace

#endif  // MOODSPACE_EMBEDDING_EMBEDDING_ENGINE_H
