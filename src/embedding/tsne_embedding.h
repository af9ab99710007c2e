// Exact t-SNE embedding tuned for local neighbourhood preservation.

#ifndef MOODSPACE_EMBEDDING_TSNE_EMBEDDING_H
#define MOODSPACE_EMBEDDING_TSNE_EMBEDDING_H

#include <cstddef>

#include "embedding/embedding_strategy.h"

namespace moodspace {

/// @brief Optimisation parameters for TsneEmbedding.
struct TsneParams {
  double perplexity = 30.0;
  size_t pre_reduce_dims = 50;  ///< PCA width applied first when D exceeds it.
  size_t iterations = 1000;
  size_t exaggeration_iterations = 250;
  double early_exaggeration = 12.0;
  double initial_momentum = 0.5;
  double final_momentum = 0.8;
  double min_gain = 0.01;
};

/// @brief Exact O(N^2) t-SNE into three dimensions.
///
/// Conditional probabilities are calibrated per sample by binary search on
/// the Gaussian precision until the entropy matches log(perplexity). The
/// layout is initialised from the PCA projection (scaled to a standard
/// deviation of 1e-4 on the first axis), so the result is deterministic
/// without a random seed. Learning rate follows max(N / 48, 50).
class TsneEmbedding : public EmbeddingStrategy {
 public:
  explicit TsneEmbedding(const TsneParams& params) : params_(params) {}

  const char* name() const override { return "tsne"; }
  Matrix embed(const Matrix& data) const override;

  /// @brief Perplexity for a sample count: min(cap, N / 4), at least 1.
  static double perplexityFor(size_t num_samples, double cap);

  /// @brief Symmetrised joint probabilities P for a sample matrix.
  ///
  /// Exposed for tests. Rows sum to roughly 1/N; the diagonal is zero.
  static Matrix jointProbabilities(const Matrix& data, double perplexity);

 private:
  TsneParams params_;
};

}  // namespace moodspace

#endif  // MOODSPACE_EMBEDDING_TSNE_EMBEDDING_H
