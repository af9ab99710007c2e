// Strategy selection, standardization, fallback and scaling.

#include "embedding/embedding_engine.h"

#include <cmath>
#include <cstdio>
#include <utility>

#include "core/basic_types.h"
#include "embedding/pca_projection.h"
#include "embedding/tsne_embedding.h"
#include "embedding/umap_embedding.h"

namespace moodspace {

Matrix standardizeColumns(const Matrix& data) {
  Matrix result = Matrix::Zero(data.rows(), data.cols());
  if (data.rows() == 0) return result;
  for (Eigen::Index col = 0; col < data.cols(); ++col) {
    double mean = data.col(col).mean();
    double variance = (data.col(col).array() - mean).square().mean();
    if (variance <= 0.0) continue;
    double std_dev = std::sqrt(variance);
    result.col(col) = (data.col(col).array() - mean) / std_dev;
  }
  return result;
}

Matrix scalePositions(const Matrix& positions, double target_radius) {
  if (positions.rows() == 0) return positions;
  Matrix centered = positions.rowwise() - positions.colwise().mean();
  double max_abs = centered.cwiseAbs().maxCoeff();
  if (max_abs > 0.0) {
    centered *= target_radius / max_abs;
  }
  return centered;
}

bool toSampleMatrix(const std::vector<std::vector<double>>& vectors, Matrix& out,
                    std::string& error_message) {
  if (vectors.empty()) {
    error_message = "empty feature vector set";
    return false;
  }
  size_t width = vectors.front().size();
  if (width == 0) {
    error_message = "feature vectors have zero length";
    return false;
  }
  Matrix data(static_cast<Eigen::Index>(vectors.size()), static_cast<Eigen::Index>(width));
  for (size_t row = 0; row < vectors.size(); ++row) {
    if (vectors[row].size() != width) {
      error_message = "feature vector " + std::to_string(row) + " has length " +
                      std::to_string(vectors[row].size()) + ", expected " +
                      std::to_string(width);
      return false;
    }
    for (size_t col = 0; col < width; ++col) {
      double value = vectors[row][col];
      if (!std::isfinite(value)) {
        error_message = "feature vector " + std::to_string(row) + " has a non-finite value";
        return false;
      }
      data(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col)) = value;
    }
  }
  out = std::move(data);
  return true;
}

std::unique_ptr<EmbeddingStrategy> EmbeddingEngine::selectStrategy(size_t num_samples) const {
  if (num_samples <= config_.pca_max_samples) {
    return std::make_unique<PcaProjection>();
  }
  if (config_.use_global_embedding && num_samples > config_.umap_min_samples) {
    UmapParams params;
    params.n_neighbors = UmapEmbedding::neighborsFor(num_samples, config_.max_neighbors);
    params.seed = config_.seed;
    return std::make_unique<UmapEmbedding>(params);
  }
  TsneParams params;
  params.perplexity = TsneEmbedding::perplexityFor(num_samples, config_.max_perplexity);
  params.pre_reduce_dims = config_.tsne_pca_dims;
  return std::make_unique<TsneEmbedding>(params);
}

EmbeddingResult EmbeddingEngine::embed(const std::vector<std::vector<double>>& vectors) const {
  std::unique_ptr<EmbeddingStrategy> strategy = selectStrategy(vectors.size());
  return embed(vectors, *strategy);
}

EmbeddingResult EmbeddingEngine::embed(const std::vector<std::vector<double>>& vectors,
                                       const EmbeddingStrategy& strategy) const {
  EmbeddingResult result;
  Matrix data;
  if (!toSampleMatrix(vectors, data, result.error_message)) {
    return result;
  }

  const Eigen::Index count = data.rows();
  Matrix scaled_input = standardizeColumns(data);
  if (config_.verbose) {
    std::fprintf(stderr, "[EmbeddingEngine] %lld samples x %lld features -> %s\n",
                 static_cast<long long>(count), static_cast<long long>(data.cols()),
                 strategy.name());
  }

  Matrix positions = strategy.embed(scaled_input);
  result.strategy = strategy.name();
  bool usable = positions.rows() == count &&
                positions.cols() == static_cast<Eigen::Index>(kPositionDims) &&
                positions.allFinite();
  if (!usable) {
    std::fprintf(stderr, "[EmbeddingEngine] WARNING: %s failed, falling back to pca\n",
                 strategy.name());
    positions = PcaProjection().embed(scaled_input);
    result.strategy = "pca";
    result.fell_back = true;
  }

  result.positions = scalePositions(positions, config_.target_radius);
  result.success = true;

  if (config_.verbose) {
    for (Eigen::Index dim = 0; dim < result.positions.cols(); ++dim) {
      std::fprintf(stderr, "[EmbeddingEngine] axis %lld range [%.1f, %.1f]\n",
                   static_cast<long long>(dim), result.positions.col(dim).minCoeff(),
                   result.positions.col(dim).maxCoeff());
    }
  }
  return result;
}

}  // namespace moodspace
