// Exact t-SNE with early exaggeration, momentum and adaptive gains.

#include "embedding/tsne_embedding.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "core/basic_types.h"
#include "embedding/pca_projection.h"

namespace moodspace {

namespace {

constexpr double kMinProbability = 1e-12;
constexpr double kEntropyTolerance = 1e-5;
constexpr int kMaxSearchSteps = 100;

/// @brief Pairwise squared Euclidean distances.
Matrix squaredDistances(const Matrix& data) {
  const Eigen::Index rows = data.rows();
  Eigen::VectorXd norms = data.rowwise().squaredNorm();
  Matrix dist = (-2.0 * data * data.transpose()).colwise() + norms;
  dist.rowwise() += norms.transpose();
  for (Eigen::Index row = 0; row < rows; ++row) {
    dist(row, row) = 0.0;
    for (Eigen::Index col = 0; col < rows; ++col) {
      if (dist(row, col) < 0.0) dist(row, col) = 0.0;
    }
  }
  return dist;
}

/// @brief Conditional probabilities p(j|i) for one row at a target entropy.
void calibrateRow(const Matrix& dist, Eigen::Index row, double target_entropy,
                  Matrix& conditional) {
  const Eigen::Index count = dist.cols();
  double min_dist = std::numeric_limits<double>::max();
  for (Eigen::Index col = 0; col < count; ++col) {
    if (col != row) min_dist = std::min(min_dist, dist(row, col));
  }

  double beta = 1.0;
  double beta_min = -std::numeric_limits<double>::infinity();
  double beta_max = std::numeric_limits<double>::infinity();

  for (int step = 0; step < kMaxSearchSteps; ++step) {
    double sum_p = 0.0;
    double weighted = 0.0;
    for (Eigen::Index col = 0; col < count; ++col) {
      if (col == row) {
        conditional(row, col) = 0.0;
        continue;
      }
      double shifted = dist(row, col) - min_dist;
      double prob = std::exp(-shifted * beta);
      conditional(row, col) = prob;
      sum_p += prob;
      weighted += shifted * prob;
    }
    if (sum_p <= 0.0) sum_p = kMinProbability;
    double entropy = std::log(sum_p) + beta * weighted / sum_p;
    conditional.row(row) /= sum_p;

    double diff = entropy - target_entropy;
    if (std::fabs(diff) < kEntropyTolerance) break;
    if (diff > 0.0) {
      beta_min = beta;
      beta = std::isinf(beta_max) ? beta * 2.0 : (beta + beta_max) / 2.0;
    } else {
      beta_max = beta;
      beta = std::isinf(beta_min) ? beta / 2.0 : (beta + beta_min) / 2.0;
    }
  }
}

}  // namespace

double TsneEmbedding::perplexityFor(size_t num_samples, double cap) {
  double scaled = static_cast<double>(num_samples / 4);
  return std::max(1.0, std::min(cap, scaled));
}

Matrix TsneEmbedding::jointProbabilities(const Matrix& data, double perplexity) {
  const Eigen::Index count = data.rows();
  Matrix dist = squaredDistances(data);
  Matrix conditional = Matrix::Zero(count, count);
  double target_entropy = std::log(perplexity);
  for (Eigen::Index row = 0; row < count; ++row) {
    calibrateRow(dist, row, target_entropy, conditional);
  }
  Matrix joint = (conditional + conditional.transpose()) / (2.0 * static_cast<double>(count));
  joint = joint.cwiseMax(kMinProbability);
  joint.diagonal().setZero();
  return joint;
}

Matrix TsneEmbedding::embed(const Matrix& data) const {
  const Eigen::Index count = data.rows();
  const Eigen::Index dims = static_cast<Eigen::Index>(kPositionDims);
  if (count < 2) return Matrix::Zero(count, dims);

  Matrix input = data;
  if (static_cast<size_t>(data.cols()) > params_.pre_reduce_dims) {
    PcaResult reduced = computePca(data, params_.pre_reduce_dims);
    if (!reduced.success) return Matrix();
    input = reduced.projected;
  }

  Matrix joint = jointProbabilities(input, params_.perplexity);

  // PCA initialisation rescaled to a tiny spread.
  Matrix layout = PcaProjection().embed(input);
  double first_mean = layout.col(0).mean();
  double first_std = std::sqrt((layout.col(0).array() - first_mean).square().mean());
  if (first_std > 0.0) layout *= 1e-4 / first_std;

  double learning_rate =
      std::max(static_cast<double>(count) / params_.early_exaggeration / 4.0, 50.0);
  Matrix update = Matrix::Zero(count, dims);
  Matrix gains = Matrix::Ones(count, dims);
  Matrix gradient(count, dims);
  Matrix kernel(count, count);

  for (size_t iter = 0; iter < params_.iterations; ++iter) {
    bool exaggerating = iter < params_.exaggeration_iterations;
    double exaggeration = exaggerating ? params_.early_exaggeration : 1.0;
    double momentum = exaggerating ? params_.initial_momentum : params_.final_momentum;

    // Student-t kernel (one degree of freedom).
    double kernel_sum = 0.0;
    for (Eigen::Index row = 0; row < count; ++row) {
      kernel(row, row) = 0.0;
      for (Eigen::Index col = row + 1; col < count; ++col) {
        double value = 1.0 / (1.0 + (layout.row(row) - layout.row(col)).squaredNorm());
        kernel(row, col) = value;
        kernel(col, row) = value;
        kernel_sum += 2.0 * value;
      }
    }
    if (kernel_sum <= 0.0) kernel_sum = kMinProbability;

    gradient.setZero();
    for (Eigen::Index row = 0; row < count; ++row) {
      for (Eigen::Index col = 0; col < count; ++col) {
        if (row == col) continue;
        double q = std::max(kernel(row, col) / kernel_sum, kMinProbability);
        double force = (exaggeration * joint(row, col) - q) * kernel(row, col);
        gradient.row(row) += 4.0 * force * (layout.row(row) - layout.row(col));
      }
    }

    for (Eigen::Index row = 0; row < count; ++row) {
      for (Eigen::Index dim = 0; dim < dims; ++dim) {
        bool opposing = gradient(row, dim) * update(row, dim) < 0.0;
        gains(row, dim) = opposing ? gains(row, dim) + 0.2 : gains(row, dim) * 0.8;
        gains(row, dim) = std::max(gains(row, dim), params_.min_gain);
        update(row, dim) = momentum * update(row, dim) -
                           learning_rate * gains(row, dim) * gradient(row, dim);
      }
    }
    layout += update;
    layout.rowwise() -= layout.colwise().mean();

    if (!layout.allFinite()) return layout;
  }
  return layout;
}

}  // namespace moodspace
