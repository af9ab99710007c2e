// Fuzzy-graph manifold embedding with negative-sampling SGD.

#include "embedding/umap_embedding.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <map>
#include <numeric>
#include <random>
#include <utility>

#include <Eigen/Eigenvalues>

#include "core/basic_types.h"
#include "core/rng_util.h"
#include "embedding/pca_projection.h"

namespace moodspace {

namespace {

constexpr int kBandwidthSearchSteps = 64;
constexpr double kBandwidthTolerance = 1e-5;
constexpr double kMinDistScale = 1e-3;
constexpr double kGradientClip = 4.0;
constexpr double kInitialExtent = 10.0;

/// Spectral initialisation decomposes a dense N x N matrix; above this use PCA.
constexpr size_t kSpectralMaxSamples = 2000;

double clipGradient(double value) {
  return std::max(-kGradientClip, std::min(kGradientClip, value));
}

/// @brief Neighbour indices and distances of one sample, self first.
struct NeighborRow {
  std::vector<size_t> indices;
  std::vector<double> distances;
};

NeighborRow nearestNeighbors(const Matrix& data, Eigen::Index row, size_t k) {
  const size_t count = static_cast<size_t>(data.rows());
  std::vector<std::pair<double, size_t>> all;
  all.reserve(count);
  for (size_t other = 0; other < count; ++other) {
    double dist = other == static_cast<size_t>(row)
                      ? 0.0
                      : (data.row(row) - data.row(static_cast<Eigen::Index>(other))).norm();
    all.emplace_back(dist, other);
  }
  // Self sorts first: distance 0 and ties broken toward the own index.
  auto self_first = [row](const std::pair<double, size_t>& lhs,
                          const std::pair<double, size_t>& rhs) {
    if (lhs.first != rhs.first) return lhs.first < rhs.first;
    bool lhs_self = lhs.second == static_cast<size_t>(row);
    bool rhs_self = rhs.second == static_cast<size_t>(row);
    if (lhs_self != rhs_self) return lhs_self;
    return lhs.second < rhs.second;
  };
  size_t take = std::min(k, count);
  std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(take), all.end(),
                    self_first);
  NeighborRow result;
  for (size_t idx = 0; idx < take; ++idx) {
    result.distances.push_back(all[idx].first);
    result.indices.push_back(all[idx].second);
  }
  return result;
}

/// @brief Bandwidth sigma such that sum exp(-(d - rho) / sigma) = log2(k).
double calibrateBandwidth(const NeighborRow& row, double rho, double mean_all) {
  double target = std::log2(static_cast<double>(row.distances.size()));
  double low = 0.0;
  double high = std::numeric_limits<double>::infinity();
  double mid = 1.0;

  for (int step = 0; step < kBandwidthSearchSteps; ++step) {
    double mass = 0.0;
    for (size_t idx = 1; idx < row.distances.size(); ++idx) {
      double gap = row.distances[idx] - rho;
      mass += gap > 0.0 ? std::exp(-gap / mid) : 1.0;
    }
    if (std::fabs(mass - target) < kBandwidthTolerance) break;
    if (mass > target) {
      high = mid;
      mid = (low + high) / 2.0;
    } else {
      low = mid;
      mid = std::isinf(high) ? mid * 2.0 : (low + high) / 2.0;
    }
  }

  double mean_row = 0.0;
  for (double dist : row.distances) mean_row += dist;
  mean_row /= static_cast<double>(row.distances.size());
  double floor = rho > 0.0 ? kMinDistScale * mean_row : kMinDistScale * mean_all;
  return std::max(mid, floor);
}

}  // namespace

size_t UmapEmbedding::neighborsFor(size_t num_samples, size_t cap) {
  if (num_samples < 3) return num_samples;
  size_t scaled = std::min(cap, num_samples / 3);
  return std::max<size_t>(2, std::min(scaled, num_samples - 1));
}

std::vector<FuzzyEdge> UmapEmbedding::fuzzyGraph(const Matrix& data, size_t n_neighbors) {
  const size_t count = static_cast<size_t>(data.rows());
  std::vector<NeighborRow> rows;
  rows.reserve(count);
  double mean_all = 0.0;
  size_t dist_count = 0;
  for (size_t row = 0; row < count; ++row) {
    rows.push_back(nearestNeighbors(data, static_cast<Eigen::Index>(row), n_neighbors));
    for (double dist : rows.back().distances) mean_all += dist;
    dist_count += rows.back().distances.size();
  }
  if (dist_count > 0) mean_all /= static_cast<double>(dist_count);

  // Directed memberships keyed by unordered pair: (i->j, j->i).
  std::map<std::pair<size_t, size_t>, std::pair<double, double>> directed;
  for (size_t row = 0; row < count; ++row) {
    const NeighborRow& neighbors = rows[row];
    double rho = 0.0;
    for (size_t idx = 1; idx < neighbors.distances.size(); ++idx) {
      if (neighbors.distances[idx] > 0.0) {
        rho = neighbors.distances[idx];
        break;
      }
    }
    double sigma = calibrateBandwidth(neighbors, rho, mean_all);
    for (size_t idx = 1; idx < neighbors.indices.size(); ++idx) {
      size_t other = neighbors.indices[idx];
      double gap = neighbors.distances[idx] - rho;
      double membership = gap > 0.0 ? std::exp(-gap / sigma) : 1.0;
      auto key = std::make_pair(std::min(row, other), std::max(row, other));
      auto& slot = directed[key];
      if (row < other) {
        slot.first = membership;
      } else {
        slot.second = membership;
      }
    }
  }

  std::vector<FuzzyEdge> edges;
  edges.reserve(directed.size());
  for (const auto& entry : directed) {
    double fwd = entry.second.first;
    double back = entry.second.second;
    double weight = fwd + back - fwd * back;
    if (weight > 0.0) {
      edges.push_back({entry.first.first, entry.first.second, weight});
    }
  }
  return edges;
}

Matrix UmapEmbedding::initialLayout(const Matrix& data,
                                    const std::vector<FuzzyEdge>& edges) const {
  const Eigen::Index count = data.rows();
  const Eigen::Index dims = static_cast<Eigen::Index>(kPositionDims);
  Matrix layout;

  if (static_cast<size_t>(count) <= kSpectralMaxSamples && count > dims + 1) {
    Matrix affinity = Matrix::Zero(count, count);
    for (const auto& edge : edges) {
      affinity(static_cast<Eigen::Index>(edge.head), static_cast<Eigen::Index>(edge.tail)) =
          edge.weight;
      affinity(static_cast<Eigen::Index>(edge.tail), static_cast<Eigen::Index>(edge.head)) =
          edge.weight;
    }
    Eigen::VectorXd degree = affinity.rowwise().sum();
    Eigen::VectorXd inv_sqrt(count);
    for (Eigen::Index idx = 0; idx < count; ++idx) {
      inv_sqrt(idx) = degree(idx) > 0.0 ? 1.0 / std::sqrt(degree(idx)) : 0.0;
    }
    Matrix laplacian = Matrix::Identity(count, count) -
                       inv_sqrt.asDiagonal() * affinity * inv_sqrt.asDiagonal();
    Eigen::SelfAdjointEigenSolver<Matrix> solver(laplacian);
    if (solver.info() == Eigen::Success) {
      // Skip the trivial smallest eigenvector.
      layout = solver.eigenvectors().block(0, 1, count, dims);
    }
  }
  if (layout.rows() != count || !layout.allFinite()) {
    layout = PcaProjection().embed(data);
  }

  // Rescale each axis to [0, 10] and jitter slightly to separate duplicates.
  std::mt19937 rng(rng::splitmix32(params_.seed, 0));
  std::normal_distribution<double> jitter(0.0, 1e-4);
  for (Eigen::Index dim = 0; dim < dims; ++dim) {
    double low = layout.col(dim).minCoeff();
    double high = layout.col(dim).maxCoeff();
    double range = high - low;
    for (Eigen::Index row = 0; row < count; ++row) {
      double scaled = range > 0.0 ? kInitialExtent * (layout(row, dim) - low) / range : 0.0;
      layout(row, dim) = scaled + jitter(rng);
    }
  }
  return layout;
}

void UmapEmbedding::optimizeLayout(const std::vector<FuzzyEdge>& edges, Matrix& layout) const {
  if (edges.empty()) return;
  const size_t count = static_cast<size_t>(layout.rows());
  const Eigen::Index dims = layout.cols();
  size_t epochs = params_.epochs > 0 ? params_.epochs : (count <= 10000 ? 500 : 200);
  double max_weight = 0.0;
  for (const auto& edge : edges) max_weight = std::max(max_weight, edge.weight);

  // Both directions of every edge are sampled, as in the symmetric graph matrix.
  struct Sample {
    size_t head;
    size_t tail;
    double every;          // epochs per positive sample
    double next;           // epoch of next positive sample
    double negative_every;
    double negative_next;
  };
  std::vector<Sample> samples;
  double min_weight = max_weight / static_cast<double>(epochs);
  for (const auto& edge : edges) {
    if (edge.weight < min_weight) continue;
    double every = max_weight / edge.weight;
    double negative_every = every / static_cast<double>(params_.negative_sample_rate);
    samples.push_back({edge.head, edge.tail, every, every, negative_every, negative_every});
    samples.push_back({edge.tail, edge.head, every, every, negative_every, negative_every});
  }

  const double a = params_.curve_a;
  const double b = params_.curve_b;
  std::mt19937 rng(rng::splitmix32(params_.seed, 1));

  for (size_t epoch = 0; epoch < epochs; ++epoch) {
    double alpha = 1.0 - static_cast<double>(epoch) / static_cast<double>(epochs);
    double now = static_cast<double>(epoch);

    for (auto& sample : samples) {
      if (sample.next > now) continue;
      auto head = static_cast<Eigen::Index>(sample.head);
      auto tail = static_cast<Eigen::Index>(sample.tail);

      double dist_sq = (layout.row(head) - layout.row(tail)).squaredNorm();
      double attract = 0.0;
      if (dist_sq > 0.0) {
        attract = -2.0 * a * b * std::pow(dist_sq, b - 1.0) / (a * std::pow(dist_sq, b) + 1.0);
      }
      for (Eigen::Index dim = 0; dim < dims; ++dim) {
        double grad = clipGradient(attract * (layout(head, dim) - layout(tail, dim)));
        layout(head, dim) += grad * alpha;
        layout(tail, dim) -= grad * alpha;
      }
      sample.next += sample.every;

      double pending = (now - sample.negative_next) / sample.negative_every;
      size_t negatives = pending > 0.0 ? static_cast<size_t>(pending) : 0;
      for (size_t neg = 0; neg < negatives; ++neg) {
        auto other = static_cast<Eigen::Index>(rng::rollIndex(rng, count));
        if (other == head) continue;
        double neg_sq = (layout.row(head) - layout.row(other)).squaredNorm();
        double repel = 0.0;
        if (neg_sq > 0.0) {
          repel = 2.0 * b / ((0.001 + neg_sq) * (a * std::pow(neg_sq, b) + 1.0));
        }
        for (Eigen::Index dim = 0; dim < dims; ++dim) {
          double grad = repel > 0.0
                            ? clipGradient(repel * (layout(head, dim) - layout(other, dim)))
                            : kGradientClip;
          layout(head, dim) += grad * alpha;
        }
      }
      sample.negative_next += static_cast<double>(negatives) * sample.negative_every;
    }
  }
}

Matrix UmapEmbedding::embed(const Matrix& data) const {
  const size_t count = static_cast<size_t>(data.rows());
  if (count < 4) return PcaProjection().embed(data);

  size_t neighbors = std::min(std::max<size_t>(params_.n_neighbors, 2), count);
  std::vector<FuzzyEdge> edges = fuzzyGraph(data, neighbors);
  Matrix layout = initialLayout(data, edges);
  optimizeLayout(edges, layout);
  return layout;
}

}  // namespace moodspace
