// K-means clustering and PCA projection for the cluster report.

#include "analysis/cluster_analyzer.h"

#include <algorithm>
#include <limits>
#include <random>
#include <utility>

#include "core/json_helpers.h"
#include "core/rng_util.h"
#include "embedding/pca_projection.h"

namespace moodspace {

namespace {

constexpr size_t kMaxIterations = 300;
constexpr double kConvergenceTolerance = 1e-8;
constexpr size_t kPcaComponents = 4;

double squaredDistance(const EmotionVector& lhs, const EmotionVector& rhs) {
  double sum = 0.0;
  for (size_t dim = 0; dim < kEmotionDims; ++dim) {
    double diff = lhs[dim] - rhs[dim];
    sum += diff * diff;
  }
  return sum;
}

/// @brief k-means++ seeding.
std::vector<EmotionVector> seedCentroids(const std::vector<EmotionVector>& points, size_t k,
                                         std::mt19937& rng) {
  std::vector<EmotionVector> centroids;
  centroids.reserve(k);
  centroids.push_back(points[rng::rollIndex(rng, points.size())]);

  std::vector<double> nearest_sq(points.size(), std::numeric_limits<double>::max());
  while (centroids.size() < k) {
    for (size_t idx = 0; idx < points.size(); ++idx) {
      nearest_sq[idx] = std::min(nearest_sq[idx], squaredDistance(points[idx], centroids.back()));
    }
    centroids.push_back(points[rng::selectWeightedIndex(rng, nearest_sq)]);
  }
  return centroids;
}

/// @brief One Lloyd run from given centroids.
KMeansResult runLloyd(const std::vector<EmotionVector>& points,
                      std::vector<EmotionVector> centroids) {
  const size_t k = centroids.size();
  KMeansResult result;
  result.labels.assign(points.size(), 0);

  for (size_t iter = 0; iter < kMaxIterations; ++iter) {
    for (size_t idx = 0; idx < points.size(); ++idx) {
      double best = std::numeric_limits<double>::max();
      for (size_t cluster = 0; cluster < k; ++cluster) {
        double dist = squaredDistance(points[idx], centroids[cluster]);
        if (dist < best) {
          best = dist;
          result.labels[idx] = cluster;
        }
      }
    }

    std::vector<EmotionVector> sums(k, EmotionVector{});
    std::vector<size_t> counts(k, 0);
    for (size_t idx = 0; idx < points.size(); ++idx) {
      size_t cluster = result.labels[idx];
      ++counts[cluster];
      for (size_t dim = 0; dim < kEmotionDims; ++dim) sums[cluster][dim] += points[idx][dim];
    }

    std::vector<EmotionVector> updated(k);
    for (size_t cluster = 0; cluster < k; ++cluster) {
      if (counts[cluster] == 0) {
        // Re-seed an empty cluster with the worst-fitting point.
        size_t farthest = 0;
        double farthest_dist = -1.0;
        for (size_t idx = 0; idx < points.size(); ++idx) {
          double dist = squaredDistance(points[idx], centroids[result.labels[idx]]);
          if (dist > farthest_dist) {
            farthest_dist = dist;
            farthest = idx;
          }
        }
        updated[cluster] = points[farthest];
        continue;
      }
      for (size_t dim = 0; dim < kEmotionDims; ++dim) {
        updated[cluster][dim] = sums[cluster][dim] / static_cast<double>(counts[cluster]);
      }
    }

    double shift = 0.0;
    for (size_t cluster = 0; cluster < k; ++cluster) {
      shift += squaredDistance(updated[cluster], centroids[cluster]);
    }
    centroids = std::move(updated);
    if (shift <= kConvergenceTolerance) break;
  }

  // Final assignment against the settled centroids.
  result.inertia = 0.0;
  for (size_t idx = 0; idx < points.size(); ++idx) {
    double best = std::numeric_limits<double>::max();
    for (size_t cluster = 0; cluster < k; ++cluster) {
      double dist = squaredDistance(points[idx], centroids[cluster]);
      if (dist < best) {
        best = dist;
        result.labels[idx] = cluster;
      }
    }
    result.inertia += best;
  }
  result.centroids = std::move(centroids);
  return result;
}

}  // namespace

KMeansResult kMeans(const std::vector<EmotionVector>& points, size_t k, uint32_t seed,
                    size_t restarts) {
  KMeansResult best;
  if (points.empty() || k == 0) return best;
  k = std::min(k, points.size());
  best.inertia = std::numeric_limits<double>::max();

  size_t runs = std::max<size_t>(restarts, 1);
  for (size_t run = 0; run < runs; ++run) {
    std::mt19937 rng(rng::splitmix32(seed, static_cast<uint32_t>(run)));
    KMeansResult candidate = runLloyd(points, seedCentroids(points, k, rng));
    if (candidate.inertia < best.inertia) best = std::move(candidate);
  }
  return best;
}

ClusterReport ClusterAnalyzer::analyze(const std::vector<std::string>& track_ids,
                                       const std::vector<EmotionalCoordinate>& coords) const {
  ClusterReport report;
  const size_t count = std::min(track_ids.size(), coords.size());
  if (count < 2) return report;
  report.empty = false;
  report.total_tracks = count;

  std::vector<EmotionVector> points;
  points.reserve(count);
  Matrix data(static_cast<Eigen::Index>(count), static_cast<Eigen::Index>(kEmotionDims));
  for (size_t idx = 0; idx < count; ++idx) {
    points.push_back(coords[idx].emotions());
    for (size_t dim = 0; dim < kEmotionDims; ++dim) {
      data(static_cast<Eigen::Index>(idx), static_cast<Eigen::Index>(dim)) = points.back()[dim];
    }
  }

  PcaResult pca = computePca(data, kPcaComponents);
  if (pca.success) {
    report.pca_explained_variance = pca.explained_variance_ratio;
    for (Eigen::Index row = 0; row < pca.projected.rows(); ++row) {
      std::vector<double> projected(static_cast<size_t>(pca.projected.cols()));
      for (Eigen::Index col = 0; col < pca.projected.cols(); ++col) {
        projected[static_cast<size_t>(col)] = pca.projected(row, col);
      }
      report.pca_coordinates.push_back(std::move(projected));
    }
  }

  size_t k = std::min(max_clusters_, count);
  if (k < 2) return report;
  KMeansResult fit = kMeans(points, k, seed_, restarts_);
  for (size_t cluster = 0; cluster < fit.centroids.size(); ++cluster) {
    Cluster out;
    out.id = "cluster_" + std::to_string(cluster);
    const EmotionVector& center = fit.centroids[cluster];
    out.centroid = makeCoordinate(center[0], center[1], center[2], center[3]);
    for (size_t idx = 0; idx < count; ++idx) {
      if (fit.labels[idx] == cluster) out.track_ids.push_back(track_ids[idx]);
    }
    out.size = out.track_ids.size();
    report.clusters.push_back(std::move(out));
  }
  return report;
}

void ClusterReport::writeJson(JsonWriter& writer) const {
  writer.beginObject();
  if (empty) {
    writer.endObject();
    return;
  }
  writer.key("pca_explained_variance");
  writer.numberArray(pca_explained_variance);

  writer.key("pca_coordinates");
  writer.beginArray();
  for (const auto& row : pca_coordinates) writer.numberArray(row);
  writer.endArray();

  writer.key("clusters");
  writer.beginObject();
  for (const auto& cluster : clusters) {
    writer.key(cluster.id);
    writer.beginObject();
    writer.key("tracks");
    writer.beginArray();
    for (const auto& track_id : cluster.track_ids) writer.value(track_id);
    writer.endArray();
    writer.key("center");
    writer.beginObject();
    writer.field("valence", cluster.centroid.valence);
    writer.field("energy", cluster.centroid.energy);
    writer.field("complexity", cluster.centroid.complexity);
    writer.field("tension", cluster.centroid.tension);
    writer.endObject();
    writer.field("size", static_cast<uint64_t>(cluster.size));
    writer.endObject();
  }
  writer.endObject();

  writer.field("total_tracks", static_cast<uint64_t>(total_tracks));
  writer.endObject();
}

std::string ClusterReport::toJson() const {
  JsonWriter writer;
  writeJson(writer);
  return writer.toString();
}

}  // namespace moodspace
