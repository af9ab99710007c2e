// Tunable parameters for building and querying an emotional space.

#ifndef MOODSPACE_CORE_SPACE_CONFIG_H
#define MOODSPACE_CORE_SPACE_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace moodspace {

/// @brief Unified configuration for embedding, graph, journey and report stages.
struct SpaceConfig {
  // Embedding.
  double target_radius = 25.0;     ///< Max |coordinate| after scaling.
  uint32_t seed = 42;              ///< Seed for every stochastic sub-step.
  size_t pca_max_samples = 3;      ///< N at or below this uses linear projection.
  size_t umap_min_samples = 15;    ///< N above this uses the global-structure strategy.
  size_t max_neighbors = 15;       ///< Neighbour cap for the global-structure strategy.
  double max_perplexity = 30.0;    ///< Perplexity cap for the local-neighbour strategy.
  size_t tsne_pca_dims = 50;       ///< Pre-reduction width before t-SNE.
  bool use_global_embedding = true;

  // Similarity graph.
  double similarity_threshold = 0.3;  ///< Edge iff 4D distance is below this.
  double edge_epsilon = 1e-6;         ///< Weight = 1 / (distance + epsilon).

  // Path finding and journeys.
  size_t default_max_steps = 10;
  double bridge_ratio = 0.7;

  // Reports.
  size_t max_clusters = 5;
  size_t kmeans_restarts = 10;
  size_t max_export_edges = 20000;

  bool verbose = false;  ///< Emit stage diagnostics to stderr.
};

/// @brief Outcome of reading a config file.
struct ConfigLoadResult {
  bool success = false;
  SpaceConfig config;
  std::string error_message;
};

/// @brief Apply members of a flat JSON object onto a config.
///
/// Unknown keys are ignored; keys with a wrong value type keep the existing value.
///
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
/// @param config Config to update in place.
/// @return False if the text is not a JSON object.
bool applyConfigJson(const char* json, size_t length, SpaceConfig& config);

/// @brief Load a config file on top of the defaults.
/// @param path Path to a flat JSON object file.
ConfigLoadResult loadSpaceConfig(const std::string& path);

}  // namespace moodspace

#endif  // MOODSPACE_CORE_SPACE_CONFIG_H
