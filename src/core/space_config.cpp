// Config file reading for SpaceConfig.

#include "core/space_config.h"

#include <fstream>
#include <limits>
#include <map>
#include <sstream>

#include "core/json_parser.h"

namespace moodspace {

namespace {

void readSize(const std::map<std::string, JsonValue>& values, const char* name,
              size_t& target) {
  auto iter = values.find(name);
  if (iter == values.end() || !iter->second.isNumber() || iter->second.number_val < 0.0) {
    return;
  }
  constexpr size_t kMaxSize = std::numeric_limits<size_t>::max();
  double val = iter->second.number_val;
  target = val >= static_cast<double>(kMaxSize) ? kMaxSize : static_cast<size_t>(val);
}

void readDouble(const std::map<std::string, JsonValue>& values, const char* name,
                double& target) {
  auto iter = values.find(name);
  if (iter != values.end() && iter->second.isNumber()) {
    target = iter->second.number_val;
  }
}

}  // namespace

bool applyConfigJson(const char* json, size_t length, SpaceConfig& config) {
  std::map<std::string, JsonValue> values = parseJsonObject(json, length);
  if (values.empty()) {
    // Empty map covers both "{}" and a rejected document.
    JsonParseResult parsed = parseJson(json, length);
    return parsed.success && parsed.root.isObject();
  }

  readDouble(values, "target_radius", config.target_radius);
  if (auto iter = values.find("seed"); iter != values.end()) {
    config.seed = iter->second.asUint(config.seed);
  }
  readSize(values, "pca_max_samples", config.pca_max_samples);
  readSize(values, "umap_min_samples", config.umap_min_samples);
  readSize(values, "max_neighbors", config.max_neighbors);
  readDouble(values, "max_perplexity", config.max_perplexity);
  readSize(values, "tsne_pca_dims", config.tsne_pca_dims);
  if (auto iter = values.find("use_global_embedding"); iter != values.end()) {
    config.use_global_embedding = iter->second.asBool(config.use_global_embedding);
  }
  readDouble(values, "similarity_threshold", config.similarity_threshold);
  readDouble(values, "edge_epsilon", config.edge_epsilon);
  readSize(values, "default_max_steps", config.default_max_steps);
  readDouble(values, "bridge_ratio", config.bridge_ratio);
  readSize(values, "max_clusters", config.max_clusters);
  readSize(values, "kmeans_restarts", config.kmeans_restarts);
  readSize(values, "max_export_edges", config.max_export_edges);
  if (auto iter = values.find("verbose"); iter != values.end()) {
    config.verbose = iter->second.asBool(config.verbose);
  }
  return true;
}

ConfigLoadResult loadSpaceConfig(const std::string& path) {
  ConfigLoadResult result;
  std::ifstream file(path);
  if (!file.is_open()) {
    result.error_message = "cannot open config file: " + path;
    return result;
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  std::string text = oss.str();
  if (!applyConfigJson(text.data(), text.size(), result.config)) {
    result.error_message = "config file is not a JSON object: " + path;
    return result;
  }
  result.success = true;
  return result;
}

}  // namespace moodspace
