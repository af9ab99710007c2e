/// @file
/// @brief Emotional space rebuild pipeline and query routing.

#include "emotional_space.h"

#include <cstdio>
#include <fstream>
#include <utility>

#include "core/json_helpers.h"
#include "embedding/embedding_engine.h"
#include "embedding/feature_vector.h"

namespace moodspace {

EmotionalSpace::EmotionalSpace(const SpaceConfig& config) : config_(config) {}

RebuildResult EmotionalSpace::rebuild(const std::vector<DnaProfile>& profiles) {
  RebuildResult result;
  if (profiles.empty()) {
    result.error_message = "no profiles to map";
    return result;
  }

  std::vector<DnaProfile> unique;
  std::unordered_map<std::string, size_t> index;
  unique.reserve(profiles.size());
  for (const auto& profile : profiles) {
    if (index.count(profile.track_id) > 0) {
      ++result.duplicates_skipped;
      continue;
    }
    index.emplace(profile.track_id, unique.size());
    unique.push_back(profile);
  }
  if (result.duplicates_skipped > 0) {
    std::fprintf(stderr, "[EmotionalSpace] WARNING: %zu duplicate track ids skipped\n",
                 result.duplicates_skipped);
  }
  if (config_.verbose) {
    std::fprintf(stderr, "[EmotionalSpace] building from %zu tracks\n", unique.size());
  }

  std::vector<std::vector<double>> features;
  std::vector<std::string> track_ids;
  std::vector<EmotionVector> emotions;
  features.reserve(unique.size());
  track_ids.reserve(unique.size());
  emotions.reserve(unique.size());
  for (const auto& profile : unique) {
    features.push_back(buildFeatureVector(profile));
    track_ids.push_back(profile.track_id);
    emotions.push_back(profile.emotionalCoordinate().emotions());
  }

  EmbeddingEngine engine(config_);
  EmbeddingResult embedding = engine.embed(features);
  if (!embedding.success) {
    result.error_message = embedding.error_message;
    return result;
  }

  CoordinateCache cache;
  for (size_t idx = 0; idx < unique.size(); ++idx) {
    EmotionalCoordinate coord = unique[idx].emotionalCoordinate();
    auto row = static_cast<Eigen::Index>(idx);
    coord.x = embedding.positions(row, 0);
    coord.y = embedding.positions(row, 1);
    coord.z = embedding.positions(row, 2);
    cache.put(track_ids[idx], coord);
  }

  cache_ = std::move(cache);
  graph_ = SimilarityGraph::build(track_ids, emotions, config_.similarity_threshold,
                                  config_.edge_epsilon);
  profiles_ = std::move(unique);
  profile_index_ = std::move(index);
  strategy_ = embedding.strategy;

  result.success = true;
  result.track_count = cache_.size();
  result.edge_count = graph_.edgeCount();
  result.strategy = embedding.strategy;
  result.fell_back = embedding.fell_back;
  if (config_.verbose) {
    std::fprintf(stderr, "[EmotionalSpace] graph: %zu nodes, %zu edges\n",
                 graph_.nodeCount(), graph_.edgeCount());
  }
  return result;
}

std::optional<EmotionalCoordinate> EmotionalSpace::coordinate(
    const std::string& track_id) const {
  return cache_.get(track_id);
}

std::vector<TrackDistance> EmotionalSpace::nearest(const EmotionalCoordinate& target,
                                                   size_t k) const {
  return cache_.nearest(target, k);
}

PathResult EmotionalSpace::findPath(const std::string& start, const std::string& end,
                                    size_t max_steps) const {
  return PathFinder(graph_, cache_).findPath(start, end, max_steps);
}

PathResult EmotionalSpace::findPath(const std::string& start, const std::string& end) const {
  return findPath(start, end, config_.default_max_steps);
}

Journey EmotionalSpace::createJourney(const JourneyRequest& request) const {
  PathFinder finder(graph_, cache_);
  JourneySynthesizer synthesizer(finder, cache_, config_.bridge_ratio);
  return synthesizer.create(request);
}

SpaceStatistics EmotionalSpace::statistics() const {
  return computeStatistics(cache_.coordinates());
}

ClusterReport EmotionalSpace::clusters() const {
  ClusterAnalyzer analyzer(config_.max_clusters, config_.seed, config_.kmeans_restarts);
  return analyzer.analyze(cache_.ids(), cache_.coordinates());
}

const DnaProfile* EmotionalSpace::profileFor(const std::string& track_id) const {
  auto iter = profile_index_.find(track_id);
  return iter == profile_index_.end() ? nullptr : &profiles_[iter->second];
}

std::vector<std::pair<std::string, double>> EmotionalSpace::geneticRelatives(
    const std::string& track_id, size_t k) const {
  const DnaProfile* target = profileFor(track_id);
  if (!target) return {};
  return findGeneticRelatives(*target, profiles_, k);
}

void EmotionalSpace::writeBundle(JsonWriter& writer, size_t max_edges) const {
  writer.beginObject();

  writer.key("tracks");
  writer.beginArray();
  const auto& ids = cache_.ids();
  const auto& coords = cache_.coordinates();
  for (size_t idx = 0; idx < ids.size(); ++idx) {
    const EmotionalCoordinate& coord = coords[idx];
    writer.beginObject();
    writer.field("id", ids[idx]);
    writer.field("track_id", ids[idx]);

    writer.key("coordinates");
    writer.beginObject();
    writer.field("valence", coord.valence);
    writer.field("energy", coord.energy);
    writer.field("complexity", coord.complexity);
    writer.field("tension", coord.tension);
    writer.endObject();

    writer.key("position");
    writer.beginObject();
    writer.field("x", coord.x);
    writer.field("y", coord.y);
    writer.field("z", coord.z);
    writer.endObject();

    writer.key("metadata");
    writer.beginObject();
    if (const DnaProfile* profile = profileFor(ids[idx])) {
      writer.field("tempo", profile->tempo);
      writer.field("key", keyPitchClass(profile->key_signature));
      writer.field("key_name", profile->key_signature.value_or("C"));
      writer.field("mode", modeValue(profile->mode));
      writer.field("mode_name", profile->mode.value_or("Major"));
    }
    writer.endObject();
    writer.endObject();
  }
  writer.endArray();

  writer.key("connections");
  writer.beginArray();
  for (const auto& edge : graph_.strongestEdges(max_edges)) {
    writer.beginObject();
    writer.field("source", graph_.idAt(edge.source));
    writer.field("target", graph_.idAt(edge.target));
    writer.field("weight", edge.weight);
    writer.field("distance", edge.distance);
    writer.endObject();
  }
  writer.endArray();
  writer.field("total_connections", static_cast<uint64_t>(graph_.edgeCount()));

  writer.key("statistics");
  statistics().writeJson(writer);

  writer.key("clusters");
  clusters().writeJson(writer);

  writer.field("embedding", strategy_);
  writer.endObject();
}

std::string EmotionalSpace::exportBundleJson(size_t max_edges) const {
  JsonWriter writer;
  writeBundle(writer, max_edges);
  return writer.toString();
}

bool EmotionalSpace::writeExportBundle(const std::string& path, size_t max_edges) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    std::fprintf(stderr, "[EmotionalSpace] ERROR: cannot write %s\n", path.c_str());
    return false;
  }
  JsonWriter writer;
  writeBundle(writer, max_edges);
  file << writer.toPrettyString() << '\n';
  file.close();
  if (config_.verbose) {
    std::fprintf(stderr, "[EmotionalSpace] exported %zu tracks to %s\n", cache_.size(),
                 path.c_str());
  }
  return !file.fail();
}

}  // namespace moodspace
