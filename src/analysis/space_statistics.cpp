// Statistics computation and serialization.

#include "analysis/space_statistics.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "core/json_helpers.h"

namespace moodspace {

SpaceStatistics computeStatistics(const std::vector<EmotionalCoordinate>& coords) {
  SpaceStatistics stats;
  if (coords.empty()) return stats;
  stats.empty = false;

  const double count = static_cast<double>(coords.size());
  for (size_t dim = 0; dim < kEmotionDims; ++dim) {
    DimensionStats& out = stats.dimensions[dim];
    double first = coords.front().emotions()[dim];
    out.min = first;
    out.max = first;
    double sum = 0.0;
    for (const auto& coord : coords) {
      double value = coord.emotions()[dim];
      out.min = std::min(out.min, value);
      out.max = std::max(out.max, value);
      sum += value;
    }
    out.mean = sum / count;

    double squares = 0.0;
    for (const auto& coord : coords) {
      double diff = coord.emotions()[dim] - out.mean;
      squares += diff * diff;
    }
    out.std_dev = std::sqrt(squares / count);
  }

  stats.center = makeCoordinate(stats.dimensions[0].mean, stats.dimensions[1].mean,
                                stats.dimensions[2].mean, stats.dimensions[3].mean);
  return stats;
}

void SpaceStatistics::writeJson(JsonWriter& writer) const {
  writer.beginObject();
  if (empty) {
    writer.endObject();
    return;
  }

  writer.key("emotional_ranges");
  writer.beginObject();
  for (size_t dim = 0; dim < kEmotionDims; ++dim) {
    writer.key(emotionDimensionName(dim));
    writer.beginObject();
    writer.field("min", dimensions[dim].min);
    writer.field("max", dimensions[dim].max);
    writer.field("mean", dimensions[dim].mean);
    writer.endObject();
  }
  writer.endObject();

  writer.key("emotional_center");
  writer.beginObject();
  for (size_t dim = 0; dim < kEmotionDims; ++dim) {
    writer.field(emotionDimensionName(dim), dimensions[dim].mean);
  }
  writer.endObject();

  writer.key("emotional_spread");
  writer.beginObject();
  for (size_t dim = 0; dim < kEmotionDims; ++dim) {
    writer.field(emotionDimensionName(dim), dimensions[dim].std_dev);
  }
  writer.endObject();

  writer.endObject();
}

std::string SpaceStatistics::toJson() const {
  JsonWriter writer;
  writeJson(writer);
  return writer.toString();
}

std::string SpaceStatistics::toTextSummary() const {
  if (empty) return "Emotional space: empty\n";
  std::string text = "Emotional space statistics:\n";
  char line[128];
  for (size_t dim = 0; dim < kEmotionDims; ++dim) {
    const DimensionStats& stats = dimensions[dim];
    std::snprintf(line, sizeof(line), "  %-10s min %7.3f  max %7.3f  mean %7.3f  std %6.3f\n",
                  emotionDimensionName(dim), stats.min, stats.max, stats.mean, stats.std_dev);
    text += line;
  }
  return text;
}

}  // namespace moodspace
