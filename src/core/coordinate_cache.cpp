// Coordinate cache storage and nearest-neighbour scan.

#include "core/coordinate_cache.h"

#include <algorithm>

namespace moodspace {

void CoordinateCache::put(const std::string& track_id, const EmotionalCoordinate& coord) {
  auto iter = index_.find(track_id);
  if (iter != index_.end()) {
    coords_[iter->second] = coord;
    return;
  }
  index_.emplace(track_id, ids_.size());
  ids_.push_back(track_id);
  coords_.push_back(coord);
}

void CoordinateCache::clear() {
  ids_.clear();
  coords_.clear();
  index_.clear();
}

std::optional<EmotionalCoordinate> CoordinateCache::get(const std::string& track_id) const {
  auto iter = index_.find(track_id);
  if (iter == index_.end()) return std::nullopt;
  return coords_[iter->second];
}

bool CoordinateCache::contains(const std::string& track_id) const {
  return index_.count(track_id) > 0;
}

std::vector<TrackDistance> CoordinateCache::nearest(const EmotionalCoordinate& target,
                                                    size_t k) const {
  std::vector<TrackDistance> result;
  if (k == 0 || ids_.empty()) return result;
  result.reserve(ids_.size());
  for (size_t idx = 0; idx < ids_.size(); ++idx) {
    result.emplace_back(ids_[idx], target.distanceTo(coords_[idx]));
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const TrackDistance& lhs, const TrackDistance& rhs) {
                     return lhs.second < rhs.second;
                   });
  if (result.size() > k) result.resize(k);
  return result;
}

}  // namespace moodspace
