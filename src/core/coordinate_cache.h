// Track-id keyed store of emotional coordinates produced by one embedding run.

#ifndef MOODSPACE_CORE_COORDINATE_CACHE_H
#define MOODSPACE_CORE_COORDINATE_CACHE_H

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/basic_types.h"

namespace moodspace {

/// @brief (track id, distance) pair returned by nearest-neighbour queries.
using TrackDistance = std::pair<std::string, double>;

/// @brief Insertion-ordered coordinate store.
///
/// Iteration order is the order tracks were inserted, which also serves as
/// the tie-break for nearest-neighbour queries.
class CoordinateCache {
 public:
  /// @brief Insert or replace a coordinate.
  void put(const std::string& track_id, const EmotionalCoordinate& coord);

  /// @brief Remove everything.
  void clear();

  /// @brief Coordinate lookup.
  /// @return The coordinate, or std::nullopt for an unknown track.
  std::optional<EmotionalCoordinate> get(const std::string& track_id) const;

  bool contains(const std::string& track_id) const;
  size_t size() const { return ids_.size(); }
  bool empty() const { return ids_.empty(); }

  const std::vector<std::string>& ids() const { return ids_; }
  const std::vector<EmotionalCoordinate>& coordinates() const { return coords_; }

  /// @brief k nearest tracks to a target by 4D emotional distance.
  ///
  /// Linear scan; results sorted by ascending distance with ties kept in
  /// insertion order. Returns an empty list for k == 0 or an empty cache.
  ///
  /// @param target Query coordinate (only the intrinsic dimensions are used).
  /// @param k Maximum number of results.
  std::vector<TrackDistance> nearest(const EmotionalCoordinate& target, size_t k) const;

 private:
  std::vector<std::string> ids_;
  std::vector<EmotionalCoordinate> coords_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace moodspace

#endif  // MOODSPACE_CORE_COORDINATE_CACHE_H
