// Basic types for emotional space mapping.

#ifndef MOODSPACE_CORE_BASIC_TYPES_H
#define MOODSPACE_CORE_BASIC_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace moodspace {

/// Number of intrinsic emotional dimensions (valence, energy, complexity, tension).
constexpr size_t kEmotionDims = 4;

/// Number of embedded positional dimensions.
constexpr size_t kPositionDims = 3;

/// Raw 4D emotion vector in dimension order.
using EmotionVector = std::array<double, kEmotionDims>;

/// @brief Point in emotional space.
///
/// The four intrinsic dimensions come from the DNA profile. The positional
/// coordinates (x, y, z) are produced by the embedding engine and are only
/// meaningful relative to other tracks of the same embedding run.
struct EmotionalCoordinate {
  double valence = 0.0;
  double energy = 0.0;
  double complexity = 0.0;
  double tension = 0.0;

  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  /// @brief Intrinsic dimensions as an array.
  EmotionVector emotions() const { return {valence, energy, complexity, tension}; }

  /// @brief Euclidean distance over the four intrinsic dimensions.
  double distanceTo(const EmotionalCoordinate& other) const;

  /// @brief Euclidean distance in embedded 3D space.
  double positionDistanceTo(const EmotionalCoordinate& other) const;
};

/// @brief Build a coordinate from four emotion values (no position).
EmotionalCoordinate makeCoordinate(double valence, double energy, double complexity,
                                   double tension);

/// @brief Linear interpolation of the intrinsic dimensions.
/// @param from Start coordinate (t = 0).
/// @param to End coordinate (t = 1).
/// @param t Interpolation factor.
/// @return Interpolated coordinate with zero position.
EmotionalCoordinate lerpEmotions(const EmotionalCoordinate& from,
                                 const EmotionalCoordinate& to, double t);

/// @brief Name of an emotion dimension by index (0..3).
const char* emotionDimensionName(size_t dim);

/// How a journey step relates to its neighbours.
enum class TransitionType : uint8_t {
  Start,
  End,
  Bridge,
  Smooth
};

/// @brief Convert TransitionType to its lower-case wire name.
const char* transitionTypeToString(TransitionType type);

/// @brief One time-stamped step of a journey.
struct JourneyPoint {
  EmotionalCoordinate coordinate;
  std::string track_id;  ///< Empty when the point is not bound to a track.
  double timestamp = 0.0;  ///< Seconds from journey start.
  TransitionType transition = TransitionType::Smooth;

  bool hasTrack() const { return !track_id.empty(); }
};

/// @brief Group of tracks produced by the cluster analyzer.
struct Cluster {
  std::string id;  ///< "cluster_<index>".
  std::vector<std::string> track_ids;
  EmotionalCoordinate centroid;
  size_t size = 0;
};

}  // namespace moodspace

#endif  // MOODSPACE_CORE_BASIC_TYPES_H
