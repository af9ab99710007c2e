// Implementation of coordinate helpers and enum-to-string conversions.

#include "core/basic_types.h"

#include <cmath>

namespace moodspace {

double EmotionalCoordinate::distanceTo(const EmotionalCoordinate& other) const {
  double dv = valence - other.valence;
  double de = energy - other.energy;
  double dc = complexity - other.complexity;
  double dt = tension - other.tension;
  return std::sqrt(dv * dv + de * de + dc * dc + dt * dt);
}

double EmotionalCoordinate::positionDistanceTo(const EmotionalCoordinate& other) const {
  double dx = x - other.x;
  double dy = y - other.y;
  double dz = z - other.z;
  return std::sqrt(dx * dx + dy * dy + dz * dz);
}

EmotionalCoordinate makeCoordinate(double valence, double energy, double complexity,
                                   double tension) {
  EmotionalCoordinate coord;
  coord.valence = valence;
  coord.energy = energy;
  coord.complexity = complexity;
  coord.tension = tension;
  return coord;
}

EmotionalCoordinate lerpEmotions(const EmotionalCoordinate& from,
                                 const EmotionalCoordinate& to, double t) {
  return makeCoordinate(from.valence + t * (to.valence - from.valence),
                        from.energy + t * (to.energy - from.energy),
                        from.complexity + t * (to.complexity - from.complexity),
                        from.tension + t * (to.tension - from.tension));
}

const char* emotionDimensionName(size_t dim) {
  switch (dim) {
    case 0: return "valence";
    case 1: return "energy";
    case 2: return "complexity";
    case 3: return "tension";
    default: break;
  }
  return "unknown";
}

const char* transitionTypeToString(TransitionType type) {
  switch (type) {
    case TransitionType::Start:  return "start";
    case TransitionType::End:    return "end";
    case TransitionType::Bridge: return "bridge";
    case TransitionType::Smooth: return "smooth";
  }
  return "unknown";
}

}  // namespace moodspace
