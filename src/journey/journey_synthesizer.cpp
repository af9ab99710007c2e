// Journey synthesis: waypoint routing, timestamps and transition tags.

#include "journey/journey_synthesizer.h"

#include <algorithm>
#include <utility>

#include "core/json_helpers.h"

namespace moodspace {

bool isBridgeTrack(const EmotionalCoordinate& prev, const EmotionalCoordinate& curr,
                   const EmotionalCoordinate& next, double bridge_ratio) {
  return isBridgeTrack(prev.distanceTo(curr) + curr.distanceTo(next), prev.distanceTo(next),
                       bridge_ratio);
}

bool isBridgeTrack(double via, double direct, double bridge_ratio) {
  return via < direct * bridge_ratio;
}

double journeyTimestamp(size_t index, size_t total, double duration) {
  if (total <= 1) return 0.0;
  return static_cast<double>(index) / static_cast<double>(total - 1) * duration;
}

std::vector<std::string> JourneySynthesizer::waypointPath(
    const std::string& start, const std::string& end,
    const std::vector<EmotionalCoordinate>& waypoints) const {
  std::vector<std::string> path = {start};
  for (const auto& waypoint : waypoints) {
    auto nearest = cache_.nearest(waypoint, 1);
    if (nearest.empty()) continue;
    const std::string& candidate = nearest.front().first;
    if (candidate == end) continue;
    if (std::find(path.begin(), path.end(), candidate) != path.end()) continue;
    path.push_back(candidate);
  }
  path.push_back(end);
  return path;
}

std::vector<JourneyPoint> JourneySynthesizer::timestampPath(
    const std::vector<std::string>& path, double duration) const {
  std::vector<std::string> known;
  std::vector<EmotionalCoordinate> coords;
  for (const auto& track_id : path) {
    auto coord = cache_.get(track_id);
    if (!coord) continue;
    known.push_back(track_id);
    coords.push_back(*coord);
  }

  std::vector<JourneyPoint> points;
  points.reserve(known.size());
  const size_t total = known.size();
  for (size_t idx = 0; idx < total; ++idx) {
    JourneyPoint point;
    point.coordinate = coords[idx];
    point.track_id = known[idx];
    point.timestamp = journeyTimestamp(idx, total, duration);
    if (idx == 0) {
      point.transition = TransitionType::Start;
    } else if (idx == total - 1) {
      point.transition = TransitionType::End;
    } else if (isBridgeTrack(coords[idx - 1], coords[idx], coords[idx + 1], bridge_ratio_)) {
      point.transition = TransitionType::Bridge;
    } else {
      point.transition = TransitionType::Smooth;
    }
    points.push_back(std::move(point));
  }
  return points;
}

Journey JourneySynthesizer::create(const JourneyRequest& request) const {
  Journey journey;
  PathResult base = finder_.findPath(request.start_track, request.end_track, request.max_steps);
  journey.path_kind = base.kind;

  std::vector<std::string> path = base.tracks;
  if (!request.waypoints.empty()) {
    path = waypointPath(request.start_track, request.end_track, request.waypoints);
    journey.used_waypoints = true;
  }
  journey.points = timestampPath(path, request.duration);
  return journey;
}

std::string Journey::toJson() const {
  JsonWriter writer;
  writer.beginObject();
  writer.field("path_kind", pathKindToString(path_kind));
  writer.field("used_waypoints", used_waypoints);
  writer.key("points");
  writer.beginArray();
  for (const auto& point : points) {
    writer.beginObject();
    if (point.hasTrack()) {
      writer.field("track_id", point.track_id);
    } else {
      writer.key("track_id");
      writer.valueNull();
    }
    writer.field("timestamp", point.timestamp);
    writer.field("transition_type", transitionTypeToString(point.transition));
    writer.key("coordinate");
    writer.beginObject();
    writer.field("valence", point.coordinate.valence);
    writer.field("energy", point.coordinate.energy);
    writer.field("complexity", point.coordinate.complexity);
    writer.field("tension", point.coordinate.tension);
    writer.field("x", point.coordinate.x);
    writer.field("y", point.coordinate.y);
    writer.field("z", point.coordinate.z);
    writer.endObject();
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
  return writer.toString();
}

}  // namespace moodspace
