// Dijkstra routing, downsampling and interpolated fallback paths.

#include "graph/path_finder.h"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <utility>

namespace moodspace {

const char* pathKindToString(PathKind kind) {
  switch (kind) {
    case PathKind::GraphPath:    return "graph";
    case PathKind::Interpolated: return "interpolated";
    case PathKind::Direct:       return "direct";
  }
  return "unknown";
}

std::vector<std::string> downsamplePath(const std::vector<std::string>& path,
                                        size_t max_steps) {
  size_t steps = std::max<size_t>(max_steps, 2);
  if (path.size() <= steps) return path;
  std::vector<std::string> result;
  result.reserve(steps);
  size_t last = path.size() - 1;
  for (size_t idx = 0; idx < steps; ++idx) {
    result.push_back(path[idx * last / (steps - 1)]);
  }
  return result;
}

std::optional<std::vector<size_t>> PathFinder::shortestRoute(size_t from, size_t to) const {
  const size_t count = graph_.nodeCount();
  if (from >= count || to >= count) return std::nullopt;

  constexpr double kUnreached = std::numeric_limits<double>::infinity();
  std::vector<double> cost(count, kUnreached);
  std::vector<size_t> previous(count, count);
  using QueueEntry = std::pair<double, size_t>;
  std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> frontier;

  cost[from] = 0.0;
  frontier.emplace(0.0, from);
  while (!frontier.empty()) {
    auto [current_cost, node] = frontier.top();
    frontier.pop();
    if (current_cost > cost[node]) continue;
    if (node == to) break;
    for (const auto& neighbor : graph_.neighbors(node)) {
      double step = 1.0 / graph_.edges()[neighbor.edge].weight;
      double candidate = current_cost + step;
      if (candidate < cost[neighbor.node]) {
        cost[neighbor.node] = candidate;
        previous[neighbor.node] = node;
        frontier.emplace(candidate, neighbor.node);
      }
    }
  }

  if (cost[to] == kUnreached) return std::nullopt;
  std::vector<size_t> route;
  for (size_t node = to; node != count; node = previous[node]) {
    route.push_back(node);
    if (node == from) break;
  }
  std::reverse(route.begin(), route.end());
  return route;
}

PathResult PathFinder::findPath(const std::string& start, const std::string& end,
                                size_t max_steps) const {
  PathResult result;
  if (!graph_.contains(start) || !graph_.contains(end)) {
    result.kind = PathKind::Direct;
    result.tracks = {start, end};
    return result;
  }

  auto route = shortestRoute(graph_.indexOf(start), graph_.indexOf(end));
  if (!route) {
    result.kind = PathKind::Interpolated;
    result.tracks = interpolatedPath(start, end, max_steps);
    return result;
  }

  std::vector<std::string> path;
  path.reserve(route->size());
  for (size_t node : *route) path.push_back(graph_.idAt(node));
  result.kind = PathKind::GraphPath;
  result.tracks = downsamplePath(path, max_steps);
  return result;
}

std::vector<std::string> PathFinder::interpolatedPath(const std::string& start,
                                                      const std::string& end,
                                                      size_t max_steps) const {
  auto start_coord = cache_.get(start);
  auto end_coord = cache_.get(end);
  if (!start_coord || !end_coord) return {start, end};

  size_t steps = std::max<size_t>(max_steps, 2);
  std::vector<std::string> path = {start};
  for (size_t step = 1; step + 1 < steps; ++step) {
    double t = static_cast<double>(step) / static_cast<double>(steps - 1);
    EmotionalCoordinate probe = lerpEmotions(*start_coord, *end_coord, t);
    auto nearest = cache_.nearest(probe, 1);
    if (nearest.empty()) continue;
    const std::string& candidate = nearest.front().first;
    if (candidate == end) continue;
    if (std::find(path.begin(), path.end(), candidate) != path.end()) continue;
    path.push_back(candidate);
  }
  path.push_back(end);
  return path;
}

}  // namespace moodspace
