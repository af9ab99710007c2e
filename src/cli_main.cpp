/// @file
/// @brief CLI entry point for the emotional space mapper.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "core/space_config.h"
#include "dna/profile_loader.h"
#include "emotional_space.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string profiles_path;
  std::string config_path;
  std::string output;
  std::string from;
  std::string to;
  std::string relatives_of;
  double duration = 60.0;
  size_t steps = 0;  ///< 0 = config default.
  size_t k = 5;
  size_t max_edges = 0;  ///< 0 = config default.
  uint32_t seed = 0;
  bool seed_specified = false;
  bool verbose = false;
  bool json = false;
  bool has_nearest = false;
  moodspace::EmotionalCoordinate nearest_target;
  std::vector<moodspace::EmotionalCoordinate> waypoints;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("moodspace_cli - Emotional space mapper and journey planner\n\n");
  std::printf("Usage: moodspace_cli --profiles FILE [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --profiles FILE   DNA profile JSON (object keyed by track id)\n");
  std::printf("  --config FILE     SpaceConfig JSON (flat object)\n");
  std::printf("  --from ID         Journey start track\n");
  std::printf("  --to ID           Journey end track\n");
  std::printf("  --duration SEC    Journey duration in seconds (default 60)\n");
  std::printf("  --steps N         Maximum path length\n");
  std::printf("  --waypoint V,E,C,T  Journey waypoint (repeatable)\n");
  std::printf("  --nearest V,E,C,T   Nearest-track query target\n");
  std::printf("  --k N             Result count for --nearest / --relatives (default 5)\n");
  std::printf("  --relatives ID    Genetically similar tracks\n");
  std::printf("  --seed N          Random seed\n");
  std::printf("  --max-edges N     Connection cap for the export bundle\n");
  std::printf("  --json            Print journey as JSON\n");
  std::printf("  --verbose         Stage diagnostics on stderr\n");
  std::printf("  -o FILE           Write export bundle JSON\n");
  std::printf("  --help            Show this help\n");
}

/// @brief Parse "v,e,c,t" into a coordinate.
/// @return False if fewer than four numbers are present.
bool parseCoordinate(const char* text, moodspace::EmotionalCoordinate& out) {
  double values[4] = {0.0, 0.0, 0.0, 0.0};
  const char* cursor = text;
  for (int idx = 0; idx < 4; ++idx) {
    char* end = nullptr;
    values[idx] = std::strtod(cursor, &end);
    if (end == cursor) return false;
    cursor = end;
    if (idx < 3) {
      if (*cursor != ',') return false;
      ++cursor;
    }
  }
  out = moodspace::makeCoordinate(values[0], values[1], values[2], values[3]);
  return true;
}

/// @brief Parse command-line arguments into CliOptions.
/// @return False if --help was requested or an argument was invalid.
bool parseArgs(int argc, char* argv[], CliOptions& opts, int& exit_code) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      exit_code = 0;
      return false;
    }
    if (std::strcmp(argv[idx], "--profiles") == 0 && idx + 1 < argc) {
      opts.profiles_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(argv[idx], "--from") == 0 && idx + 1 < argc) {
      opts.from = argv[++idx];
    } else if (std::strcmp(argv[idx], "--to") == 0 && idx + 1 < argc) {
      opts.to = argv[++idx];
    } else if (std::strcmp(argv[idx], "--relatives") == 0 && idx + 1 < argc) {
      opts.relatives_of = argv[++idx];
    } else if (std::strcmp(argv[idx], "--duration") == 0 && idx + 1 < argc) {
      opts.duration = std::atof(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--steps") == 0 && idx + 1 < argc) {
      opts.steps = static_cast<size_t>(std::atoi(argv[++idx]));
    } else if (std::strcmp(argv[idx], "--k") == 0 && idx + 1 < argc) {
      opts.k = static_cast<size_t>(std::atoi(argv[++idx]));
    } else if (std::strcmp(argv[idx], "--max-edges") == 0 && idx + 1 < argc) {
      opts.max_edges = static_cast<size_t>(std::atoi(argv[++idx]));
    } else if (std::strcmp(argv[idx], "--seed") == 0 && idx + 1 < argc) {
      opts.seed = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
      opts.seed_specified = true;
    } else if (std::strcmp(argv[idx], "--waypoint") == 0 && idx + 1 < argc) {
      moodspace::EmotionalCoordinate waypoint;
      if (!parseCoordinate(argv[++idx], waypoint)) {
        std::fprintf(stderr, "Error: invalid --waypoint '%s'\n", argv[idx]);
        exit_code = 2;
        return false;
      }
      opts.waypoints.push_back(waypoint);
    } else if (std::strcmp(argv[idx], "--nearest") == 0 && idx + 1 < argc) {
      if (!parseCoordinate(argv[++idx], opts.nearest_target)) {
        std::fprintf(stderr, "Error: invalid --nearest '%s'\n", argv[idx]);
        exit_code = 2;
        return false;
      }
      opts.has_nearest = true;
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json = true;
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else {
      std::fprintf(stderr, "Warning: ignoring unknown argument '%s'\n", argv[idx]);
    }
  }
  if (opts.profiles_path.empty()) {
    printUsage();
    exit_code = 2;
    return false;
  }
  return true;
}

/// @brief Build a SpaceConfig from the config file and CLI overrides.
/// @return False if a config file was given but could not be read.
bool buildSpaceConfig(const CliOptions& opts, moodspace::SpaceConfig& config) {
  if (!opts.config_path.empty()) {
    moodspace::ConfigLoadResult loaded = moodspace::loadSpaceConfig(opts.config_path);
    if (!loaded.success) {
      std::fprintf(stderr, "Error: %s\n", loaded.error_message.c_str());
      return false;
    }
    config = loaded.config;
  }
  if (opts.seed_specified) config.seed = opts.seed;
  if (opts.verbose) config.verbose = true;
  if (opts.steps > 0) config.default_max_steps = opts.steps;
  if (opts.max_edges > 0) config.max_export_edges = opts.max_edges;
  return true;
}

void printJourney(const moodspace::Journey& journey) {
  std::printf("\nJourney (%zu steps, %s path%s):\n", journey.points.size(),
              moodspace::pathKindToString(journey.path_kind),
              journey.used_waypoints ? ", waypoints" : "");
  for (const auto& point : journey.points) {
    const auto& coord = point.coordinate;
    std::printf("  %6.1fs  %-24s %-7s V=%.2f E=%.2f C=%.2f T=%.2f\n", point.timestamp,
                point.track_id.c_str(), moodspace::transitionTypeToString(point.transition),
                coord.valence, coord.energy, coord.complexity, coord.tension);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  int exit_code = 0;
  if (!parseArgs(argc, argv, opts, exit_code)) {
    return exit_code;
  }

  moodspace::SpaceConfig config;
  if (!buildSpaceConfig(opts, config)) {
    return 1;
  }

  moodspace::ProfileLoadResult loaded = moodspace::loadProfilesFromJson(opts.profiles_path);
  if (!loaded.success) {
    std::fprintf(stderr, "Error: %s\n", loaded.error_message.c_str());
    return 1;
  }

  std::printf("moodspace_cli v0.1.0\n");
  std::printf("Profiles:   %zu loaded, %zu skipped\n", loaded.profiles.size(),
              loaded.skipped.size());
  std::printf("Seed:       %u\n", config.seed);

  moodspace::EmotionalSpace space(config);
  moodspace::RebuildResult built = space.rebuild(loaded.profiles);
  if (!built.success) {
    std::fprintf(stderr, "Error: %s\n", built.error_message.c_str());
    return 1;
  }
  std::printf("Embedding:  %s%s\n", built.strategy.c_str(),
              built.fell_back ? " (fallback)" : "");
  std::printf("Graph:      %zu nodes, %zu edges\n\n", built.track_count, built.edge_count);
  std::printf("%s", space.statistics().toTextSummary().c_str());

  if (!opts.from.empty() && !opts.to.empty()) {
    moodspace::JourneyRequest request;
    request.start_track = opts.from;
    request.end_track = opts.to;
    request.waypoints = opts.waypoints;
    request.duration = opts.duration;
    request.max_steps = config.default_max_steps;
    moodspace::Journey journey = space.createJourney(request);
    if (opts.json) {
      std::printf("\n%s\n", journey.toJson().c_str());
    } else {
      printJourney(journey);
    }
  }

  if (opts.has_nearest) {
    std::printf("\nNearest tracks:\n");
    for (const auto& entry : space.nearest(opts.nearest_target, opts.k)) {
      std::printf("  %-24s %.4f\n", entry.first.c_str(), entry.second);
    }
  }

  if (!opts.relatives_of.empty()) {
    std::printf("\nGenetic relatives of %s:\n", opts.relatives_of.c_str());
    for (const auto& entry : space.geneticRelatives(opts.relatives_of, opts.k)) {
      std::printf("  %-24s %.4f\n", entry.first.c_str(), entry.second);
    }
  }

  if (!opts.output.empty()) {
    if (!space.writeExportBundle(opts.output, config.max_export_edges)) {
      std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
      return 1;
    }
    std::printf("\nOutput:     %s\n", opts.output.c_str());
  }
  return 0;
}
