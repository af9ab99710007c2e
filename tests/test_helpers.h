#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "dna/dna_profile.h"

namespace test_helpers {

/// @brief Build a profile with emotion values only (no genes).
inline moodspace::DnaProfile makeProfile(const std::string& track_id, double valence,
                                         double energy, double complexity, double tension) {
  moodspace::DnaProfile profile;
  profile.track_id = track_id;
  profile.valence = valence;
  profile.energy = energy;
  profile.complexity = complexity;
  profile.tension = tension;
  return profile;
}

/// @brief Build a profile whose every gene group is filled from a smooth
///        function of `phase`, so nearby phases yield similar genes.
inline moodspace::DnaProfile makeGeneticProfile(const std::string& track_id, double phase) {
  moodspace::DnaProfile profile =
      makeProfile(track_id, 0.5 + 0.4 * phase, 0.5 - 0.3 * phase, 0.4 + 0.2 * phase,
                  0.3 + 0.1 * phase);
  profile.tempo = 90.0 + 40.0 * phase;
  for (moodspace::GeneGroup group : moodspace::kGeneGroupOrder) {
    std::vector<double> genes(moodspace::geneGroupSize(group));
    for (size_t idx = 0; idx < genes.size(); ++idx) {
      genes[idx] = 1.0 + static_cast<double>(idx % 3) * phase +
                   0.1 * static_cast<double>(idx);
    }
    profile.genes(group) = genes;
  }
  return profile;
}

/// @brief N profiles spread along a line in emotion space, spaced `step` apart
///        on the valence axis. Ids are "t0".."t<N-1>".
inline std::vector<moodspace::DnaProfile> makeChain(size_t count, double step) {
  std::vector<moodspace::DnaProfile> profiles;
  for (size_t idx = 0; idx < count; ++idx) {
    double offset = step * static_cast<double>(idx);
    profiles.push_back(makeProfile("t" + std::to_string(idx), 0.1 + offset, 0.5, 0.5, 0.5));
  }
  return profiles;
}

}  // namespace test_helpers
