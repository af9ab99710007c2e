// Feature vector assembly.

#include "embedding/feature_vector.h"

#include <algorithm>
#include <cstddef>

namespace moodspace {

std::vector<double> buildFeatureVector(const DnaProfile& profile) {
  std::vector<double> features;
  features.reserve(kFeatureVectorLength + geneGroupSize(GeneGroup::Timbral));
  features.push_back(profile.valence);
  features.push_back(profile.energy);
  features.push_back(profile.complexity);
  features.push_back(profile.tension);
  features.push_back(profile.tempo / kTempoNormalizer);

  for (GeneGroup group : kGeneGroupOrder) {
    const auto& genes = profile.genes(group);
    if (!genes || genes->empty()) continue;
    size_t take = std::min(genes->size(), geneGroupSize(group));
    features.insert(features.end(), genes->begin(),
                    genes->begin() + static_cast<std::ptrdiff_t>(take));
  }

  features.resize(kFeatureVectorLength, 0.0);
  return features;
}

}  // namespace moodspace
