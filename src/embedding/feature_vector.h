// Fixed-length feature vectors assembled from DNA profiles.

#ifndef MOODSPACE_EMBEDDING_FEATURE_VECTOR_H
#define MOODSPACE_EMBEDDING_FEATURE_VECTOR_H

#include <cstddef>
#include <vector>

#include "dna/dna_profile.h"

namespace moodspace {

/// Length of every feature vector fed to the embedding engine.
constexpr size_t kFeatureVectorLength = 60;

/// Number of scalar slots preceding the gene groups (4 emotions + tempo).
constexpr size_t kScalarFeatureCount = 5;

/// Tempo is divided by this before entering the vector.
constexpr double kTempoNormalizer = 200.0;

/// @brief Build the feature vector for one profile.
///
/// Layout: valence, energy, complexity, tension, tempo / 200, then every
/// present gene group in GeneGroup order, each truncated to its fixed size.
/// Absent groups contribute nothing; the tail is zero-padded (or truncated)
/// to exactly kFeatureVectorLength entries.
///
/// @param profile Source profile.
/// @return Vector of kFeatureVectorLength values.
std::vector<double> buildFeatureVector(const DnaProfile& profile);

}  // namespace moodspace

#endif  // MOODSPACE_EMBEDDING_FEATURE_VECTOR_H
