// Per-track DNA profile supplied by the external audio analysis provider.

#ifndef MOODSPACE_DNA_DNA_PROFILE_H
#define MOODSPACE_DNA_DNA_PROFILE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/basic_types.h"

namespace moodspace {

/// Gene groups in feature-vector order.
enum class GeneGroup : uint8_t {
  Harmonic,  ///< 12-bin chroma profile.
  Timbral,   ///< 13 MFCC means.
  Textural,  ///< 7 spectral-contrast bands.
  Dynamic,   ///< 10-step energy envelope.
  Rhythmic   ///< 8-step onset pattern.
};

constexpr size_t kGeneGroupCount = 5;

/// Gene groups in the order they are appended to a feature vector.
constexpr std::array<GeneGroup, kGeneGroupCount> kGeneGroupOrder = {
    GeneGroup::Harmonic, GeneGroup::Timbral, GeneGroup::Textural, GeneGroup::Dynamic,
    GeneGroup::Rhythmic};

/// @brief Fixed length of a gene group inside a feature vector.
constexpr size_t geneGroupSize(GeneGroup group) {
  switch (group) {
    case GeneGroup::Harmonic: return 12;
    case GeneGroup::Timbral:  return 13;
    case GeneGroup::Textural: return 7;
    case GeneGroup::Dynamic:  return 10;
    case GeneGroup::Rhythmic: return 8;
  }
  return 0;
}

/// @brief JSON member name of a gene group ("harmonic_genes", ...).
const char* geneGroupKey(GeneGroup group);

/// @brief Audio DNA of one track.
///
/// Gene groups are optional: a provider that failed to extract one simply
/// leaves it unset. Groups may be longer than geneGroupSize(); consumers
/// truncate.
struct DnaProfile {
  std::string track_id;
  double valence = 0.0;
  double energy = 0.0;
  double complexity = 0.0;
  double tension = 0.0;
  double tempo = 120.0;  ///< BPM.

  std::optional<std::string> key_signature;  ///< e.g. "C#", "Bb", or a pitch class "5".
  std::optional<std::string> mode;           ///< e.g. "major", "minor", or "1" / "0".

  std::optional<std::vector<double>> harmonic_genes;
  std::optional<std::vector<double>> timbral_genes;
  std::optional<std::vector<double>> textural_genes;
  std::optional<std::vector<double>> dynamic_genes;
  std::optional<std::vector<double>> rhythmic_genes;

  /// @brief Access a gene group by enum.
  const std::optional<std::vector<double>>& genes(GeneGroup group) const;
  std::optional<std::vector<double>>& genes(GeneGroup group);

  /// @brief Intrinsic emotional coordinate (no embedded position).
  EmotionalCoordinate emotionalCoordinate() const;
};

/// @brief Pitch class (0-11) of a key name, 0 (C) when unknown or absent.
///
/// A decimal label in 0..11 (a key given numerically) is its own pitch class.
int keyPitchClass(const std::optional<std::string>& key_signature);

/// @brief 1 for major or "1", 0 for minor, "0" or unknown.
int modeValue(const std::optional<std::string>& mode);

/// @brief Weighted cosine similarity across gene groups.
///
/// Weights: harmonic 0.35, rhythmic 0.25, timbral 0.20, textural 0.10,
/// dynamic 0.10. A group missing (or zero-norm) on either side contributes 0.
///
/// @return Similarity clamped to >= 0.
double geneticSimilarity(const DnaProfile& lhs, const DnaProfile& rhs);

/// @brief Find the k profiles most genetically similar to a target.
/// @param target Profile to compare against (excluded from results by track id).
/// @param profiles Candidate profiles.
/// @param top_k Maximum number of results.
/// @return (track_id, similarity) by descending similarity, ties in input order.
std::vector<std::pair<std::string, double>> findGeneticRelatives(
    const DnaProfile& target, const std::vector<DnaProfile>& profiles, size_t top_k);

}  // namespace moodspace

#endif  // MOODSPACE_DNA_DNA_PROFILE_H
