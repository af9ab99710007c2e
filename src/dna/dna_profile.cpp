// Gene group accessors, key/mode decoding and genetic similarity.

#include "dna/dna_profile.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace moodspace {

const char* geneGroupKey(GeneGroup group) {
  switch (group) {
    case GeneGroup::Harmonic: return "harmonic_genes";
    case GeneGroup::Timbral:  return "timbral_genes";
    case GeneGroup::Textural: return "textural_genes";
    case GeneGroup::Dynamic:  return "dynamic_genes";
    case GeneGroup::Rhythmic: return "rhythmic_genes";
  }
  return "unknown_genes";
}

const std::optional<std::vector<double>>& DnaProfile::genes(GeneGroup group) const {
  switch (group) {
    case GeneGroup::Harmonic: return harmonic_genes;
    case GeneGroup::Timbral:  return timbral_genes;
    case GeneGroup::Textural: return textural_genes;
    case GeneGroup::Dynamic:  return dynamic_genes;
    case GeneGroup::Rhythmic: return rhythmic_genes;
  }
  return harmonic_genes;
}

std::optional<std::vector<double>>& DnaProfile::genes(GeneGroup group) {
  switch (group) {
    case GeneGroup::Harmonic: return harmonic_genes;
    case GeneGroup::Timbral:  return timbral_genes;
    case GeneGroup::Textural: return textural_genes;
    case GeneGroup::Dynamic:  return dynamic_genes;
    case GeneGroup::Rhythmic: return rhythmic_genes;
  }
  return harmonic_genes;
}

EmotionalCoordinate DnaProfile::emotionalCoordinate() const {
  return makeCoordinate(valence, energy, complexity, tension);
}

namespace {

/// @brief Value of an all-digit label, -1 if the label is not a small decimal.
int decimalLabel(const std::string& label) {
  if (label.empty() || label.size() > 3) return -1;
  int val = 0;
  for (char chr : label) {
    if (!std::isdigit(static_cast<unsigned char>(chr))) return -1;
    val = val * 10 + (chr - '0');
  }
  return val;
}

}  // namespace

int keyPitchClass(const std::optional<std::string>& key_signature) {
  if (!key_signature || key_signature->empty()) return 0;
  const std::string& name = *key_signature;
  int number = decimalLabel(name);
  if (number >= 0) return number < 12 ? number : 0;

  int pitch = 0;
  switch (name[0]) {
    case 'C': pitch = 0; break;
    case 'D': pitch = 2; break;
    case 'E': pitch = 4; break;
    case 'F': pitch = 5; break;
    case 'G': pitch = 7; break;
    case 'A': pitch = 9; break;
    case 'B': pitch = 11; break;
    default: return 0;
  }
  if (name.size() == 1) return pitch;
  if (name.size() != 2) return 0;
  if (name[1] == '#') return (pitch + 1) % 12;
  if (name[1] == 'b') return (pitch + 11) % 12;
  return 0;
}

int modeValue(const std::optional<std::string>& mode) {
  if (!mode) return 0;
  if (decimalLabel(*mode) == 1) return 1;
  std::string lower = *mode;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  return lower == "major" ? 1 : 0;
}

namespace {

/// @brief Cosine similarity over the shared prefix; 0 for zero-norm input.
double cosineSimilarity(const std::vector<double>& lhs, const std::vector<double>& rhs) {
  size_t len = std::min(lhs.size(), rhs.size());
  double dot = 0.0;
  double norm_l = 0.0;
  double norm_r = 0.0;
  for (size_t idx = 0; idx < len; ++idx) {
    dot += lhs[idx] * rhs[idx];
    norm_l += lhs[idx] * lhs[idx];
    norm_r += rhs[idx] * rhs[idx];
  }
  if (norm_l <= 0.0 || norm_r <= 0.0) return 0.0;
  return dot / (std::sqrt(norm_l) * std::sqrt(norm_r));
}

double groupWeight(GeneGroup group) {
  switch (group) {
    case GeneGroup::Harmonic: return 0.35;
    case GeneGroup::Rhythmic: return 0.25;
    case GeneGroup::Timbral:  return 0.20;
    case GeneGroup::Textural: return 0.10;
    case GeneGroup::Dynamic:  return 0.10;
  }
  return 0.0;
}

}  // namespace

double geneticSimilarity(const DnaProfile& lhs, const DnaProfile& rhs) {
  double total = 0.0;
  for (GeneGroup group : kGeneGroupOrder) {
    const auto& genes_l = lhs.genes(group);
    const auto& genes_r = rhs.genes(group);
    if (!genes_l || !genes_r) continue;
    total += groupWeight(group) * cosineSimilarity(*genes_l, *genes_r);
  }
  return std::max(0.0, total);
}

std::vector<std::pair<std::string, double>> findGeneticRelatives(
    const DnaProfile& target, const std::vector<DnaProfile>& profiles, size_t top_k) {
  std::vector<std::pair<std::string, double>> scored;
  scored.reserve(profiles.size());
  for (const auto& profile : profiles) {
    if (profile.track_id == target.track_id) continue;
    scored.emplace_back(profile.track_id, geneticSimilarity(target, profile));
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
  if (scored.size() > top_k) scored.resize(top_k);
  return scored;
}

}  // namespace moodspace
