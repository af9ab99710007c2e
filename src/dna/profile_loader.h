// Reading DNA profiles from the provider's JSON document.

#ifndef MOODSPACE_DNA_PROFILE_LOADER_H
#define MOODSPACE_DNA_PROFILE_LOADER_H

#include <cstddef>
#include <string>
#include <vector>

#include "dna/dna_profile.h"

namespace moodspace {

/// @brief Outcome of loading a profile document.
struct ProfileLoadResult {
  bool success = false;
  std::vector<DnaProfile> profiles;  ///< In document order.
  std::vector<std::string> skipped;  ///< Track ids rejected for missing emotion values.
  std::string error_message;
};

/// @brief Parse a profile document from memory.
///
/// The document is an object keyed by track id. Each value holds
/// "valence", "energy", "complexity", "tension" (required numbers),
/// "tempo" (number, default 120), optional "key_signature" and "mode"
/// strings, and optional "<group>_genes" number arrays. A "track_id" member
/// inside an entry overrides the key. Entries lacking an emotion value are
/// skipped and listed in ProfileLoadResult::skipped.
///
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
ProfileLoadResult parseProfiles(const char* json, size_t length);

/// @brief Load a profile document from disk.
/// @param path Path to the JSON file (e.g. sonic_dna_profiles.json).
ProfileLoadResult loadProfilesFromJson(const std::string& path);

}  // namespace moodspace

#endif  // MOODSPACE_DNA_PROFILE_LOADER_H
