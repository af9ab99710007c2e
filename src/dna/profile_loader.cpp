// Implementation of DNA profile document parsing.

#include "dna/profile_loader.h"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "core/json_parser.h"

namespace moodspace {

namespace {

/// @brief Read a required number member.
bool readNumber(const JsonValue& entry, const char* name, double& out) {
  const JsonValue* member = entry.find(name);
  if (!member || !member->isNumber()) return false;
  out = member->number_val;
  return true;
}

/// @brief Read an optional string member; numbers become decimal labels ("5", "1").
std::optional<std::string> readLabel(const JsonValue& entry, const char* name) {
  const JsonValue* member = entry.find(name);
  if (!member) return std::nullopt;
  if (member->isString()) return member->string_val;
  if (member->isNumber()) return std::to_string(member->asInt());
  return std::nullopt;
}

/// @brief Read an optional number array; non-numeric elements are skipped.
std::optional<std::vector<double>> readGenes(const JsonValue& entry, const char* name) {
  const JsonValue* member = entry.find(name);
  if (!member || !member->isArray() || member->array_val.empty()) return std::nullopt;
  std::vector<double> genes;
  genes.reserve(member->array_val.size());
  for (const auto& element : member->array_val) {
    if (element.isNumber()) genes.push_back(element.number_val);
  }
  if (genes.empty()) return std::nullopt;
  return genes;
}

}  // namespace

ProfileLoadResult parseProfiles(const char* json, size_t length) {
  ProfileLoadResult result;
  JsonParseResult parsed = parseJson(json, length);
  if (!parsed.success) {
    result.error_message = "malformed profile document at byte " +
                           std::to_string(parsed.error_offset) + ": " +
                           parsed.error_message;
    return result;
  }
  if (!parsed.root.isObject()) {
    result.error_message = "profile document must be an object keyed by track id";
    return result;
  }

  for (const auto& member : parsed.root.object_val) {
    const JsonValue& entry = member.second;
    if (!entry.isObject()) {
      result.skipped.push_back(member.first);
      continue;
    }

    DnaProfile profile;
    const JsonValue* id_override = entry.find("track_id");
    profile.track_id =
        (id_override && id_override->isString()) ? id_override->string_val : member.first;
    bool complete = readNumber(entry, "valence", profile.valence) &&
                    readNumber(entry, "energy", profile.energy) &&
                    readNumber(entry, "complexity", profile.complexity) &&
                    readNumber(entry, "tension", profile.tension);
    if (!complete || profile.track_id.empty()) {
      std::fprintf(stderr, "[ProfileLoader] WARNING: skipping '%s' (missing emotion values)\n",
                   member.first.c_str());
      result.skipped.push_back(member.first);
      continue;
    }
    double tempo = 0.0;
    if (readNumber(entry, "tempo", tempo) && tempo > 0.0) profile.tempo = tempo;
    profile.key_signature = readLabel(entry, "key_signature");
    profile.mode = readLabel(entry, "mode");
    for (GeneGroup group : kGeneGroupOrder) {
      profile.genes(group) = readGenes(entry, geneGroupKey(group));
    }
    result.profiles.push_back(std::move(profile));
  }

  result.success = true;
  return result;
}

ProfileLoadResult loadProfilesFromJson(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    ProfileLoadResult result;
    result.error_message = "cannot open profile file: " + path;
    return result;
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  std::string text = oss.str();
  return parseProfiles(text.data(), text.size());
}

}  // namespace moodspace
