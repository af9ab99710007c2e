// Tests for dna/profile_loader.h -- provider JSON document parsing.

#include "dna/profile_loader.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

namespace moodspace {
namespace {

ProfileLoadResult parse(const std::string& text) {
  return parseProfiles(text.data(), text.size());
}

TEST(ProfileLoaderTest, FullProfile) {
  auto result = parse(R"({
    "song_a": {
      "valence": 0.8, "energy": 0.6, "complexity": 0.4, "tension": 0.2,
      "tempo": 128, "key_signature": "F#", "mode": "minor",
      "harmonic_genes": [0.1, 0.2, 0.3],
      "rhythmic_genes": [1, 0, 1, 0, 1, 0, 1, 0]
    }
  })");
  ASSERT_TRUE(result.success) << result.error_message;
  ASSERT_EQ(result.profiles.size(), 1u);
  const DnaProfile& profile = result.profiles[0];
  EXPECT_EQ(profile.track_id, "song_a");
  EXPECT_DOUBLE_EQ(profile.valence, 0.8);
  EXPECT_DOUBLE_EQ(profile.tension, 0.2);
  EXPECT_DOUBLE_EQ(profile.tempo, 128.0);
  EXPECT_EQ(profile.key_signature.value_or(""), "F#");
  EXPECT_EQ(profile.mode.value_or(""), "minor");
  ASSERT_TRUE(profile.harmonic_genes.has_value());
  EXPECT_EQ(profile.harmonic_genes->size(), 3u);
  EXPECT_EQ(profile.rhythmic_genes->size(), 8u);
  EXPECT_FALSE(profile.timbral_genes.has_value());
}

TEST(ProfileLoaderTest, DefaultsForOptionalFields) {
  auto result = parse(R"({"t": {"valence": 0, "energy": 0, "complexity": 0, "tension": 0}})");
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.profiles.size(), 1u);
  EXPECT_DOUBLE_EQ(result.profiles[0].tempo, 120.0);
  EXPECT_FALSE(result.profiles[0].key_signature.has_value());
  EXPECT_FALSE(result.profiles[0].mode.has_value());
}

TEST(ProfileLoaderTest, NonPositiveTempoKeepsDefault) {
  auto result = parse(
      R"({"t": {"valence": 0, "energy": 0, "complexity": 0, "tension": 0, "tempo": 0}})");
  ASSERT_EQ(result.profiles.size(), 1u);
  EXPECT_DOUBLE_EQ(result.profiles[0].tempo, 120.0);
}

TEST(ProfileLoaderTest, TrackIdOverride) {
  auto result = parse(R"({"row_1": {"track_id": "real_id", "valence": 0.1, "energy": 0.2,
                                   "complexity": 0.3, "tension": 0.4}})");
  ASSERT_EQ(result.profiles.size(), 1u);
  EXPECT_EQ(result.profiles[0].track_id, "real_id");
}

TEST(ProfileLoaderTest, MissingEmotionSkipped) {
  auto result = parse(R"({
    "ok": {"valence": 0.1, "energy": 0.2, "complexity": 0.3, "tension": 0.4},
    "partial": {"valence": 0.1, "energy": 0.2},
    "scalar": 5
  })");
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.profiles.size(), 1u);
  EXPECT_EQ(result.profiles[0].track_id, "ok");
  ASSERT_EQ(result.skipped.size(), 2u);
  EXPECT_EQ(result.skipped[0], "partial");
  EXPECT_EQ(result.skipped[1], "scalar");
}

TEST(ProfileLoaderTest, DocumentOrderPreserved) {
  auto result = parse(R"({
    "z": {"valence": 0, "energy": 0, "complexity": 0, "tension": 0},
    "a": {"valence": 1, "energy": 1, "complexity": 1, "tension": 1}
  })");
  ASSERT_EQ(result.profiles.size(), 2u);
  EXPECT_EQ(result.profiles[0].track_id, "z");
  EXPECT_EQ(result.profiles[1].track_id, "a");
}

TEST(ProfileLoaderTest, NumericKeyAndModeDecode) {
  auto result = parse(R"({"t": {"valence": 0, "energy": 0, "complexity": 0, "tension": 0,
                               "key_signature": 5, "mode": 1}})");
  ASSERT_EQ(result.profiles.size(), 1u);
  const DnaProfile& profile = result.profiles[0];
  EXPECT_EQ(profile.key_signature.value_or(""), "5");
  EXPECT_EQ(keyPitchClass(profile.key_signature), 5);
  EXPECT_EQ(modeValue(profile.mode), 1);
}

TEST(ProfileLoaderTest, MalformedDocument) {
  auto result = parse(R"({"t": {"valence": )");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error_message.find("malformed"), std::string::npos);
}

TEST(ProfileLoaderTest, ArrayRootRejected) {
  auto result = parse("[]");
  EXPECT_FALSE(result.success);
}

TEST(ProfileLoaderTest, LoadMissingFile) {
  auto result = loadProfilesFromJson("/nonexistent/profiles.json");
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error_message.empty());
}

TEST(ProfileLoaderTest, LoadFromFile) {
  std::string path = ::testing::TempDir() + "moodspace_profiles_test.json";
  {
    std::ofstream out(path);
    out << R"({"a": {"valence": 0.5, "energy": 0.5, "complexity": 0.5, "tension": 0.5}})";
  }
  auto result = loadProfilesFromJson(path);
  std::remove(path.c_str());
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.profiles.size(), 1u);
}

}  // namespace
}  // namespace moodspace
