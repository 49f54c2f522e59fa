// Tests for job.hpp -- render job configuration.

#include "clmash/job.hpp"

#include <gtest/gtest.h>

#include <filesystem>

#include <nlohmann/json.hpp>

#include "clmash/error.hpp"

namespace clmash {
namespace {

using nlohmann::json;
using std::filesystem::path;

json minimal_job() {
  return json::parse(R"({
    "version": 1,
    "tracks": [
      { "id": "a", "key": "Am", "bpm": 122.0, "beats_sec": [0.0, 0.49, 0.98],
        "stems": { "vocals": "a/vocals.wav", "drums": "/abs/a_drums.flac" } },
      { "id": "b", "key": "C", "bpm": 128.0, "beats_sec": [0.1, 0.57] }
    ]
  })");
}

TEST(ParseJob, ReadsTracksWithDefaults) {
  const auto j = parse_job(minimal_job(), path("/jobs/42"));

  EXPECT_EQ(j.sample_rate, 44100u);
  EXPECT_EQ(j.channels, 2u);
  EXPECT_EQ(j.limits.vocal, 3);
  EXPECT_EQ(j.limits.music, 6);
  EXPECT_FALSE(j.plan.has_value());

  ASSERT_EQ(j.tracks.size(), 2u);
  const auto& a = j.tracks[0];
  EXPECT_EQ(a.analysis.id, "a");
  EXPECT_EQ(a.analysis.track_key, key(9, key_mode::minor));
  EXPECT_DOUBLE_EQ(a.analysis.bpm, 122.0);
  EXPECT_EQ(a.analysis.beats_sec.size(), 3u);
  EXPECT_EQ(a.stems.at(stem_role::vocals), path("/jobs/42/a/vocals.wav"));
  EXPECT_EQ(a.stems.at(stem_role::drums), path("/abs/a_drums.flac"));
  EXPECT_TRUE(j.tracks[1].stems.empty());

  const auto tracks = analyses(j);
  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_EQ(tracks[1].id, "b");
}

TEST(ParseJob, OverridesAndInlinePlan) {
  auto doc = minimal_job();
  doc["sample_rate"] = 48000;
  doc["channels"] = 1;
  doc["vocal_shift_limit"] = 2;
  doc["music_shift_limit"] = 4;
  doc["masterplan"] = json::parse(R"({ "sections": [ { "duration_sec": 10 } ] })");

  const auto j = parse_job(doc, path("."));
  EXPECT_EQ(j.sample_rate, 48000u);
  EXPECT_EQ(j.channels, 1u);
  EXPECT_EQ(j.limits.vocal, 2);
  EXPECT_EQ(j.limits.music, 4);
  ASSERT_TRUE(j.plan.has_value());
  EXPECT_EQ(j.plan->sections.size(), 1u);
}

TEST(ParseJob, RejectsInvalidJobs) {
  auto bad_version = minimal_job();
  bad_version["version"] = 2;
  EXPECT_THROW((void)parse_job(bad_version, path(".")), invalid_input);

  auto dup = minimal_job();
  dup["tracks"][1]["id"] = "a";
  EXPECT_THROW((void)parse_job(dup, path(".")), invalid_input);

  auto bad_key = minimal_job();
  bad_key["tracks"][0]["key"] = "X#";
  EXPECT_THROW((void)parse_job(bad_key, path(".")), invalid_input);

  auto bad_bpm = minimal_job();
  bad_bpm["tracks"][0]["bpm"] = 0;
  EXPECT_THROW((void)parse_job(bad_bpm, path(".")), invalid_input);

  auto bad_stem = minimal_job();
  bad_stem["tracks"][0]["stems"]["piano"] = "p.wav";
  EXPECT_THROW((void)parse_job(bad_stem, path(".")), invalid_input);

  auto no_beats = minimal_job();
  no_beats["tracks"][0].erase("beats_sec");
  EXPECT_THROW((void)parse_job(no_beats, path(".")), invalid_input);

  auto negative_limit = minimal_job();
  negative_limit["vocal_shift_limit"] = -1;
  EXPECT_THROW((void)parse_job(negative_limit, path(".")), invalid_input);
}

}  // namespace
}  // namespace clmash
