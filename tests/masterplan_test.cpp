// Tests for masterplan.hpp -- timeline parsing.

#include "clmash/masterplan.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "clmash/error.hpp"

namespace clmash {
namespace {

using nlohmann::json;

TEST(ParseMasterplan, ReadsSectionsLayersAndGlobals) {
  const auto j = json::parse(R"({
    "sections": [
      { "duration_sec": 16.0, "transition": "filter_sweep", "transition_bars": 4,
        "description": "intro", "mood": "ignored",
        "layers": [
          { "track_id": "a", "stem": "drums" },
          { "track_id": "b", "stem": "vocals", "gain_db": -3.5, "start_bar": 8 }
        ] }
    ],
    "global": { "targetBPM": 124, "targetKey": "F#m" }
  })");

  const auto plan = parse_masterplan(j);
  ASSERT_EQ(plan.sections.size(), 1u);
  const auto& s = plan.sections[0];
  EXPECT_DOUBLE_EQ(s.duration_sec, 16.0);
  EXPECT_EQ(s.transition, transition_style::filter_sweep);
  EXPECT_EQ(s.transition_bars, 4);
  EXPECT_EQ(s.description, "intro");
  ASSERT_EQ(s.layers.size(), 2u);
  EXPECT_EQ(s.layers[0].track_id, "a");
  EXPECT_EQ(s.layers[0].stem, stem_role::drums);
  EXPECT_FALSE(s.layers[0].gain_db.has_value());
  EXPECT_FALSE(s.layers[0].start_bar.has_value());
  EXPECT_DOUBLE_EQ(*s.layers[1].gain_db, -3.5);
  EXPECT_EQ(s.layers[1].start_bar, 8);

  EXPECT_DOUBLE_EQ(*plan.target_bpm, 124.0);
  EXPECT_EQ(plan.target_key, key(6, key_mode::minor));
}

TEST(ParseMasterplan, DefaultsWhenOptionalFieldsAbsent) {
  const auto plan = parse_masterplan(json::parse(R"({
    "sections": [ { "duration_sec": 8 } ]
  })"));
  ASSERT_EQ(plan.sections.size(), 1u);
  EXPECT_EQ(plan.sections[0].transition, transition_style::clean_cross);
  EXPECT_FALSE(plan.sections[0].transition_bars.has_value());
  EXPECT_TRUE(plan.sections[0].layers.empty());
  EXPECT_FALSE(plan.target_bpm.has_value());
  EXPECT_FALSE(plan.target_key.has_value());
}

TEST(ParseMasterplan, AcceptsPlannerSpellings) {
  const auto plan = parse_masterplan(json::parse(R"({
    "masterplan": {
      "timeline": [
        { "duration_sec": 30, "transition": "reverse_cymbal",
          "layers": [ { "songId": "s1", "stem": "bass", "volume_db": -6 } ] }
      ],
      "global_settings": { "target_bpm": 100.5, "target_key": "Eb" }
    }
  })"));
  ASSERT_EQ(plan.sections.size(), 1u);
  EXPECT_EQ(plan.sections[0].transition, transition_style::other);
  EXPECT_EQ(plan.sections[0].layers[0].track_id, "s1");
  EXPECT_DOUBLE_EQ(*plan.sections[0].layers[0].gain_db, -6.0);
  EXPECT_DOUBLE_EQ(*plan.target_bpm, 100.5);
  EXPECT_EQ(plan.target_key, key(3, key_mode::major));
}

TEST(ParseMasterplan, RejectsMalformedPlans) {
  EXPECT_THROW((void)parse_masterplan(json::parse("[]")), invalid_input);
  EXPECT_THROW((void)parse_masterplan(json::parse(R"({"global": {}})")), invalid_input);
  EXPECT_THROW((void)parse_masterplan(json::parse(R"({"sections": [ {} ]})")), invalid_input);
  EXPECT_THROW((void)parse_masterplan(json::parse(R"({"sections": [ {"duration_sec": -1} ]})")),
               invalid_input);
  EXPECT_THROW((void)parse_masterplan(json::parse(
                 R"({"sections": [ {"duration_sec": 4, "layers": [ {"stem": "drums"} ]} ]})")),
               invalid_input);
  EXPECT_THROW((void)parse_masterplan(json::parse(
                 R"({"sections": [ {"duration_sec": 4, "layers": [ {"track_id": "a", "stem": "piano"} ]} ]})")),
               invalid_input);
  EXPECT_THROW((void)parse_masterplan(json::parse(
                 R"({"sections": [ {"duration_sec": 4, "layers": [ {"track_id": "a", "stem": "bass", "gain_db": "loud"} ]} ]})")),
               invalid_input);
  EXPECT_THROW((void)parse_masterplan(json::parse(
                 R"({"sections": [], "global": {"targetKey": "Q"}})")),
               invalid_input);
}

TEST(ReferencedStems, DistinctPairsAcrossSections) {
  masterplan plan;
  plan.sections.resize(2);
  plan.sections[0].layers = { { .track_id = "a", .stem = stem_role::drums },
                              { .track_id = "b", .stem = stem_role::vocals } };
  plan.sections[1].layers = { { .track_id = "a", .stem = stem_role::drums },
                              { .track_id = "a", .stem = stem_role::bass } };

  const auto refs = referenced_stems(plan);
  EXPECT_EQ(refs.size(), 3u);
  EXPECT_TRUE(refs.contains({ "a", stem_role::drums }));
  EXPECT_TRUE(refs.contains({ "a", stem_role::bass }));
  EXPECT_TRUE(refs.contains({ "b", stem_role::vocals }));
}

}  // namespace
}  // namespace clmash
