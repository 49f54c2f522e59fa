// Tests for key.hpp -- semitone distance, target key choice and shift planning.

#include "clmash/key.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <string>
#include <vector>

#include "clmash/error.hpp"

namespace clmash {
namespace {

key k(const char* text) { return *parse_key(text); }

std::vector<key> every_key() {
  std::vector<key> out;
  for (int pc = 0; pc < 12; ++pc) {
    out.emplace_back(pc, key_mode::major);
    out.emplace_back(pc, key_mode::minor);
  }
  return out;
}

// ---------------------------------------------------------------------------
// parse_key / to_string / camelot
// ---------------------------------------------------------------------------

TEST(ParseKey, AcceptsCommonSpellings) {
  EXPECT_EQ(k("C"), key(0, key_mode::major));
  EXPECT_EQ(k("C#"), key(1, key_mode::major));
  EXPECT_EQ(k("Db"), key(1, key_mode::major));
  EXPECT_EQ(k("Am"), key(9, key_mode::minor));
  EXPECT_EQ(k("F#m"), key(6, key_mode::minor));
  EXPECT_EQ(k("A minor"), key(9, key_mode::minor));
  EXPECT_EQ(k("Eb major"), key(3, key_mode::major));
  EXPECT_EQ(k("Cb"), key(11, key_mode::major));
}

TEST(ParseKey, RejectsGarbage) {
  EXPECT_FALSE(parse_key("").has_value());
  EXPECT_FALSE(parse_key("H").has_value());
  EXPECT_FALSE(parse_key("C dorian").has_value());
}

TEST(KeyFormat, SharpSpellingWithMinorSuffix) {
  EXPECT_EQ(to_string(k("Db")), "C#");
  EXPECT_EQ(to_string(k("Bbm")), "A#m");
  EXPECT_EQ(to_string(k("G")), "G");
}

TEST(KeyFormat, CamelotCodes) {
  EXPECT_EQ(camelot(k("C")), "8B");
  EXPECT_EQ(camelot(k("Am")), "8A");
  EXPECT_EQ(camelot(k("G")), "9B");
  EXPECT_EQ(camelot(k("F#m")), "11A");
  EXPECT_EQ(camelot(k("B")), "1B");
  EXPECT_EQ(camelot(k("Abm")), "1A");
}

// ---------------------------------------------------------------------------
// semitone_distance
// ---------------------------------------------------------------------------

TEST(SemitoneDistance, ZeroOnIdentity) {
  for (key a : every_key()) EXPECT_EQ(semitone_distance(a, a), 0);
}

TEST(SemitoneDistance, AntisymmetricAwayFromTritone) {
  for (key a : every_key()) {
    for (key b : every_key()) {
      const int d = semitone_distance(a, b);
      EXPECT_LE(std::abs(d), 6);
      if (std::abs(d) != 6) EXPECT_EQ(d, -semitone_distance(b, a));
    }
  }
}

TEST(SemitoneDistance, TritoneResolvesUpward) {
  EXPECT_EQ(semitone_distance(k("C"), k("F#")), 6);
  EXPECT_EQ(semitone_distance(k("F#"), k("C")), 6);
}

TEST(SemitoneDistance, IgnoresMode) {
  EXPECT_EQ(semitone_distance(k("Dm"), k("C")), -2);
  EXPECT_EQ(semitone_distance(k("D"), k("C")), -2);
  EXPECT_EQ(semitone_distance(k("A"), k("C")), 3);
}

// ---------------------------------------------------------------------------
// choose_target_key
// ---------------------------------------------------------------------------

TEST(ChooseTargetKey, RelativeMajorMinorTieGoesToFirstSeen) {
  const std::vector<key> keys{ k("C"), k("Am") };
  EXPECT_EQ(choose_target_key(keys), k("C"));

  const std::vector<key> reversed{ k("Am"), k("C") };
  EXPECT_EQ(choose_target_key(reversed), k("Am"));
}

TEST(ChooseTargetKey, IdempotentOnSingleKey) {
  for (key a : every_key()) {
    const std::vector<key> one{ a };
    EXPECT_EQ(choose_target_key(one), a);
  }
}

TEST(ChooseTargetKey, ResultIsOneOfTheInputs) {
  const std::vector<key> keys{ k("E"), k("F#m"), k("Bb"), k("E"), k("Dm") };
  const key chosen = choose_target_key(keys);
  EXPECT_NE(std::find(keys.begin(), keys.end(), chosen), keys.end());
}

TEST(ChooseTargetKey, MajorityNeighbourhoodWins) {
  const std::vector<key> keys{ k("G"), k("G"), k("A"), k("C#") };
  EXPECT_EQ(choose_target_key(keys), k("G"));
}

TEST(ChooseTargetKey, EmptyInputIsCMajor) {
  EXPECT_EQ(choose_target_key({}), k("C"));
}

// ---------------------------------------------------------------------------
// plan_shifts
// ---------------------------------------------------------------------------

TEST(PlanShifts, DMinorToCWithinVocalLimit) {
  const auto plan = plan_shifts({ { "t1", k("Dm") } }, k("C"), { .vocal = 3, .music = 6 });
  EXPECT_EQ(plan.shifts.at("t1"), -2);
  EXPECT_EQ(plan.applied_shift("t1", stem_role::vocals), -2);
  EXPECT_EQ(plan.applied_shift("t1", stem_role::drums), -2);
}

TEST(PlanShifts, VocalsClampTighterThanMusic) {
  const auto plan = plan_shifts({ { "far", k("F") } }, k("A#"));
  EXPECT_EQ(plan.shifts.at("far"), 5);
  EXPECT_EQ(plan.applied_shift("far", stem_role::vocals), 3);
  EXPECT_EQ(plan.applied_shift("far", stem_role::other), 5);
}

TEST(PlanShifts, AppliedShiftNeverExceedsLimit) {
  std::map<std::string, key> per_track;
  int i = 0;
  for (key a : every_key()) per_track.emplace("t" + std::to_string(i++), a);

  for (int limit = 0; limit <= 6; ++limit) {
    const auto plan = plan_shifts(per_track, k("E"), { .vocal = limit, .music = limit + 1 });
    for (const auto& [id, shift] : plan.shifts) {
      EXPECT_LE(std::abs(plan.applied_shift(id, stem_role::vocals)), limit);
      EXPECT_LE(std::abs(plan.applied_shift(id, stem_role::bass)), limit + 1);
    }
  }
}

TEST(PlanShifts, UnknownTrackThrows) {
  const auto plan = plan_shifts({ { "t1", k("C") } }, k("C"));
  EXPECT_THROW((void)plan.applied_shift("nope", stem_role::vocals), invalid_input);
}

}  // namespace
}  // namespace clmash
