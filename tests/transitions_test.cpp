// Tests for transitions.hpp -- transition effect stages.

#include "clmash/transitions.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "test_helpers.hpp"

namespace clmash {
namespace {

using test::constant;

constexpr uint32_t kRate = 44100;

TEST(TransitionStyle, ParsesKnownNamesAndFallsBack) {
  EXPECT_EQ(parse_transition_style("clean_cross"), transition_style::clean_cross);
  EXPECT_EQ(parse_transition_style("filter_sweep"), transition_style::filter_sweep);
  EXPECT_EQ(parse_transition_style("echo_out"), transition_style::echo_out);
  EXPECT_EQ(parse_transition_style("sidechain_duck"), transition_style::sidechain_duck);
  EXPECT_EQ(parse_transition_style("tape_stop"), transition_style::other);
  EXPECT_EQ(to_string(transition_style::echo_out), "echo_out");
}

TEST(FilterSweep, AttenuatesHighsEarlyAndPassesLows) {
  // 8 kHz sits far above the 200 Hz starting cutoff.
  auto high = test::sine(kRate, 1, kRate, 8000.0, 0.5f);
  filter_sweep(high, kRate, 200.0, 18000.0);
  float early_peak = 0.0f;
  for (size_t f = 2000; f < 4000; ++f) early_peak = std::max(early_peak, std::abs(high[f, 0]));
  EXPECT_LT(early_peak, 0.01f);

  auto low = constant(kRate, 1, kRate, 0.5f);
  filter_sweep(low, kRate, 200.0, 18000.0);
  // Mid-block, well after the last coefficient change settled.
  EXPECT_NEAR((low[24000, 0]), 0.5f, 1e-3f);
}

TEST(FilterSweep, LeavesFramesAfterWindowUntouched) {
  auto buf = test::sine(kRate, 2, 2000, 5000.0);
  const auto before = buf.clone();
  filter_sweep(buf, 1000, 200.0, 18000.0);
  for (size_t f = 1000; f < 2000; ++f) ASSERT_EQ((buf[f, 1]), (before[f, 1]));
}

TEST(EchoOut, AddsDecayingRepeats) {
  track_audio buf(kRate, 1, 100);
  buf[10, 0] = 1.0f;
  echo_out(buf, 0, 20, 0.5f);
  EXPECT_EQ((buf[10, 0]), 1.0f);
  EXPECT_EQ((buf[30, 0]), 0.5f);
  EXPECT_EQ((buf[50, 0]), 0.25f);
  EXPECT_EQ((buf[11, 0]), 0.0f);
}

TEST(EchoOut, OnlyFeedsBackInsideWindow) {
  track_audio buf(kRate, 1, 100);
  buf[10, 0] = 1.0f;
  echo_out(buf, 60, 20, 0.5f);
  EXPECT_EQ((buf[30, 0]), 0.0f);
}

TEST(SidechainDuck, PumpsOncePerBeat) {
  auto buf = constant(kRate, 2, 1000, 1.0f);
  sidechain_duck(buf, 800, 100);
  EXPECT_NEAR((buf[0, 0]), 0.3f, 1e-6f);
  EXPECT_NEAR((buf[99, 1]), 1.0f, 1e-6f);
  EXPECT_NEAR((buf[100, 0]), 0.3f, 1e-6f);
  EXPECT_EQ((buf[800, 0]), 1.0f);
}

TEST(TransitionEffect, CleanCrossIsNoOp) {
  auto master = constant(kRate, 1, 100, 0.5f);
  auto next = constant(kRate, 1, 100, 0.5f);
  apply_transition_effect(transition_style::clean_cross, master, next, 100, 120.0);
  EXPECT_EQ(master.peak(), 0.5f);
  EXPECT_EQ(next.peak(), 0.5f);
  EXPECT_EQ((next[0, 0]), 0.5f);
}

TEST(TransitionEffect, DuckTouchesOnlyIncomingHead) {
  auto master = constant(kRate, 1, kRate, 0.5f);
  auto next = constant(kRate, 1, kRate, 0.5f);
  apply_transition_effect(transition_style::sidechain_duck, master, next, kRate / 2, 120.0);
  EXPECT_EQ((master[kRate - 1, 0]), 0.5f);
  EXPECT_NEAR((next[0, 0]), 0.15f, 1e-6f);
  EXPECT_EQ((next[kRate - 1, 0]), 0.5f);
}

}  // namespace
}  // namespace clmash
