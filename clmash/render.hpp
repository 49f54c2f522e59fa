#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "align.hpp"
#include "interleaved.hpp"
#include "key.hpp"
#include "masterplan.hpp"
#include "mixer.hpp"
#include "stretch.hpp"

namespace clmash {

// Analysis of one source track, produced upstream and read-only here.
struct track_analysis {
  std::string id;
  key track_key;
  double bpm = 0.0;
  std::vector<double> beats_sec;
};

struct render_options {
  uint32_t sample_rate = 44100;
  size_t channels = 2;
  shift_limits limits;
  std::optional<double> bpm;        // overrides the plan's targetBPM
  std::optional<key> target_key;    // overrides the plan's targetKey
  align_options align;
  std::function<void(std::string_view)> log; // progress lines; may be empty
};

struct render_plan {
  key target_key;
  double target_bpm = 0.0;
  shift_plan shifts;
};

// Target key and tempo for a job plus the per-track shift plan. The key
// comes from the options, then the masterplan, then choose_target_key; the
// tempo from the options, then the masterplan, then the mean track BPM.
[[nodiscard]] render_plan
make_render_plan(std::span<const track_analysis> tracks, const masterplan& plan,
                 const render_options& options);

// Evenly spaced grid of `beats` beats at bpm, starting at 0.
[[nodiscard]] std::vector<double> reference_grid(size_t beats, double bpm);

// Align one stem onto the reference grid at target_bpm, then pitch-shift
// it by semitones (skipped when zero).
[[nodiscard]] track_audio
prepare_stem(const track_audio& stem, const track_analysis& track,
             double target_bpm, int semitones, stem_role role,
             const stretcher& stretch, const align_options& align = {},
             align_stats* stats = nullptr);

struct render_result {
  track_audio audio;
  render_plan plan;
  float peak_before_normalize = 0.f;
  size_t sections = 0;
  size_t prepared_stems = 0;
  size_t skipped_slices = 0;
};

// Run one render job. Every (track, role) referenced by the masterplan
// must have an analysis entry and a source buffer at options.sample_rate.
// Stems are prepared in parallel; sections are mixed in timeline order.
// Any failure aborts the whole job.
[[nodiscard]] render_result
render_mashup(std::span<const track_analysis> tracks, stem_buffers sources,
              const masterplan& plan, const stretcher& stretch,
              const render_options& options);

}
