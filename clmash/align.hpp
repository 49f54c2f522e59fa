#pragma once

#include <cstddef>
#include <span>

#include "interleaved.hpp"
#include "stretch.hpp"

namespace clmash {

struct align_options {
  double crossfade_ms     = 12.0;
  size_t min_slice_frames = 32;   // shorter source slices are left silent
};

struct align_stats {
  size_t slices  = 0;
  size_t skipped = 0;
};

// Piecewise time-stretch `audio` so that source beat i lands on target
// beat i, for every beat pair both grids have. The output spans
// [target_beats.front(), target_beats[n-1]] and its length in frames is
// exactly round(t_last * sr) - round(t_first * sr).
//
// Throws insufficient_beats when either grid has fewer than two beats and
// invalid_input when a grid is not strictly increasing. Stretcher
// failures are rethrown as std::runtime_error.
[[nodiscard]] track_audio
align_to_grid(const track_audio& audio,
              std::span<const double> source_beats,
              std::span<const double> target_beats,
              const stretcher& stretch,
              const align_options& options = {},
              align_stats* stats = nullptr);

}
