#pragma once

#include <cstddef>
#include <string_view>

#include "interleaved.hpp"

namespace clmash {

// How a section joins the previous one. Unrecognized names map to
// `other`, which renders as a plain S-curve crossfade.
enum class transition_style { clean_cross, filter_sweep, echo_out, sidechain_duck, other };

inline constexpr int default_transition_bars = 2;

[[nodiscard]] transition_style parse_transition_style(std::string_view name) noexcept;
[[nodiscard]] std::string_view to_string(transition_style style) noexcept;

// Low-pass sweep over frames [0, frames) of buf, cutoff moving
// exponentially from start_hz to end_hz. Frames after the window pass
// through unfiltered.
void filter_sweep(track_audio& buf, size_t frames, double start_hz, double end_hz);

// Feedback echo on frames [from, end) of buf: y[i] = x[i] + fb * y[i - delay].
void echo_out(track_audio& buf, size_t from, size_t delay_frames, float feedback);

// Four-on-the-floor pump over frames [0, frames): each beat ramps from
// floor_gain back to unity.
void sidechain_duck(track_audio& buf, size_t frames, size_t beat_frames,
                    float floor_gain = 0.3f);

// Apply the effect stage for style to the outgoing tail (last `window`
// frames of master) or the incoming head (first `window` frames of next).
// clean_cross and other are no-ops.
void apply_transition_effect(transition_style style,
                             track_audio& master, track_audio& next,
                             size_t window, double bpm);

}
