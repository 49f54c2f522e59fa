#include "transitions.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <utility>
#include <vector>

#include "fade.hpp"

namespace clmash {

namespace {

using std::min;
using std::vector;

constexpr std::array<std::pair<transition_style, std::string_view>, 5> style_names{{
  { transition_style::clean_cross,    "clean_cross" },
  { transition_style::filter_sweep,   "filter_sweep" },
  { transition_style::echo_out,       "echo_out" },
  { transition_style::sidechain_duck, "sidechain_duck" },
  { transition_style::other,          "other" },
}};

// RBJ cookbook low-pass, transposed direct form II.
struct lowpass {
  float b0 = 1.f, b1 = 0.f, b2 = 0.f, a1 = 0.f, a2 = 0.f;

  void configure(double cutoff_hz, double sample_rate, double q = std::numbers::sqrt2 / 2) noexcept
  {
    const double nyquist = 0.5 * sample_rate;
    cutoff_hz = std::clamp(cutoff_hz, 10.0, 0.95 * nyquist);
    const double w0    = 2.0 * std::numbers::pi * cutoff_hz / sample_rate;
    const double cosw  = std::cos(w0);
    const double alpha = std::sin(w0) / (2.0 * q);
    const double a0    = 1.0 + alpha;
    b0 = static_cast<float>((1.0 - cosw) * 0.5 / a0);
    b1 = static_cast<float>((1.0 - cosw) / a0);
    b2 = b0;
    a1 = static_cast<float>(-2.0 * cosw / a0);
    a2 = static_cast<float>((1.0 - alpha) / a0);
  }

  struct state { float z1 = 0.f, z2 = 0.f; };

  [[nodiscard]] float process(state& s, float x) const noexcept
  {
    const float y = b0 * x + s.z1;
    s.z1 = b1 * x - a1 * y + s.z2;
    s.z2 = b2 * x - a2 * y;
    return y;
  }
};

}

transition_style parse_transition_style(std::string_view name) noexcept
{
  for (const auto& [style, text]: style_names)
    if (text == name) return style;
  return transition_style::other;
}

std::string_view to_string(transition_style style) noexcept
{
  for (const auto& [s, text]: style_names)
    if (s == style) return text;
  return "other";
}

void filter_sweep(track_audio& buf, size_t frames, double start_hz, double end_hz)
{
  frames = min(frames, buf.frames());
  if (frames == 0 || buf.sample_rate == 0) return;

  const size_t channels = buf.channels();
  const size_t block = std::max<size_t>(1, buf.sample_rate / 16);

  lowpass lp;
  vector<lowpass::state> states(channels);

  // Coefficients change per block; filter state carries across blocks.
  for (size_t begin = 0; begin < frames; begin += block) {
    const double t = window_position(begin, frames);
    lp.configure(start_hz * std::pow(end_hz / start_hz, t), buf.sample_rate);
    const size_t end = min(begin + block, frames);
    for (size_t f = begin; f < end; ++f)
      for (size_t ch = 0; ch < channels; ++ch)
        buf[f, ch] = lp.process(states[ch], buf[f, ch]);
  }
}

void echo_out(track_audio& buf, size_t from, size_t delay_frames, float feedback)
{
  if (delay_frames == 0 || from >= buf.frames()) return;

  const size_t channels = buf.channels();
  for (size_t f = from + delay_frames; f < buf.frames(); ++f)
    for (size_t ch = 0; ch < channels; ++ch)
      buf[f, ch] += feedback * buf[f - delay_frames, ch];
}

void sidechain_duck(track_audio& buf, size_t frames, size_t beat_frames, float floor_gain)
{
  frames = min(frames, buf.frames());
  if (beat_frames == 0) return;

  for (size_t f = 0; f < frames; ++f) {
    const double t = window_position(f % beat_frames, beat_frames);
    buf[f] *= floor_gain + (1.0f - floor_gain) * static_cast<float>(t);
  }
}

void apply_transition_effect(transition_style style,
                             track_audio& master, track_audio& next,
                             size_t window, double bpm)
{
  const double beat_sec = 60.0 / bpm;

  switch (style) {
    case transition_style::filter_sweep:
      filter_sweep(next, window, 200.0, 18000.0);
      break;

    case transition_style::echo_out: {
      const auto delay = static_cast<size_t>(std::lround(0.75 * beat_sec * master.sample_rate));
      const size_t from = master.frames() - min(window, master.frames());
      echo_out(master, from, delay, 0.35f);
      break;
    }

    case transition_style::sidechain_duck: {
      const auto beat = static_cast<size_t>(std::lround(beat_sec * next.sample_rate));
      sidechain_duck(next, window, beat);
      break;
    }

    case transition_style::clean_cross:
    case transition_style::other:
      break;
  }
}

}
