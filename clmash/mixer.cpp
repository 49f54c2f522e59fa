#include "mixer.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <utility>

#include "error.hpp"
#include "fade.hpp"

namespace clmash {

namespace {

using std::max, std::min;

[[nodiscard]] size_t seconds_to_frames(double sec, uint32_t sr) noexcept
{ return static_cast<size_t>(std::llround(max(0.0, sec) * sr)); }

// 4/4 bars to frames at bpm.
[[nodiscard]] size_t bars_to_frames(int bars, double bpm, uint32_t sr) noexcept
{ return seconds_to_frames(max(0, bars) * 4 * (60.0 / bpm), sr); }

void check_appendable(const track_audio& master, const track_audio& next, double bpm)
{
  if (!(bpm > 0.0)) throw invalid_input("append_section: bpm must be > 0");
  if (master.channels() != next.channels() || master.sample_rate != next.sample_rate)
    throw invalid_input("append_section: buffers differ in channels or sample rate");
}

}

track_audio
render_section(const section& sec, const stem_buffers& stems,
               uint32_t sample_rate, size_t channels, double bpm)
{
  if (!(bpm > 0.0)) throw invalid_input("render_section: bpm must be > 0");

  track_audio out(sample_rate, channels, seconds_to_frames(sec.duration_sec, sample_rate));

  for (const auto& l: sec.layers) {
    auto it = stems.find({ l.track_id, l.stem });
    if (it == stems.end())
      throw invalid_input(
        std::format("no prepared stem {}/{}", l.track_id, to_string(l.stem))
      );

    const track_audio& stem = it->second;
    if (stem.sample_rate != sample_rate)
      throw invalid_input(
        std::format("stem {}/{} is at {} Hz, mix runs at {} Hz",
                    l.track_id, to_string(l.stem), stem.sample_rate, sample_rate)
      );

    const size_t offset = bars_to_frames(l.start_bar.value_or(0), bpm, sample_rate);
    if (offset >= stem.frames()) continue;

    const size_t frames = min(out.frames(), stem.frames() - offset);
    const float gain = l.gain_db ? dbamp(static_cast<float>(*l.gain_db)) : 1.0f;
    const size_t in_ch = stem.channels();

    for (size_t f = 0; f < frames; ++f)
      for (size_t ch = 0; ch < channels; ++ch)
        out[f, ch] += gain * stem[offset + f, ch % in_ch];
  }

  return out;
}

track_audio
append_section(track_audio master, track_audio next,
               transition_style style, int bars, double bpm)
{
  if (master.empty()) return next;

  check_appendable(master, next, bpm);

  if (style != transition_style::clean_cross) bars = default_transition_bars;

  const size_t n = min({
    bars_to_frames(bars, bpm, master.sample_rate), master.frames(), next.frames()
  });

  apply_transition_effect(style, master, next, n, bpm);

  const size_t start = master.frames() - n;
  const size_t channels = master.channels();
  master.resize(start + next.frames());

  for (size_t i = 0; i < n; ++i) {
    const float w = apply_fade_curve(fade_curve::SCurve, window_position(i, n));
    for (size_t ch = 0; ch < channels; ++ch)
      master[start + i, ch] = (1.0f - w) * master[start + i, ch] + w * next[i, ch];
  }
  std::copy(next.data() + n * channels, next.data() + next.samples(),
            master.data() + (start + n) * channels);

  return master;
}

track_audio finalize_mix(track_audio master)
{
  const float peak = master.peak();
  if (peak > 0.0f) master *= final_peak / peak;
  return master;
}

void master_mix::append(track_audio section, transition_style style, int bars, double bpm)
{
  if (state_ == state::finalized)
    throw std::logic_error("master_mix: append after finalize");

  // Checked before the accumulated audio is handed over, so a rejected
  // section leaves the mix as it was.
  if (!audio_.empty()) check_appendable(audio_, section, bpm);

  audio_ = append_section(std::move(audio_), std::move(section), style, bars, bpm);
  state_ = state::accumulating;
  ++sections_;
}

track_audio master_mix::finalize()
{
  if (state_ == state::finalized)
    throw std::logic_error("master_mix: already finalized");

  peak_ = audio_.peak();
  state_ = state::finalized;
  return finalize_mix(std::move(audio_));
}

}
