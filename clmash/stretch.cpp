#include "stretch.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

#include <rubberband/RubberBandStretcher.h>

namespace clmash {

namespace {

using RubberBand::RubberBandStretcher;
using std::expected, std::unexpected;
using std::string;
using std::vector;

constexpr size_t block_frames = 4096;

// Run one offline Rubber Band pass (study + process) over the whole
// buffer. Threading is disabled; callers parallelize across stems.
[[nodiscard]] expected<track_audio, string>
run_offline(const track_audio& in, double time_ratio, double pitch_scale,
            RubberBandStretcher::Options extra)
{
  const size_t channels = in.channels();
  const size_t frames   = in.frames();

  if (frames == 0) return track_audio(in.sample_rate, channels, 0);

  RubberBandStretcher rb(
    in.sample_rate, channels,
    RubberBandStretcher::OptionProcessOffline |
    RubberBandStretcher::OptionThreadingNever | extra,
    time_ratio, pitch_scale
  );
  rb.setExpectedInputDuration(frames);
  rb.setMaxProcessSize(block_frames);

  // Rubber Band works on planar data.
  vector<vector<float>> planar(channels, vector<float>(frames));
  for (size_t f = 0; f < frames; ++f)
    for (size_t ch = 0; ch < channels; ++ch)
      planar[ch][f] = in[f, ch];

  vector<const float*> in_ptrs(channels);
  auto feed = [&](auto&& step) {
    for (size_t off = 0; off < frames; off += block_frames) {
      const size_t n = std::min(block_frames, frames - off);
      for (size_t ch = 0; ch < channels; ++ch) in_ptrs[ch] = planar[ch].data() + off;
      step(n, off + n >= frames);
    }
  };

  vector<vector<float>> out(channels);
  vector<vector<float>> chunk(channels);
  vector<float*> out_ptrs(channels);
  auto drain = [&] {
    int avail;
    while ((avail = rb.available()) > 0) {
      const auto n = static_cast<size_t>(avail);
      for (size_t ch = 0; ch < channels; ++ch) {
        chunk[ch].resize(n);
        out_ptrs[ch] = chunk[ch].data();
      }
      const size_t got = rb.retrieve(out_ptrs.data(), n);
      for (size_t ch = 0; ch < channels; ++ch)
        out[ch].insert(out[ch].end(), chunk[ch].begin(), chunk[ch].begin() + got);
    }
  };

  feed([&](size_t n, bool final) { rb.study(in_ptrs.data(), n, final); });
  feed([&](size_t n, bool final) {
    rb.process(in_ptrs.data(), n, final);
    drain();
  });
  drain();

  const size_t out_frames = out.front().size();
  track_audio result(in.sample_rate, channels, out_frames);
  for (size_t f = 0; f < out_frames; ++f)
    for (size_t ch = 0; ch < channels; ++ch)
      result[f, ch] = out[ch][f];

  return result;
}

}

expected<track_audio, string>
rubberband_stretcher::time_stretch(const track_audio& in, double ratio) const
{
  if (!(ratio > 0.0) || !std::isfinite(ratio))
    return unexpected(std::format("invalid stretch ratio {}", ratio));

  // Rubber Band's time ratio is output/input duration.
  return run_offline(in, 1.0 / ratio, 1.0, RubberBandStretcher::OptionPitchHighQuality);
}

expected<track_audio, string>
rubberband_stretcher::pitch_shift(const track_audio& in, double semitones,
                                  stem_role role) const
{
  if (!std::isfinite(semitones))
    return unexpected(string("invalid pitch shift"));

  RubberBandStretcher::Options opts = RubberBandStretcher::OptionPitchHighQuality;
  if (role == stem_role::vocals) opts |= RubberBandStretcher::OptionFormantPreserved;

  return run_offline(in, 1.0, std::exp2(semitones / 12.0), opts);
}

}
