#include "align.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <vector>

#include "error.hpp"
#include "fade.hpp"

namespace clmash {

namespace {

using std::min;
using std::runtime_error;
using std::span;
using std::vector;

void check_grid(span<const double> beats, const char* name)
{
  if (beats.size() < 2)
    throw insufficient_beats(
      std::format("{} grid needs at least 2 beats, got {}", name, beats.size())
    );
  for (size_t i = 1; i < beats.size(); ++i) {
    if (!std::isfinite(beats[i]) || !(beats[i] > beats[i - 1]))
      throw invalid_input(
        std::format("{} grid is not strictly increasing at beat {}", name, i)
      );
  }
}

[[nodiscard]] int64_t to_frame(double t_sec, uint32_t sr) noexcept
{ return std::llround(t_sec * sr); }

// Copy frames [begin, end) of audio into a new buffer.
[[nodiscard]] track_audio slice(const track_audio& audio, size_t begin, size_t end)
{
  track_audio out(audio.sample_rate, audio.channels(), end - begin);
  std::copy(audio.data() + begin * audio.channels(),
            audio.data() + end * audio.channels(),
            out.data());
  return out;
}

}

track_audio
align_to_grid(const track_audio& audio,
              span<const double> source_beats,
              span<const double> target_beats,
              const stretcher& stretch,
              const align_options& options,
              align_stats* stats)
{
  check_grid(source_beats, "source");
  check_grid(target_beats, "target");

  const uint32_t sr = audio.sample_rate;
  if (sr == 0) throw invalid_input("align_to_grid: audio has no sample rate");

  const size_t channels = audio.channels();
  const size_t n = min(source_beats.size(), target_beats.size()) - 1;
  const auto src_frames = static_cast<int64_t>(audio.frames());

  // Target boundaries relative to the first target beat. Rounding the
  // boundaries (not the lengths) makes slice lengths telescope.
  vector<size_t> tgt(n + 1);
  const int64_t base = to_frame(target_beats[0], sr);
  for (size_t i = 0; i <= n; ++i)
    tgt[i] = static_cast<size_t>(to_frame(target_beats[i], sr) - base);

  auto src_at = [&](size_t i) {
    return static_cast<size_t>(std::clamp(to_frame(source_beats[i], sr), int64_t(0), src_frames));
  };

  // Overlap between slice i and slice i + 1.
  const auto xfade = static_cast<size_t>(std::lround(options.crossfade_ms * 0.001 * sr));
  vector<size_t> overlap(n, 0);
  for (size_t i = 0; i + 1 < n; ++i)
    overlap[i] = min({ xfade, tgt[i + 1] - tgt[i], tgt[i + 2] - tgt[i + 1] });

  track_audio out(sr, channels, tgt[n]);
  align_stats local{};
  bool prev_written = false;

  for (size_t i = 0; i < n; ++i) {
    ++local.slices;
    const size_t out_begin = tgt[i];
    const size_t tgt_len   = tgt[i + 1] - tgt[i];
    const size_t s0 = src_at(i);
    const size_t s1 = src_at(i + 1);
    const size_t src_len = s1 > s0 ? s1 - s0 : 0;

    if (src_len < options.min_slice_frames || tgt_len == 0) {
      ++local.skipped;
      prev_written = false;
      continue;
    }

    const double ratio = static_cast<double>(src_len) / static_cast<double>(tgt_len);

    // Read past the slice end so the stretched tail can overlap the next
    // slice's head.
    const size_t tail = overlap[i];
    const auto extra = static_cast<size_t>(std::llround(static_cast<double>(tail) * ratio));
    const size_t read_end = min(s1 + extra, static_cast<size_t>(src_frames));

    auto stretched = stretch.time_stretch(slice(audio, s0, read_end), ratio);
    if (!stretched)
      throw runtime_error(std::format("beat slice {}: {}", i, stretched.error()));

    // Stretching by ratio only approximates the target length; pad with
    // silence or truncate to it exactly.
    track_audio& seg = *stretched;
    seg.resize(tgt_len + tail);

    const size_t head = (i > 0 && prev_written) ? overlap[i - 1] : 0;
    for (size_t j = 0; j < tgt_len + tail; ++j) {
      float gain = 1.0f;
      if (j < head) {
        gain = apply_fade_curve(fade_curve::Linear, (j + 0.5) / head);
      } else if (j >= tgt_len) {
        gain = 1.0f - apply_fade_curve(fade_curve::Linear, (j - tgt_len + 0.5) / tail);
      }
      const size_t pos = out_begin + j;
      for (size_t ch = 0; ch < channels; ++ch)
        out[pos, ch] += gain * seg[j, ch];
    }
    prev_written = true;
  }

  if (stats) *stats = local;
  return out;
}

}
