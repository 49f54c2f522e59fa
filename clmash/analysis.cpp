#include "analysis.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <utility>

#include <boost/math/statistics/bivariate_statistics.hpp>
#include <boost/math/statistics/linear_regression.hpp>
#include <boost/math/statistics/univariate_statistics.hpp>
#include <nlohmann/json.hpp>

#include <aubio/aubio.h>

#include "audio_io.hpp"
#include "error.hpp"

namespace clmash {

namespace {

namespace ranges { using namespace std::ranges; }
namespace views { using namespace std::views; }
using boost::math::statistics::correlation_coefficient;
using boost::math::statistics::simple_ordinary_least_squares_with_R_squared;
using nlohmann::json;
using std::runtime_error;
using std::unique_ptr;
using std::vector;

using aubio_tempo_ptr = unique_ptr<aubio_tempo_t, decltype(&del_aubio_tempo)>;
using fvec_ptr        = unique_ptr<fvec_t,        decltype(&del_fvec)>;
using aubio_pvoc_ptr  = unique_ptr<aubio_pvoc_t,  decltype(&del_aubio_pvoc)>;
using cvec_ptr        = unique_ptr<cvec_t,        decltype(&del_cvec)>;

using chroma = std::array<double, 12>;

// Krumhansl-Kessler key profiles, tonic first.
constexpr chroma major_profile{ 6.35, 2.23, 3.48, 2.33, 4.38, 4.09, 2.52, 5.19, 2.39, 3.66, 2.29, 2.88 };
constexpr chroma minor_profile{ 6.33, 2.68, 3.52, 5.38, 2.60, 3.53, 2.54, 4.75, 3.98, 2.69, 3.34, 3.17 };

constexpr double chroma_min_hz = 55.0;
constexpr double chroma_max_hz = 5000.0;

chroma rotated(const chroma& profile, int tonic)
{
  chroma out;
  for (int pc = 0; pc < 12; ++pc) out[pc] = profile[(pc - tonic + 12) % 12];
  return out;
}

template<typename F> void
for_each_mono_chunk(const track_audio& audio, fvec_t *buffer, F &&f)
{
  auto mono = [&audio](size_t frame) { return audio[frame].average(); };
  for (auto frames: views::chunk(views::iota(size_t(0), audio.frames()), buffer->length)) {
    smpl_t *tail = ranges::transform(frames, buffer->data, mono).out;
    std::fill(tail, buffer->data + buffer->length, smpl_t(0));
    f(buffer);
  }
}

}

vector<double> detect_beats(const track_audio& track)
{
  if (track.sample_rate == 0 || track.channels() == 0 || track.frames() == 0) {
    throw invalid_input("detect_beats: invalid or empty track");
  }

  const uint_t win_s = 1024;
  const uint_t hop_s = 512;
  const auto samplerate = static_cast<uint_t>(track.sample_rate);

  aubio_tempo_ptr tempo{
    new_aubio_tempo("default", win_s, hop_s, samplerate), &del_aubio_tempo
  };
  if (!tempo) throw runtime_error("aubio: failed to create tempo object");

  fvec_ptr tempo_out{ new_fvec(2), &del_fvec };
  fvec_ptr inbuf    { new_fvec(hop_s), &del_fvec };
  if (!inbuf || !tempo_out) {
    throw runtime_error("aubio: failed to allocate tempo buffers");
  }

  vector<double> result;

  for_each_mono_chunk(track, inbuf.get(), [&](fvec_t *buffer) {
    aubio_tempo_do(tempo.get(), buffer, tempo_out.get());

    // Beat detected in this hop?
    if (fvec_get_sample(tempo_out.get(), 0) != smpl_t(0)) {
      const auto t_sec = double(aubio_tempo_get_last_s(tempo.get()));
      if (t_sec >= 0.0 && t_sec <= track.duration()) {
        result.push_back(t_sec);
      }
    }
  });

  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());

  return result;
}

beat_grid make_beat_grid(vector<double> beats_sec)
{
  if (beats_sec.size() < 2)
    throw insufficient_beats(
      std::format("need at least 2 beats to estimate tempo, got {}", beats_sec.size())
    );

  beat_grid grid;

  const auto index = views::iota(size_t(0), beats_sec.size())
                   | views::transform([](size_t i) { return static_cast<double>(i); })
                   | ranges::to<vector<double>>();
  [[maybe_unused]] auto [offset, beat_sec, R2] =
    simple_ordinary_least_squares_with_R_squared(index, beats_sec);

  grid.fit_r2 = std::isfinite(R2) ? R2 : 0.0;
  grid.bpm = beat_sec > 0.0 ? std::clamp(60.0 / beat_sec, min_bpm, max_bpm) : min_bpm;

  const auto ibis = beats_sec | views::adjacent_transform<2>(
                      [](double a, double b) { return b - a; })
                  | ranges::to<vector<double>>();
  const double mean_ibi = boost::math::statistics::mean(ibis);
  const double std_ibi  = std::sqrt(boost::math::statistics::variance(ibis));
  grid.bpm_confidence = std::clamp(1.0 - std_ibi / (mean_ibi + 1e-6), 0.0, 1.0);

  grid.downbeats_sec = beats_sec | views::stride(4) | ranges::to<vector<double>>();
  grid.beats_sec = std::move(beats_sec);
  return grid;
}

std::optional<key_estimate> detect_key(const track_audio& track)
{
  if (track.sample_rate == 0 || track.channels() == 0 || track.frames() == 0) {
    throw invalid_input("detect_key: invalid or empty track");
  }

  const uint_t win_s = 4096;
  const uint_t hop_s = 2048;

  aubio_pvoc_ptr pvoc{ new_aubio_pvoc(win_s, hop_s), &del_aubio_pvoc };
  if (!pvoc) throw runtime_error("aubio: failed to create phase vocoder");

  cvec_ptr grain{ new_cvec(win_s), &del_cvec };
  fvec_ptr inbuf{ new_fvec(hop_s), &del_fvec };
  if (!grain || !inbuf) {
    throw runtime_error("aubio: failed to allocate phase vocoder buffers");
  }

  // Pitch class of each spectrum bin, -1 outside the chroma range.
  const double bin_hz = double(track.sample_rate) / win_s;
  vector<int> bin_pc(grain->length, -1);
  for (uint_t b = 1; b < grain->length; ++b) {
    const double hz = b * bin_hz;
    if (hz < chroma_min_hz || hz > chroma_max_hz) continue;
    const auto midi = std::lround(12.0 * std::log2(hz / 440.0)) + 69;
    bin_pc[b] = static_cast<int>(((midi % 12) + 12) % 12);
  }

  chroma energy{};
  for_each_mono_chunk(track, inbuf.get(), [&](fvec_t *buffer) {
    aubio_pvoc_do(pvoc.get(), buffer, grain.get());
    for (uint_t b = 0; b < grain->length; ++b) {
      if (bin_pc[b] < 0) continue;
      const double mag = grain->norm[b];
      energy[bin_pc[b]] += mag * mag;
    }
  });

  if (!(ranges::max(energy) > 1e-9)) return std::nullopt;

  std::optional<key_estimate> best;
  double best_r = 0.0;
  for (int tonic = 0; tonic < 12; ++tonic) {
    for (auto [mode, profile]: { std::pair{ key_mode::major, &major_profile },
                                 std::pair{ key_mode::minor, &minor_profile } }) {
      const double r = correlation_coefficient(energy, rotated(*profile, tonic));
      if (!std::isfinite(r)) continue;
      if (!best || r > best_r) {
        best_r = r;
        best = key_estimate{ key(tonic, mode), 0.0 };
      }
    }
  }
  if (best) best->confidence = std::clamp((best_r - 0.1) / 0.9, 0.0, 1.0);
  return best;
}

track_report analyze_track(const track_audio& track, std::optional<key> key_override)
{
  track_report report;
  report.duration_sec = track.duration();
  report.sample_rate  = track.sample_rate;
  report.grid         = make_beat_grid(detect_beats(track));

  if (key_override) {
    report.track_key = key_override;
  } else if (auto estimate = detect_key(track)) {
    report.track_key      = estimate->detected;
    report.key_confidence = estimate->confidence;
  }

  // Loudness is informational; a failed measurement leaves it unset.
  if (auto lufs = measure_lufs(track); lufs && std::isfinite(*lufs))
    report.loudness_lufs = *lufs;

  return report;
}

json report_json(const track_report& report)
{
  json j = {
    { "duration_sec",   report.duration_sec },
    { "sample_rate",    report.sample_rate },
    { "bpm",            std::round(report.grid.bpm * 10.0) / 10.0 },
    { "bpm_confidence", std::round(report.grid.bpm_confidence * 100.0) / 100.0 },
    { "fit_r2",         std::round(report.grid.fit_r2 * 1000.0) / 1000.0 },
    { "beats_sec",      report.grid.beats_sec },
    { "downbeats_sec",  report.grid.downbeats_sec },
    { "time_signature", "4/4" },
  };
  if (report.track_key) {
    j["key"]     = to_string(*report.track_key);
    j["camelot"] = camelot(*report.track_key);
  }
  if (report.key_confidence)
    j["key_confidence"] = std::round(*report.key_confidence * 100.0) / 100.0;
  if (report.loudness_lufs) j["loudness_lufs"] = *report.loudness_lufs;
  return j;
}

}
