#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "interleaved.hpp"
#include "key.hpp"

namespace clmash {

inline constexpr double min_bpm = 60.0;
inline constexpr double max_bpm = 180.0;

struct beat_grid {
  std::vector<double> beats_sec;
  std::vector<double> downbeats_sec;   // every 4th beat, starting with the first
  double bpm = 0.0;
  double bpm_confidence = 0.0;         // 0..1, from inter-beat-interval spread
  double fit_r2 = 0.0;                 // R^2 of the tempo regression
};

// Beat onsets (seconds) from aubio's beat tracker.
[[nodiscard]] std::vector<double> detect_beats(const track_audio& track);

// Tempo by least-squares fit of beat time against beat index, clamped to
// [min_bpm, max_bpm]. Throws insufficient_beats for fewer than 2 beats.
[[nodiscard]] beat_grid make_beat_grid(std::vector<double> beats_sec);

struct key_estimate {
  key detected;
  double confidence = 0.0;             // 0..1, rescaled profile correlation
};

inline constexpr double low_key_confidence = 0.6;

// Krumhansl-Kessler profile match on a chromagram from aubio's phase
// vocoder. Returns nullopt when the track has no tonal energy in range.
[[nodiscard]] std::optional<key_estimate> detect_key(const track_audio& track);

struct track_report {
  double duration_sec = 0.0;
  uint32_t sample_rate = 0;
  beat_grid grid;
  std::optional<key> track_key;
  std::optional<double> key_confidence; // unset when the key was given
  std::optional<double> loudness_lufs;
};

// Detects beats, tempo, key and loudness. A given key_override replaces
// key detection.
[[nodiscard]] track_report analyze_track(const track_audio& track,
                                         std::optional<key> key_override = std::nullopt);

// Job-file compatible analysis object ("key", "bpm", "beats_sec", ...).
[[nodiscard]] nlohmann::json report_json(const track_report& report);

}
