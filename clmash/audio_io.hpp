#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

#include "interleaved.hpp"

namespace clmash {

// Decode any format libsndfile understands.
[[nodiscard]] std::expected<track_audio, std::string>
load_track(const std::filesystem::path& file);

// 24-bit RF64/WAV, written to "<out_path>.tmp" and renamed over out_path
// when complete. Throws on failure and leaves out_path untouched.
void write_wav(const track_audio& audio, const std::filesystem::path& out_path);

// Sample-rate conversion with libsamplerate. Returns the input unchanged
// when it is already at to_rate.
[[nodiscard]] std::expected<track_audio, std::string>
resample(track_audio in, uint32_t to_rate, int src_type);

// Integrated loudness (EBU R128) in LUFS.
[[nodiscard]] std::expected<double, std::string>
measure_lufs(const track_audio& audio);

}
