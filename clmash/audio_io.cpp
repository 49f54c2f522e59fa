#include "audio_io.hpp"

#include <cmath>
#include <format>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <ebur128.h>
#include <samplerate.h>
#include <sndfile.hh>

namespace clmash {

namespace {

using std::expected, std::unexpected;
using std::filesystem::path;
using std::in_range;
using std::runtime_error;
using std::string;

struct ebur128_state_deleter {
  void operator()(ebur128_state *p) const noexcept { if (p) ebur128_destroy(&p); }
};

using ebur128_state_ptr = std::unique_ptr<ebur128_state, ebur128_state_deleter>;

}

expected<track_audio, string> load_track(const path& file)
{
  SndfileHandle sf(file.string());
  if (sf.error()) {
    return unexpected("Failed to open audio file: " + file.generic_string());
  }

  const sf_count_t frames = sf.frames();
  const int sr = sf.samplerate();
  if (sr <= 0 || sf.channels() <= 0) {
    return unexpected("Invalid sample rate or channel count in file: " + file.generic_string());
  }

  track_audio track(
    static_cast<uint32_t>(sr),
    static_cast<size_t>(sf.channels()),
    static_cast<size_t>(frames)
  );

  const sf_count_t read_frames = sf.readf(track.data(), frames);
  if (read_frames < 0) {
    return unexpected(
      "Failed to read audio data from file: " + file.generic_string()
    );
  }
  if (read_frames != frames) {
    track.resize(static_cast<size_t>(read_frames));
  }

  return track;
}

void write_wav(const track_audio& audio, const path& out_path)
{
  if (!in_range<sf_count_t>(audio.frames()))
    throw runtime_error("frame count too large for libsndfile");

  const auto frames = sf_count_t(audio.frames());

  // Written beside the target and renamed into place once complete.
  path tmp_path = out_path;
  tmp_path += ".tmp";

  try {
    {
      SndfileHandle sf(tmp_path.string(), SFM_WRITE,
        SF_FORMAT_RF64 | SF_FORMAT_PCM_24,
        int(audio.channels()), int(audio.sample_rate)
      );

      if (sf.error() != SF_ERR_NO_ERROR) throw runtime_error(sf.strError());

      // RF64 falls back to a plain RIFF header when the file stays small.
      sf.command(SFC_RF64_AUTO_DOWNGRADE, nullptr, SF_TRUE);

      const sf_count_t written = sf.writef(audio.data(), frames);
      if (written != frames)
        throw runtime_error(
          std::format("Short write: wrote {} of {} frames", written, frames)
        );
    }
    std::filesystem::rename(tmp_path, out_path);
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw;
  }
}

expected<track_audio, string>
resample(track_audio in, uint32_t to_rate, int src_type)
{
  if (in.sample_rate == to_rate || in.empty()) {
    in.sample_rate = to_rate;
    return in;
  }

  if (!in_range<long>(in.frames()))
    return unexpected(
      "Input too large for libsamplerate (frame count exceeds 'long')."
    );
  if (!in_range<int>(in.channels()))
    return unexpected("Channel count too large for libsamplerate.");

  const double ratio = double(to_rate) / in.sample_rate;

  // Estimate output frames (add 1 for safety).
  const double est_out_frames_d = std::ceil(static_cast<double>(in.frames()) * ratio) + 1.0;
  if (!in_range<long>(static_cast<size_t>(est_out_frames_d)))
    return unexpected(
      "Output too large for libsamplerate (frame count exceeds 'long')."
    );

  const long out_frames_est = static_cast<long>(est_out_frames_d);
  track_audio out(to_rate, in.channels(), static_cast<size_t>(out_frames_est));

  SRC_DATA data{
    .data_in       = in.data(),
    .data_out      = out.data(),
    .input_frames  = static_cast<long>(in.frames()),
    .output_frames = out_frames_est,
    .end_of_input  = 1,
    .src_ratio     = ratio
  };

  if (const int err = src_simple(&data, src_type, static_cast<int>(in.channels())); err != 0)
    return unexpected(src_strerror(err));

  out.resize(static_cast<size_t>(data.output_frames_gen));

  return out;
}

expected<double, string> measure_lufs(const track_audio& audio)
{
  ebur128_state_ptr state{
    ebur128_init(static_cast<unsigned>(audio.channels()), audio.sample_rate, EBUR128_MODE_I)
  };
  if (!state) return unexpected("measure_lufs: ebur128_init failed");

  if (ebur128_add_frames_float(state.get(), audio.data(), audio.frames())
      != EBUR128_SUCCESS)
    return unexpected("measure_lufs: ebur128_add_frames_float failed");

  double lufs = 0.0;
  if (ebur128_loudness_global(state.get(), &lufs) != EBUR128_SUCCESS)
    return unexpected("measure_lufs: ebur128_loudness_global failed");

  return lufs;
}

}
