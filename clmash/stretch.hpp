#pragma once

#include <expected>
#include <string>

#include "interleaved.hpp"
#include "stem.hpp"

namespace clmash {

// Uniform time-stretch / pitch-shift primitives. Implementations must be
// safe to call concurrently from several threads on distinct buffers.
class stretcher {
public:
  virtual ~stretcher() = default;

  // ratio = input length / output length; ratio > 1 shortens (speeds up).
  // Pitch is preserved.
  [[nodiscard]] virtual std::expected<track_audio, std::string>
  time_stretch(const track_audio& in, double ratio) const = 0;

  // Shift pitch by semitones, preserving duration.
  [[nodiscard]] virtual std::expected<track_audio, std::string>
  pitch_shift(const track_audio& in, double semitones, stem_role role) const = 0;
};

// Offline Rubber Band backend. Vocals are shifted with formant
// preservation.
class rubberband_stretcher final : public stretcher {
public:
  [[nodiscard]] std::expected<track_audio, std::string>
  time_stretch(const track_audio& in, double ratio) const override;

  [[nodiscard]] std::expected<track_audio, std::string>
  pitch_shift(const track_audio& in, double semitones, stem_role role) const override;
};

}
