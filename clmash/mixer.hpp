#pragma once

#include <cstddef>
#include <cstdint>
#include <map>

#include "interleaved.hpp"
#include "masterplan.hpp"
#include "stem.hpp"
#include "transitions.hpp"

namespace clmash {

// Stem buffers keyed by (track, role): decoded sources or prepared stems.
using stem_buffers = std::map<stem_key, track_audio>;

inline constexpr float final_peak = 0.98f;

// Sum the section's layers into a buffer of the section's duration.
// Layers are truncated or zero padded; no limiting is applied.
// Throws invalid_input when a layer's stem was not prepared.
[[nodiscard]] track_audio
render_section(const section& sec, const stem_buffers& stems,
               uint32_t sample_rate, size_t channels, double bpm);

// Append next to master with an S-curve crossfade of `bars` bars (4/4 at
// bpm). Styles other than clean_cross use a fixed two-bar window after
// their effect stage. An empty master yields next unchanged.
[[nodiscard]] track_audio
append_section(track_audio master, track_audio next,
               transition_style style, int bars, double bpm);

// Scale so the peak sits at final_peak. Silence passes through.
[[nodiscard]] track_audio finalize_mix(track_audio master);

// Accumulating output of one render job: Empty -> Accumulating ->
// Finalized, with finalization exactly once.
class master_mix {
public:
  enum class state { empty, accumulating, finalized };

  void append(track_audio section, transition_style style, int bars, double bpm);

  // Normalize and hand out the final buffer. Throws std::logic_error if
  // called twice.
  [[nodiscard]] track_audio finalize();

  [[nodiscard]] state current() const noexcept { return state_; }
  [[nodiscard]] size_t sections() const noexcept { return sections_; }
  [[nodiscard]] size_t frames() const noexcept { return audio_.frames(); }

  // Peak magnitude before normalization; valid after finalize().
  [[nodiscard]] float peak_before_normalize() const noexcept { return peak_; }

private:
  track_audio audio_;
  state state_ = state::empty;
  size_t sections_ = 0;
  float peak_ = 0.f;
};

}
