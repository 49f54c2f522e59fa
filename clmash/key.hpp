#pragma once

#include <expected>
#include <map>
#include <span>
#include <string>
#include <string_view>

#include "stem.hpp"

namespace clmash {

enum class key_mode { major, minor };

// Musical key: pitch class on the chromatic circle (C = 0) plus mode.
class key {
  int pitch_class_ = 0;
  key_mode mode_   = key_mode::major;

public:
  constexpr key() noexcept = default;
  constexpr key(int pitch_class, key_mode mode) noexcept
  : pitch_class_(((pitch_class % 12) + 12) % 12), mode_(mode)
  {}

  [[nodiscard]] constexpr int pitch_class() const noexcept { return pitch_class_; }
  [[nodiscard]] constexpr key_mode mode() const noexcept { return mode_; }
  [[nodiscard]] constexpr bool is_minor() const noexcept { return mode_ == key_mode::minor; }

  friend constexpr bool operator==(key, key) noexcept = default;
};

// Accepts "C", "C#", "Db", "Am", "F#m", "A minor", "Eb major".
[[nodiscard]] std::expected<key, std::string> parse_key(std::string_view text);

// Canonical sharp spelling, "m" suffix for minor ("C#m").
[[nodiscard]] std::string to_string(key k);

// Camelot wheel code, e.g. "8B" for C major and "8A" for A minor.
[[nodiscard]] std::string camelot(key k);

// Signed semitone move from src to dst in [-6, 6], ignoring mode.
// A tritone resolves to +6.
[[nodiscard]] int semitone_distance(key src, key dst) noexcept;

// Pick the input key that minimizes total semitone distance plus one per
// mode change. Ties go to the first-seen candidate. Empty input yields
// C major.
[[nodiscard]] key choose_target_key(std::span<const key> keys);

struct shift_limits {
  int vocal = 3;
  int music = 6;
};

struct shift_plan {
  std::map<std::string, int> shifts; // pre-clamp, per track id
  int vocal_shift_limit = 3;
  int music_shift_limit = 6;

  [[nodiscard]] int limit_for(stem_role role) const noexcept
  { return role == stem_role::vocals ? vocal_shift_limit : music_shift_limit; }

  // Planned shift for track_id clamped to the role's limit.
  // Throws invalid_input for an unknown track.
  [[nodiscard]] int applied_shift(const std::string& track_id, stem_role role) const;
};

[[nodiscard]] shift_plan
plan_shifts(const std::map<std::string, key>& per_track_keys, key target,
            shift_limits limits = {});

}
