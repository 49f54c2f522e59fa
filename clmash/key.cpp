#include "key.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <format>
#include <limits>
#include <vector>

#include "error.hpp"

namespace clmash {

namespace {

constexpr std::array<std::string_view, 12> pitch_names{
  "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"
};

// Natural pitch classes for the letters A..G.
constexpr std::array<int, 7> letter_pitch{ 9, 11, 0, 2, 4, 5, 7 };

[[nodiscard]] std::string lowercase(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (char c: s) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

}

std::expected<key, std::string> parse_key(std::string_view text)
{
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    text.remove_prefix(1);
  if (text.empty()) return std::unexpected(std::string("empty key"));

  const char letter = static_cast<char>(
    std::toupper(static_cast<unsigned char>(text.front()))
  );
  if (letter < 'A' || letter > 'G')
    return std::unexpected(std::format("invalid key '{}'", text));

  int pc = letter_pitch[letter - 'A'];
  std::string_view rest = text.substr(1);

  if (!rest.empty() && rest.front() == '#') {
    ++pc;
    rest.remove_prefix(1);
  } else if (!rest.empty() && rest.front() == 'b') {
    --pc;
    rest.remove_prefix(1);
  }

  const std::string suffix = lowercase(rest);
  if (suffix.empty() || suffix == "maj" || suffix == "major")
    return key(pc, key_mode::major);
  if (suffix == "m" || suffix == "min" || suffix == "minor")
    return key(pc, key_mode::minor);

  return std::unexpected(std::format("invalid key mode in '{}'", text));
}

std::string to_string(key k)
{
  std::string name(pitch_names[k.pitch_class()]);
  if (k.is_minor()) name += 'm';
  return name;
}

std::string camelot(key k)
{
  // Minor keys share the wheel number of their relative major.
  const int major_pc = k.is_minor() ? (k.pitch_class() + 3) % 12 : k.pitch_class();
  const int number = (major_pc * 7 % 12 + 7) % 12 + 1;
  return std::format("{}{}", number, k.is_minor() ? 'A' : 'B');
}

int semitone_distance(key src, key dst) noexcept
{
  const int s = src.pitch_class();
  const int d = dst.pitch_class();
  const int up   = ((d - s) % 12 + 12) % 12;
  const int down = -(((s - d) % 12 + 12) % 12);
  return std::abs(up) <= std::abs(down) ? up : down;
}

key choose_target_key(std::span<const key> keys)
{
  if (keys.empty()) return key(0, key_mode::major);

  // Distinct keys in first-seen order.
  std::vector<key> candidates;
  for (key k: keys)
    if (std::ranges::find(candidates, k) == candidates.end())
      candidates.push_back(k);

  key best = candidates.front();
  int best_cost = std::numeric_limits<int>::max();
  for (key cand: candidates) {
    int cost = 0;
    for (key k: keys) {
      cost += std::abs(semitone_distance(k, cand));
      if (k.mode() != cand.mode()) cost += 1;
    }
    if (cost < best_cost) {
      best = cand;
      best_cost = cost;
    }
  }
  return best;
}

int shift_plan::applied_shift(const std::string& track_id, stem_role role) const
{
  auto it = shifts.find(track_id);
  if (it == shifts.end())
    throw invalid_input("no planned shift for track '" + track_id + "'");
  const int limit = limit_for(role);
  return std::clamp(it->second, -limit, limit);
}

shift_plan
plan_shifts(const std::map<std::string, key>& per_track_keys, key target,
            shift_limits limits)
{
  shift_plan plan;
  plan.vocal_shift_limit = limits.vocal;
  plan.music_shift_limit = limits.music;
  for (const auto& [track_id, k]: per_track_keys)
    plan.shifts.emplace(track_id, semitone_distance(k, target));
  return plan;
}

}
