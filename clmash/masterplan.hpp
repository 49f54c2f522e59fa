#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "key.hpp"
#include "stem.hpp"
#include "transitions.hpp"

namespace clmash {

struct layer {
  std::string track_id;
  stem_role stem = stem_role::other;
  std::optional<double> gain_db;
  std::optional<int> start_bar;   // bar of the aligned stem to start from (0-based)
};

struct section {
  double duration_sec = 0.0;
  transition_style transition = transition_style::clean_cross;
  std::optional<int> transition_bars;
  std::string description;
  std::vector<layer> layers;
};

struct masterplan {
  std::vector<section> sections;
  std::optional<double> target_bpm;
  std::optional<key> target_key;
};

// Read the fields the renderer consumes; anything else is ignored.
// Throws invalid_input on missing or malformed fields.
[[nodiscard]] masterplan parse_masterplan(const nlohmann::json& j);

[[nodiscard]] masterplan load_masterplan(const std::filesystem::path& file);

// Distinct (track, role) pairs referenced by any layer.
[[nodiscard]] std::set<stem_key> referenced_stems(const masterplan& plan);

}
