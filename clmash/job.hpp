#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "key.hpp"
#include "masterplan.hpp"
#include "render.hpp"
#include "stem.hpp"

namespace clmash {

struct job_track {
  track_analysis analysis;
  std::map<stem_role, std::filesystem::path> stems;
};

// Render job configuration (JSON, version 1).
struct job {
  uint32_t sample_rate = 44100;
  size_t channels = 2;
  shift_limits limits;
  std::vector<job_track> tracks;
  std::optional<masterplan> plan;
};

// Stem paths are resolved relative to base_dir.
[[nodiscard]] job parse_job(const nlohmann::json& j, const std::filesystem::path& base_dir);

[[nodiscard]] job load_job(const std::filesystem::path& jobfile);

[[nodiscard]] std::vector<track_analysis> analyses(const job& j);

}
