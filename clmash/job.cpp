#include "job.hpp"

#include <cmath>
#include <format>
#include <fstream>
#include <ranges>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.hpp"

namespace clmash {

namespace {

namespace ranges { using namespace std::ranges; }
namespace views { using namespace std::views; }
using nlohmann::json;
using std::filesystem::path;
using std::string;

[[nodiscard]] job_track parse_track(const json& jt, const path& base_dir, size_t index)
{
  const string where = std::format("track {}", index + 1);
  if (!jt.is_object()) throw invalid_input(where + ": not an object");

  job_track t;
  if (!jt.contains("id") || !jt["id"].is_string())
    throw invalid_input(where + ": missing string 'id'");
  t.analysis.id = jt["id"].get<string>();

  if (!jt.contains("key") || !jt["key"].is_string())
    throw invalid_input(where + ": missing string 'key'");
  auto k = parse_key(jt["key"].get<string>());
  if (!k) throw invalid_input(std::format("{} ({}): {}", where, t.analysis.id, k.error()));
  t.analysis.track_key = *k;

  t.analysis.bpm = jt.value("bpm", 0.0);
  if (!(t.analysis.bpm > 0.0) || !std::isfinite(t.analysis.bpm))
    throw invalid_input(std::format("{} ({}): bpm must be > 0", where, t.analysis.id));

  if (!jt.contains("beats_sec") || !jt["beats_sec"].is_array())
    throw invalid_input(std::format("{} ({}): missing 'beats_sec' array", where, t.analysis.id));
  t.analysis.beats_sec = jt["beats_sec"].get<std::vector<double>>();

  if (jt.contains("stems")) {
    if (!jt["stems"].is_object())
      throw invalid_input(std::format("{} ({}): 'stems' must be an object", where, t.analysis.id));
    for (const auto& [name, file]: jt["stems"].items()) {
      auto role = parse_stem_role(name);
      if (!role)
        throw invalid_input(std::format("{} ({}): unknown stem '{}'", where, t.analysis.id, name));
      if (!file.is_string())
        throw invalid_input(std::format("{} ({}): stem path must be a string", where, t.analysis.id));
      path p = file.get<string>();
      t.stems.emplace(*role, p.is_absolute() ? p : base_dir / p);
    }
  }
  return t;
}

}

job parse_job(const json& j, const path& base_dir)
{
  if (!j.is_object()) throw invalid_input("root is not an object");

  int version = j.value("version", 1);
  if (version != 1) throw invalid_input("Unsupported job version");

  job out;
  const int rate = j.value("sample_rate", 44100);
  if (rate <= 0) throw invalid_input("sample_rate must be > 0");
  out.sample_rate = static_cast<uint32_t>(rate);

  const int channels = j.value("channels", 2);
  if (channels <= 0) throw invalid_input("channels must be > 0");
  out.channels = static_cast<size_t>(channels);

  out.limits.vocal = j.value("vocal_shift_limit", out.limits.vocal);
  out.limits.music = j.value("music_shift_limit", out.limits.music);
  if (out.limits.vocal < 0 || out.limits.music < 0)
    throw invalid_input("shift limits must be >= 0");

  if (!j.contains("tracks") || !j["tracks"].is_array())
    throw invalid_input("missing 'tracks' array");

  std::set<string> ids;
  for (size_t i = 0; i < j["tracks"].size(); ++i) {
    auto t = parse_track(j["tracks"][i], base_dir, i);
    if (!ids.insert(t.analysis.id).second)
      throw invalid_input("duplicate track id '" + t.analysis.id + "'");
    out.tracks.push_back(std::move(t));
  }

  if (j.contains("masterplan")) out.plan = parse_masterplan(j["masterplan"]);

  return out;
}

job load_job(const path& jobfile)
{
  std::ifstream in;
  in.exceptions(std::ifstream::failbit | std::ifstream::badbit);
  in.open(jobfile);

  json j;
  in >> j;

  return parse_job(j, jobfile.parent_path());
}

std::vector<track_analysis> analyses(const job& j)
{
  return j.tracks | views::transform(&job_track::analysis)
       | ranges::to<std::vector<track_analysis>>();
}

}
