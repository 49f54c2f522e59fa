#include "masterplan.hpp"

#include <cmath>
#include <format>
#include <fstream>
#include <initializer_list>

#include <nlohmann/json.hpp>

#include "error.hpp"

namespace clmash {

namespace {

using nlohmann::json;
using std::optional, std::nullopt;
using std::string;

// First of several accepted spellings present in j, or nullptr.
[[nodiscard]] const json* field(const json& j, std::initializer_list<const char*> names)
{
  for (const char* name: names) {
    auto it = j.find(name);
    if (it != j.end() && !it->is_null()) return &*it;
  }
  return nullptr;
}

[[nodiscard]] optional<double> number_field(const json& j, std::initializer_list<const char*> names,
                                            const string& where)
{
  const json* v = field(j, names);
  if (!v) return nullopt;
  if (!v->is_number())
    throw invalid_input(std::format("{}: '{}' must be a number", where, *names.begin()));
  return v->get<double>();
}

[[nodiscard]] layer parse_layer(const json& j, const string& where)
{
  if (!j.is_object()) throw invalid_input(where + ": layer is not an object");

  layer l;
  const json* id = field(j, { "track_id", "songId", "song_id" });
  if (!id || !id->is_string())
    throw invalid_input(where + ": layer needs a string 'track_id'");
  l.track_id = id->get<string>();

  const json* stem = field(j, { "stem" });
  if (!stem || !stem->is_string())
    throw invalid_input(where + ": layer needs a string 'stem'");
  auto role = parse_stem_role(stem->get<string>());
  if (!role)
    throw invalid_input(std::format("{}: unknown stem '{}'", where, stem->get<string>()));
  l.stem = *role;

  l.gain_db = number_field(j, { "gain_db", "volume_db" }, where);
  if (l.gain_db && !std::isfinite(*l.gain_db))
    throw invalid_input(where + ": gain_db is not finite");

  if (const json* bar = field(j, { "start_bar" })) {
    if (!bar->is_number_integer() || bar->get<int>() < 0)
      throw invalid_input(where + ": start_bar must be a non-negative integer");
    l.start_bar = bar->get<int>();
  }
  return l;
}

[[nodiscard]] section parse_section(const json& j, size_t index)
{
  const string where = std::format("section {}", index + 1);
  if (!j.is_object()) throw invalid_input(where + ": not an object");

  section s;
  auto duration = number_field(j, { "duration_sec" }, where);
  if (!duration || !(*duration > 0.0) || !std::isfinite(*duration))
    throw invalid_input(where + ": duration_sec must be a positive number");
  s.duration_sec = *duration;

  if (const json* t = field(j, { "transition" })) {
    if (!t->is_string()) throw invalid_input(where + ": transition must be a string");
    s.transition = parse_transition_style(t->get<string>());
  }

  if (const json* bars = field(j, { "transition_bars" })) {
    if (!bars->is_number_integer() || bars->get<int>() < 0)
      throw invalid_input(where + ": transition_bars must be a non-negative integer");
    s.transition_bars = bars->get<int>();
  }

  if (const json* d = field(j, { "description" }); d && d->is_string())
    s.description = d->get<string>();

  if (const json* layers = field(j, { "layers" })) {
    if (!layers->is_array()) throw invalid_input(where + ": layers must be an array");
    for (const auto& jl: *layers) s.layers.push_back(parse_layer(jl, where));
  }
  return s;
}

}

masterplan parse_masterplan(const json& root)
{
  if (!root.is_object()) throw invalid_input("masterplan: root is not an object");

  // Planner output may wrap the plan in a "masterplan" object.
  const json& j = (root.contains("masterplan") && root["masterplan"].is_object())
    ? root["masterplan"] : root;

  masterplan plan;

  const json* sections = field(j, { "sections", "timeline" });
  if (!sections || !sections->is_array())
    throw invalid_input("masterplan: missing 'sections' array");
  for (size_t i = 0; i < sections->size(); ++i)
    plan.sections.push_back(parse_section((*sections)[i], i));

  if (const json* g = field(j, { "global", "global_settings" }); g && g->is_object()) {
    plan.target_bpm = number_field(*g, { "targetBPM", "target_bpm" }, "global");
    if (plan.target_bpm && !(*plan.target_bpm > 0.0))
      throw invalid_input("global: targetBPM must be > 0");

    if (const json* k = field(*g, { "targetKey", "target_key" })) {
      if (!k->is_string()) throw invalid_input("global: targetKey must be a string");
      auto parsed = parse_key(k->get<string>());
      if (!parsed) throw invalid_input("global: " + parsed.error());
      plan.target_key = *parsed;
    }
  }

  return plan;
}

masterplan load_masterplan(const std::filesystem::path& file)
{
  std::ifstream in;
  in.exceptions(std::ifstream::failbit | std::ifstream::badbit);
  in.open(file);

  json j;
  in >> j;
  return parse_masterplan(j);
}

std::set<stem_key> referenced_stems(const masterplan& plan)
{
  std::set<stem_key> out;
  for (const auto& s: plan.sections)
    for (const auto& l: s.layers)
      out.emplace(l.track_id, l.stem);
  return out;
}

}
