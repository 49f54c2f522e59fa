#include "render.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <execution>
#include <expected>
#include <format>
#include <functional>
#include <map>
#include <ranges>
#include <stdexcept>
#include <utility>

#include "error.hpp"

namespace clmash {

namespace {

namespace ranges { using namespace std::ranges; }
namespace views { using namespace std::views; }
using std::expected, std::unexpected;
using std::runtime_error;
using std::span;
using std::string, std::string_view;
using std::vector;

struct prepared {
  track_audio audio;
  align_stats stats;
};

// Exceptions cannot cross a parallel algorithm boundary, so each task
// carries its failure back and it is rethrown on the calling thread.
using prepared_or_error = expected<prepared, std::exception_ptr>;

void progress(const render_options& options, string_view line)
{ if (options.log) options.log(line); }

}

render_plan
make_render_plan(span<const track_analysis> tracks, const masterplan& plan,
                 const render_options& options)
{
  render_plan rp;

  if (options.target_key) {
    rp.target_key = *options.target_key;
  } else if (plan.target_key) {
    rp.target_key = *plan.target_key;
  } else {
    auto keys = tracks | views::transform(&track_analysis::track_key)
              | ranges::to<vector<key>>();
    rp.target_key = choose_target_key(keys);
  }

  if (options.bpm) {
    rp.target_bpm = *options.bpm;
  } else if (plan.target_bpm) {
    rp.target_bpm = *plan.target_bpm;
  } else {
    if (tracks.empty()) throw invalid_input("No tracks to compute default BPM.");
    const auto bpms = tracks | views::transform(&track_analysis::bpm);
    rp.target_bpm = ranges::fold_left(bpms, 0.0, std::plus<double>{}) / tracks.size();
  }
  if (!(rp.target_bpm > 0.0) || !std::isfinite(rp.target_bpm))
    throw invalid_input(std::format("invalid target BPM {}", rp.target_bpm));

  std::map<string, key> per_track;
  for (const auto& t: tracks) per_track.emplace(t.id, t.track_key);
  rp.shifts = plan_shifts(per_track, rp.target_key, options.limits);

  return rp;
}

vector<double> reference_grid(size_t beats, double bpm)
{
  const double beat_sec = 60.0 / bpm;
  return views::iota(size_t(0), beats)
       | views::transform([beat_sec](size_t k) { return static_cast<double>(k) * beat_sec; })
       | ranges::to<vector<double>>();
}

track_audio
prepare_stem(const track_audio& stem, const track_analysis& track,
             double target_bpm, int semitones, stem_role role,
             const stretcher& stretch, const align_options& align,
             align_stats* stats)
{
  const auto grid = reference_grid(track.beats_sec.size(), target_bpm);
  track_audio aligned = align_to_grid(stem, track.beats_sec, grid, stretch, align, stats);

  if (semitones == 0) return aligned;

  auto shifted = stretch.pitch_shift(aligned, semitones, role);
  if (!shifted)
    throw runtime_error(
      std::format("{}/{}: pitch shift by {} failed: {}",
                  track.id, to_string(role), semitones, shifted.error())
    );
  return std::move(*shifted);
}

render_result
render_mashup(span<const track_analysis> tracks, stem_buffers sources,
              const masterplan& plan, const stretcher& stretch,
              const render_options& options)
{
  if (plan.sections.empty()) throw invalid_input("masterplan has no sections");
  if (options.sample_rate == 0 || options.channels == 0)
    throw invalid_input("render needs a sample rate and at least one channel");

  std::map<string, const track_analysis*> by_id;
  for (const auto& t: tracks) {
    if (!by_id.emplace(t.id, &t).second)
      throw invalid_input("duplicate track id '" + t.id + "'");
  }

  render_result result;
  result.plan = make_render_plan(tracks, plan, options);
  const double bpm = result.plan.target_bpm;

  progress(options, std::format("target key {} ({}), {:.2f} BPM",
      to_string(result.plan.target_key), camelot(result.plan.target_key), bpm));

  // Validate every reference before any heavy work starts.
  const auto needed = referenced_stems(plan) | ranges::to<vector<stem_key>>();
  for (const auto& [track_id, role]: needed) {
    auto it = by_id.find(track_id);
    if (it == by_id.end())
      throw invalid_input("layer references unknown track '" + track_id + "'");
    if (it->second->beats_sec.size() < 2)
      throw insufficient_beats(
        std::format("track '{}' has {} beats; alignment needs at least 2",
                    track_id, it->second->beats_sec.size())
      );
    auto src = sources.find({ track_id, role });
    if (src == sources.end())
      throw invalid_input(std::format("missing stem {}/{}", track_id, to_string(role)));
    if (src->second.sample_rate != options.sample_rate)
      throw invalid_input(
        std::format("stem {}/{} is at {} Hz, expected {} Hz", track_id,
                    to_string(role), src->second.sample_rate, options.sample_rate)
      );
  }

  progress(options, std::format("preparing {} stems", needed.size()));

  const stem_buffers& src = sources;
  vector<prepared_or_error> prepared_exp(needed.size());
  std::transform(std::execution::par, needed.begin(), needed.end(), prepared_exp.begin(),
    [&](const stem_key& sk) -> prepared_or_error {
      try {
        const auto& [track_id, role] = sk;
        const track_analysis& track = *by_id.at(track_id);
        prepared p;
        p.audio = prepare_stem(
          src.at(sk), track, bpm,
          result.plan.shifts.applied_shift(track_id, role), role,
          stretch, options.align, &p.stats
        );
        return p;
      } catch (...) {
        return unexpected(std::current_exception());
      }
    }
  );
  sources.clear();

  stem_buffers stems;
  for (size_t i = 0; i < needed.size(); ++i) {
    if (!prepared_exp[i]) std::rethrow_exception(prepared_exp[i].error());
    result.skipped_slices += prepared_exp[i]->stats.skipped;
    stems.emplace(needed[i], std::move(prepared_exp[i]->audio));
  }
  result.prepared_stems = stems.size();

  master_mix mix;
  for (size_t i = 0; i < plan.sections.size(); ++i) {
    const section& sec = plan.sections[i];
    progress(options, std::format("section {}/{}: {:.2f}s, {} layers, {}",
        i + 1, plan.sections.size(), sec.duration_sec, sec.layers.size(),
        to_string(sec.transition)));

    mix.append(
      render_section(sec, stems, options.sample_rate, options.channels, bpm),
      sec.transition, sec.transition_bars.value_or(default_transition_bars), bpm
    );
  }

  result.audio = mix.finalize();
  result.peak_before_normalize = mix.peak_before_normalize();
  result.sections = mix.sections();
  return result;
}

}
