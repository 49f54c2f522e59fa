// Command-line tool to render stem mashups from a masterplan

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <execution>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <print>
#include <ranges>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <getopt.h>
#include <nlohmann/json.hpp>
#include <samplerate.h>

#include "clmash/analysis.hpp"
#include "clmash/audio_io.hpp"
#include "clmash/error.hpp"
#include "clmash/job.hpp"
#include "clmash/key.hpp"
#include "clmash/masterplan.hpp"
#include "clmash/render.hpp"
#include "clmash/stretch.hpp"

namespace {

using clmash::track_audio;
using std::cerr, std::cout;
using std::expected, std::unexpected;
using std::filesystem::path;
using std::is_floating_point_v, std::is_integral_v, std::is_same_v;
using std::optional, std::nullopt;
using std::println;
namespace ranges { using namespace std::ranges; }
using std::runtime_error;
using std::string, std::string_view;
using std::vector;

template<typename T>
requires (is_integral_v<T> || is_floating_point_v<T>)
[[nodiscard]] expected<T, string> parse_number(string_view s)
{
  static_assert(!is_same_v<T, bool>, "parse_number<bool> is not supported");
  T v{};
  const char* b = s.data();
  const char* e = b + s.size();

  auto to_msg = [](std::errc ec) -> string {
    assert(ec != std::errc());
    if (ec == std::errc::invalid_argument) return "not a number";
    if (ec == std::errc::result_out_of_range) return "out of range";
    return "parse error";
  };

  std::from_chars_result r = [&]{
    if constexpr (is_floating_point_v<T>)
      return std::from_chars(b, e, v, std::chars_format::general);
    return std::from_chars(b, e, v);
  }();

  constexpr std::errc ok{};
  if (r.ec == ok) {
    if (r.ptr != e) return unexpected(string("trailing characters"));
    return v;
  }
  return unexpected(to_msg(r.ec));
}

struct cli_options {
  optional<path>          plan_path;
  optional<path>          out_path;
  optional<uint32_t>      sample_rate;
  optional<size_t>        channels;
  optional<int>           vocal_limit;
  optional<int>           music_limit;
  optional<double>        bpm;
  optional<clmash::key>   target_key;
  int                     src_type = SRC_SINC_BEST_QUALITY;
  bool                    verbose  = false;
};

void usage()
{
  cerr << "Usage: clmash <command> <file> [options]\n"
          "Commands:\n"
          "  render <job.json>    Render the job's masterplan to a WAV file\n"
          "  plan <job.json>      Print target key, tempo and per-track pitch shifts\n"
          "  analyze <audio>      Print beat grid, tempo, key and loudness as JSON\n"
          "Options:\n"
          "  --plan <file>        Masterplan JSON (default: the job's inline masterplan)\n"
          "  --out <file>         Output WAV (default: mashup.wav)\n"
          "  --rate <hz>          Mix sample rate (overrides the job)\n"
          "  --channels <n>       Mix channel count (overrides the job)\n"
          "  --vocal-limit <n>    Max |semitones| shift for vocal stems\n"
          "  --music-limit <n>    Max |semitones| shift for instrumental stems\n"
          "  --bpm <value>        Force mix BPM\n"
          "  --key <key>          render, plan: force target key (e.g. Am, F#, \"Eb major\")\n"
          "                       analyze: report this key instead of detecting one\n"
          "  --fast               Linear resampling when decoding stems\n"
          "  --verbose            Print progress\n";
}

[[nodiscard]] expected<cli_options, string> parse_options(int argc, char** argv)
{
  cli_options opts;

  int opt;
  int option_index = 0;
  static struct option long_options[] = {
    {"plan",        required_argument, nullptr, 'p'},
    {"out",         required_argument, nullptr, 'o'},
    {"rate",        required_argument, nullptr, 'r'},
    {"channels",    required_argument, nullptr, 'c'},
    {"vocal-limit", required_argument, nullptr, 'v'},
    {"music-limit", required_argument, nullptr, 'm'},
    {"bpm",         required_argument, nullptr, 'b'},
    {"key",         required_argument, nullptr, 'k'},
    {"fast",        no_argument,       nullptr, 'f'},
    {"verbose",     no_argument,       nullptr, 'V'},
    {nullptr,       0,                 nullptr,  0 }
  };

  auto positive = []<typename T>(expected<T, string> v, string_view name) -> expected<T, string> {
    if (!v) return unexpected(std::format("Invalid {} value: {}", name, v.error()));
    if (*v <= 0) return unexpected(std::format("Invalid {} value: must be > 0", name));
    return *v;
  };
  auto limit = [](expected<int, string> v, string_view name) -> expected<int, string> {
    if (!v) return unexpected(std::format("Invalid {} value: {}", name, v.error()));
    if (*v < 0 || *v > 12) return unexpected(std::format("Invalid {} value: must be 0..12", name));
    return *v;
  };

  // Start parsing after "<command> <file>"
  optind = 3;
  while ((opt = getopt_long(argc, argv, "", long_options, &option_index)) != -1) {
    switch (opt) {
      case 'p': opts.plan_path = path(optarg); break;
      case 'o': opts.out_path  = path(optarg); break;
      case 'r': {
        auto v = positive(parse_number<uint32_t>(optarg), "--rate");
        if (!v) return unexpected(v.error());
        opts.sample_rate = *v;
        break;
      }
      case 'c': {
        auto v = positive(parse_number<size_t>(optarg), "--channels");
        if (!v) return unexpected(v.error());
        opts.channels = *v;
        break;
      }
      case 'v': {
        auto v = limit(parse_number<int>(optarg), "--vocal-limit");
        if (!v) return unexpected(v.error());
        opts.vocal_limit = *v;
        break;
      }
      case 'm': {
        auto v = limit(parse_number<int>(optarg), "--music-limit");
        if (!v) return unexpected(v.error());
        opts.music_limit = *v;
        break;
      }
      case 'b': {
        auto v = positive(parse_number<double>(optarg), "--bpm");
        if (!v) return unexpected(v.error());
        opts.bpm = *v;
        break;
      }
      case 'k': {
        auto k = clmash::parse_key(optarg);
        if (!k) return unexpected("Invalid --key: " + k.error());
        opts.target_key = *k;
        break;
      }
      case 'f': opts.src_type = SRC_LINEAR; break;
      case 'V': opts.verbose = true; break;
      default:
        return unexpected(string("unrecognized option"));
    }
  }

  if (optind < argc)
    return unexpected(std::format("Unexpected argument: {}", argv[optind]));

  return opts;
}

[[nodiscard]] clmash::render_options
make_render_options(const clmash::job& job, const cli_options& cli)
{
  clmash::render_options ro;
  ro.sample_rate  = cli.sample_rate.value_or(job.sample_rate);
  ro.channels     = cli.channels.value_or(job.channels);
  ro.limits.vocal = cli.vocal_limit.value_or(job.limits.vocal);
  ro.limits.music = cli.music_limit.value_or(job.limits.music);
  ro.bpm          = cli.bpm;
  ro.target_key   = cli.target_key;
  if (cli.verbose)
    ro.log = [](string_view line) { println(cerr, "{}", line); };
  return ro;
}

[[nodiscard]] clmash::masterplan resolve_plan(const clmash::job& job, const cli_options& cli)
{
  if (cli.plan_path) return clmash::load_masterplan(*cli.plan_path);
  if (job.plan) return *job.plan;
  throw clmash::invalid_input("No masterplan: pass --plan or add 'masterplan' to the job file");
}

// Decode every referenced stem and bring it to the mix rate. Files are
// independent, so they are decoded in parallel.
[[nodiscard]] clmash::stem_buffers
load_stems(const clmash::job& job, const std::set<clmash::stem_key>& needed,
           uint32_t sample_rate, int src_type)
{
  struct request {
    clmash::stem_key key;
    path file;
  };

  vector<request> requests;
  for (const auto& sk: needed) {
    auto track = ranges::find_if(job.tracks, [&](const clmash::job_track& t) {
      return t.analysis.id == sk.first;
    });
    if (track == job.tracks.end())
      throw clmash::invalid_input("layer references unknown track '" + sk.first + "'");
    auto file = track->stems.find(sk.second);
    if (file == track->stems.end())
      throw clmash::invalid_input(
        std::format("track '{}' has no {} stem", sk.first, clmash::to_string(sk.second))
      );
    requests.push_back({ sk, file->second });
  }

  vector<expected<track_audio, string>> decoded(requests.size());
  std::transform(std::execution::par, requests.begin(), requests.end(), decoded.begin(),
    [&](const request& r) -> expected<track_audio, string> {
      return clmash::load_track(r.file).and_then(
        [&](track_audio audio) {
          return clmash::resample(std::move(audio), sample_rate, src_type);
        }
      ).transform_error(
        [&](string error_msg) {
          return r.file.generic_string() + ": " + error_msg;
        }
      );
    }
  );

  clmash::stem_buffers stems;
  for (size_t i = 0; i < requests.size(); ++i) {
    if (!decoded[i]) throw runtime_error(decoded[i].error());
    stems.emplace(requests[i].key, std::move(*decoded[i]));
  }
  return stems;
}

int run_render(const path& jobfile, const cli_options& cli)
{
  const auto job  = clmash::load_job(jobfile);
  const auto plan = resolve_plan(job, cli);
  const auto ro   = make_render_options(job, cli);
  const auto tracks = clmash::analyses(job);

  if (cli.verbose) println(cerr, "decoding stems at {} Hz", ro.sample_rate);
  auto stems = load_stems(job, clmash::referenced_stems(plan), ro.sample_rate, cli.src_type);

  const clmash::rubberband_stretcher stretcher;
  auto result = clmash::render_mashup(tracks, std::move(stems), plan, stretcher, ro);

  const path out_path = cli.out_path.value_or(path("mashup.wav"));
  clmash::write_wav(result.audio, out_path);

  println(cout, "Rendered {} sections, {} frames ({} Hz, {} ch) to {}",
          result.sections, result.audio.frames(), result.audio.sample_rate,
          result.audio.channels(), out_path.generic_string());
  println(cout, "Target key {} ({}), {:.2f} BPM",
          clmash::to_string(result.plan.target_key),
          clmash::camelot(result.plan.target_key), result.plan.target_bpm);

  if (cli.verbose) {
    println(cerr, "prepared stems: {}, skipped beat slices: {}",
            result.prepared_stems, result.skipped_slices);
    println(cerr, "peak before normalization: {:.2f} dBFS",
            result.peak_before_normalize > 0.f
              ? clmash::ampdb(result.peak_before_normalize) : -INFINITY);
    if (auto lufs = clmash::measure_lufs(result.audio))
      println(cerr, "integrated loudness: {:.1f} LUFS", *lufs);
    else
      println(cerr, "Warning: {}", lufs.error());
  }

  return EXIT_SUCCESS;
}

int run_plan(const path& jobfile, const cli_options& cli)
{
  const auto job  = clmash::load_job(jobfile);
  const auto ro   = make_render_options(job, cli);
  const auto tracks = clmash::analyses(job);

  clmash::masterplan plan;
  if (cli.plan_path || job.plan) plan = resolve_plan(job, cli);

  const auto rp = clmash::make_render_plan(tracks, plan, ro);

  println(cout, "Target key: {} ({})", clmash::to_string(rp.target_key),
          clmash::camelot(rp.target_key));
  println(cout, "Target BPM: {:.2f}", rp.target_bpm);
  println(cout, "Shift limits: vocals ±{}, music ±{}",
          rp.shifts.vocal_shift_limit, rp.shifts.music_shift_limit);
  println(cout, "{:<16} {:>5} {:>7} {:>7} {:>7} {:>8}",
          "track", "key", "bpm", "shift", "vocals", "music");
  for (const auto& t: tracks) {
    println(cout, "{:<16} {:>5} {:>7.2f} {:>+7} {:>+7} {:>+8}",
            t.id, clmash::to_string(t.track_key), t.bpm,
            rp.shifts.shifts.at(t.id),
            rp.shifts.applied_shift(t.id, clmash::stem_role::vocals),
            rp.shifts.applied_shift(t.id, clmash::stem_role::other));
  }
  return EXIT_SUCCESS;
}

int run_analyze(const path& audio_file, const cli_options& cli)
{
  auto audio = clmash::load_track(audio_file);
  if (!audio) throw runtime_error(audio.error());

  if (cli.verbose)
    println(cerr, "analyzing {} ({:.1f}s, {} Hz)", audio_file.generic_string(),
            audio->duration(), audio->sample_rate);

  const auto report = clmash::analyze_track(*audio, cli.target_key);
  println(cout, "{}", clmash::report_json(report).dump(2));

  if (report.grid.bpm_confidence < 0.5)
    println(cerr, "Warning: low BPM confidence ({:.2f})", report.grid.bpm_confidence);
  if (!report.track_key)
    println(cerr, "Warning: no tonal content, key not detected");
  else if (report.key_confidence && *report.key_confidence < clmash::low_key_confidence)
    println(cerr, "Warning: low key confidence ({:.2f})", *report.key_confidence);

  return EXIT_SUCCESS;
}

}

int main(int argc, char** argv)
{
  if (argc < 3) {
    usage();
    return EXIT_FAILURE;
  }

  const string_view command = argv[1];
  const path file = argv[2];

  auto opts = parse_options(argc, argv);
  if (!opts) {
    println(cerr, "{}", opts.error());
    return EXIT_FAILURE;
  }

  try {
    if (command == "render")  return run_render(file, *opts);
    if (command == "plan")    return run_plan(file, *opts);
    if (command == "analyze") return run_analyze(file, *opts);
  } catch (const std::exception& e) {
    println(cerr, "error: {}", e.what());
    return EXIT_FAILURE;
  }

  println(cerr, "Unknown command: {}", command);
  usage();
  return EXIT_FAILURE;
}
