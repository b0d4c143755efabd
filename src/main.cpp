/**
 * @file main.cpp
 * @brief Entry point for the ytp_forge command-line tool
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - list: print the effect catalog
 *
 *          - preview: short, fast render into a temporary directory
 *
 *          - generate: full-length render into the output directory
 *
 * @note Encoder defaults come from the environment (see
 *       config/ytp_forge.env). Set RANDOM_SEED for reproducible runs.
 */

#include <algorithm>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "ytp_forge/asset_pool.hpp"
#include "ytp_forge/config.hpp"
#include "ytp_forge/effect_catalog.hpp"
#include "ytp_forge/logging.hpp"
#include "ytp_forge/pipeline.hpp"
#include "ytp_forge/random_source.hpp"
#include "ytp_forge/system.hpp"

using namespace ytp_forge;

namespace {

// **---- Usage ----**

void print_usage() {
  LOG_WARN("Usage: ./ytp_forge list\n"
           "       ./ytp_forge preview  <source> [options]\n"
           "       ./ytp_forge generate <source> [options]\n"
           "Options:\n"
           "  --effect KEY[:PROB[:LEVEL]]  enable an effect (repeatable)\n"
           "  --overlay PATH               override asset for overlays\n"
           "  --assets POOL=DIR            asset directory (repeatable)\n"
           "  --duration SEC               preview duration\n"
           "  --output PATH                output file\n"
           "  --output-dir DIR             output directory (generate)");
}

void print_catalog() {
  fmt::print("{:<16} {:<26} {:>8} {:>8}\n", "KEY", "NAME", "DEFAULT", "MAX");
  fmt::print("{:-<16} {:-<26} {:-<8} {:-<8}\n", "", "", "", "");
  for (const auto &d : effect_catalog()) {
    fmt::print("{:<16} {:<26} {:>8.2f} {:>8.2f}\n", d.id, d.display_name,
               d.default_intensity, d.max_intensity);
  }
}

// **---- Argument Parsing ----**

struct CliOptions {
  RunMode mode = RunMode::Preview;
  std::string source;
  std::string override_path;
  EffectSelections selections;
  std::map<std::string, std::string> asset_dirs;
  double duration = -1; //< < 0 = Config::preview_duration()
  std::string output;
  std::string output_dir;
};

/// Parse "KEY[:PROB[:LEVEL]]"; returns false on an unknown key
bool parse_effect(const std::string &arg, EffectSelections &selections) {
  size_t c1 = arg.find(':');
  std::string id = arg.substr(0, c1);

  auto key = find_effect(id);
  if (!key) {
    LOG_ERROR("Unknown effect: {} (run './ytp_forge list')", id);
    return false;
  }

  EffectSelection sel;
  sel.enabled = true;
  sel.intensity = describe(*key).default_intensity;

  if (c1 != std::string::npos) {
    size_t c2 = arg.find(':', c1 + 1);
    sel.probability = std::stod(arg.substr(c1 + 1, c2 - c1 - 1));
    if (c2 != std::string::npos)
      sel.intensity = std::stod(arg.substr(c2 + 1));
  }

  selections[*key] = sel;
  return true;
}

/// Returns false on a usage error (already logged)
bool parse_options(int argc, char *argv[], CliOptions &opts) {
  for (int i = 3; i < argc; ++i) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
      LOG_ERROR("Missing value for {}", flag);
      return false;
    }
    std::string value = argv[++i];

    if (flag == "--effect") {
      if (!parse_effect(value, opts.selections))
        return false;
    } else if (flag == "--overlay") {
      opts.override_path = value;
    } else if (flag == "--assets") {
      size_t eq = value.find('=');
      if (eq == std::string::npos || eq == 0) {
        LOG_ERROR("Expected POOL=DIR, got: {}", value);
        return false;
      }
      opts.asset_dirs[value.substr(0, eq)] = value.substr(eq + 1);
    } else if (flag == "--duration" && opts.mode == RunMode::Preview) {
      opts.duration = std::stod(value);
    } else if (flag == "--output") {
      opts.output = value;
    } else if (flag == "--output-dir" && opts.mode == RunMode::Full) {
      opts.output_dir = value;
    } else {
      LOG_ERROR("Unknown option for {}: {}", mode_name(opts.mode), flag);
      return false;
    }
  }
  return true;
}

// **---- Output Location ----**

/// Resolve the destination file, creating its directory; "" on failure
std::string resolve_output(const CliOptions &opts) {
  namespace fs = std::filesystem;

  if (opts.mode == RunMode::Preview && opts.output.empty()) {
    auto dir = make_temp_dir("ytp_preview_");
    if (!dir) {
      LOG_ERROR("Failed to create preview directory");
      return "";
    }
    return (fs::path(*dir) / "preview.mp4").string();
  }

  fs::path out;
  if (!opts.output.empty()) {
    out = opts.output;
  } else {
    std::string dir =
        opts.output_dir.empty() ? Config::output_dir() : opts.output_dir;
    out = fs::path(dir) / default_output_name(opts.source);
  }

  if (out.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(out.parent_path(), ec);
    if (ec) {
      LOG_ERROR("Failed to create {}: {}", out.parent_path().string(),
                ec.message());
      return "";
    }
  }
  return out.string();
}

int run(const CliOptions &opts) {
  GenerationRequest request;
  request.mode = opts.mode;
  request.source = opts.source;
  request.override_path = opts.override_path;
  request.selections = opts.selections;
  request.pools = load_asset_pools(opts.asset_dirs);
  request.channel_capacity =
      static_cast<size_t>(std::max(1, Config::line_channel_capacity()));

  if (opts.mode == RunMode::Preview) {
    request.settings = EncodeSettings::preview_defaults();
    if (opts.duration >= 0)
      request.settings.duration = opts.duration;
  } else {
    request.settings = EncodeSettings::full_defaults();
  }

  request.output_path = resolve_output(opts);
  if (request.output_path.empty())
    return 1;

  Mt19937Source rng(Config::random_seed());
  LOG_INFO("ytp_forge - {} mode", mode_name(opts.mode));
  LOG_INFO("Source: {}", opts.source);
  LOG_INFO("Output: {}", request.output_path);
  LOG_INFO("Seed: {}", rng.seed());

  GenerationPipeline pipeline(std::move(request), rng);
  RunStatus status = pipeline.run(
      [](const std::string &line) { LOG_CHILD("ffmpeg", line); });

  if (!status.ok()) {
    LOG_ERROR("{}", status.message);
    LOG_WARN("Tip: rerun the logged FFmpeg command by hand to see the full "
             "error output.");
    return 1;
  }
  return 0;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  if (command == "list") {
    print_catalog();
    return 0;
  }

  CliOptions opts;
  if (command == "preview") {
    opts.mode = RunMode::Preview;
  } else if (command == "generate") {
    opts.mode = RunMode::Full;
  } else {
    print_usage();
    return 1;
  }

  if (argc < 3) {
    print_usage();
    return 1;
  }
  opts.source = argv[2];

  try {
    if (!parse_options(argc, argv, opts)) {
      print_usage();
      return 1;
    }
    return run(opts);
  } catch (const std::exception &e) {
    /// Malformed numbers in arguments or environment variables
    LOG_ERROR("Invalid value: {}", e.what());
    return 1;
  }
}
