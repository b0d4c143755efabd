/**
 * @file command_builder.cpp
 * @brief ffmpeg argument vector construction
 */

#include "ytp_forge/command_builder.hpp"

#include <cctype>

#include <fmt/core.h>

#include "ytp_forge/config.hpp"
#include "ytp_forge/types.hpp"

namespace ytp_forge {

// **---- Internal Helpers ----**

namespace {

bool is_shell_safe(const std::string &arg) {
  if (arg.empty())
    return false;
  for (unsigned char c : arg) {
    bool ok = std::isalnum(c) || c == '_' || c == '-' || c == '.' ||
              c == '/' || c == ':' || c == ',' || c == '=' || c == '+' ||
              c == '@' || c == '%';
    if (!ok)
      return false;
  }
  return true;
}

std::string shell_quote(const std::string &arg) {
  if (is_shell_safe(arg))
    return arg;
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += "'";
  return out;
}

} // anonymous namespace

const char *mode_name(RunMode mode) {
  return mode == RunMode::Preview ? "preview" : "full";
}

// **---- EncodeSettings ----**

EncodeSettings EncodeSettings::preview_defaults() {
  EncodeSettings s;
  s.executable = Config::ffmpeg_bin();
  s.duration = Config::preview_duration();
  s.video_codec = Config::video_codec();
  s.preset = Config::preview_preset();
  s.crf = Config::preview_crf();
  s.audio_codec = Config::audio_codec();
  s.shortest = true;
  return s;
}

EncodeSettings EncodeSettings::full_defaults() {
  EncodeSettings s;
  s.executable = Config::ffmpeg_bin();
  s.video_codec = Config::video_codec();
  s.preset = Config::full_preset();
  s.crf = Config::full_crf();
  s.audio_codec = Config::audio_codec();
  s.audio_bitrate = Config::full_audio_bitrate();
  return s;
}

// **---- Command Construction ----**

CommandLine build_arguments(RunMode mode, const std::string &primary_input,
                            const CompiledPlan &plan,
                            const std::string &output_path,
                            const EncodeSettings &settings) {
  CommandLine cmd;
  cmd.executable = settings.executable;
  cmd.primary_input = primary_input;
  cmd.extra_inputs = plan.ordered_extra_inputs;
  cmd.output_path = output_path;

  auto &a = cmd.args;
  a.push_back("-y");
  if (mode == RunMode::Preview) {
    a.insert(a.end(), {"-ss", "0", "-t", fmt::format("{}", settings.duration)});
  }
  a.insert(a.end(), {"-i", primary_input});

  /// Slot i (i >= 1) is the i-th -i after the primary
  for (const auto &extra : plan.ordered_extra_inputs) {
    a.insert(a.end(), {"-i", extra});
  }

  if (!plan.graph_description.empty()) {
    a.insert(a.end(), {"-filter_complex", plan.graph_description, "-map",
                       TERMINAL_VIDEO_LABEL, "-map", TERMINAL_AUDIO_LABEL});
  }

  a.insert(a.end(), {"-c:v", settings.video_codec, "-preset", settings.preset,
                     "-crf", std::to_string(settings.crf), "-c:a",
                     settings.audio_codec});
  if (!settings.audio_bitrate.empty()) {
    a.insert(a.end(), {"-b:a", settings.audio_bitrate});
  }
  if (settings.shortest) {
    a.push_back("-shortest");
  }
  a.push_back(output_path);
  return cmd;
}

std::string format_command_line(const CommandLine &cmd) {
  std::string out = shell_quote(cmd.executable);
  for (const auto &arg : cmd.args) {
    out += ' ';
    out += shell_quote(arg);
  }
  return out;
}

} // namespace ytp_forge
