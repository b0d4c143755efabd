/**
 * @file command_builder.hpp
 * @brief Turns a CompiledPlan into an ffmpeg argument vector
 *
 * @details Argument order for both modes:
 *
 *          1. -y, then (preview only) -ss 0 -t <duration>
 *
 *          2. -i <primary>                        -> slot 0
 *
 *          3. -i <extra> per ordered extra input   -> slots 1..N
 *
 *          4. -filter_complex <graph> -map [vout] -map [aout]
 *
 *          5. encoding parameters, then the destination path
 *
 * @note Step 3 order is what makes the compiler's slot numbers valid.
 */

#ifndef YTP_FORGE_COMMAND_BUILDER_HPP
#define YTP_FORGE_COMMAND_BUILDER_HPP

#include <string>
#include <vector>

#include "fragment_compiler.hpp"

namespace ytp_forge {

/**
 * @enum RunMode
 * @brief Bounded preview or full-length generation.
 */
enum class RunMode { Preview, Full };

/// "preview" / "full"
const char *mode_name(RunMode mode);

/**
 * @struct EncodeSettings
 * @brief Mode-specific parameters of the command.
 */
struct EncodeSettings {
  std::string executable = "ffmpeg"; //< Encoder binary (name or path)
  double duration = 0.0;             //< Preview length in seconds
  std::string video_codec = "libx264";
  std::string preset = "fast"; //< x264 preset
  int crf = 20;                //< x264 constant rate factor
  std::string audio_codec = "aac";
  std::string audio_bitrate; //< Empty = encoder default
  bool shortest = false;     //< Stop at the shortest output stream

  /// Fast, low quality, bounded duration (reads Config)
  static EncodeSettings preview_defaults();

  /// Slower, higher quality, higher audio bitrate (reads Config)
  static EncodeSettings full_defaults();
};

/**
 * @struct CommandLine
 * @brief A ready-to-run invocation plus the paths the runner validates.
 */
struct CommandLine {
  std::string executable;                //< argv[0] as requested
  std::vector<std::string> args;         //< Arguments after argv[0]
  std::string primary_input;             //< Must exist before spawning
  std::vector<std::string> extra_inputs; //< Must exist before spawning
  std::string output_path;               //< Destination artifact
};

/**
 * @brief Build the encoder invocation for a plan.
 *
 * @param mode Preview or full generation
 * @param primary_input Source video (slot 0)
 * @param plan Compiled effects
 * @param output_path Destination file
 * @param settings Encoder and mode parameters
 * @return Invocation; no -filter_complex/-map when the graph is empty
 */
CommandLine build_arguments(RunMode mode, const std::string &primary_input,
                            const CompiledPlan &plan,
                            const std::string &output_path,
                            const EncodeSettings &settings);

/**
 * @brief Render an invocation as a shell command a user can paste.
 * @note Arguments with shell metacharacters are single-quoted.
 */
std::string format_command_line(const CommandLine &cmd);

} // namespace ytp_forge

#endif // YTP_FORGE_COMMAND_BUILDER_HPP
