/**
 * @file system.hpp
 * @brief System utilities: executable lookup, files and paths
 *
 * @details Provides:
 *
 *          - PATH search for the encoder executable
 *
 *          - Regular-file checks used by input validation
 *
 *          - Temporary directory creation for preview output
 *
 *          - Output naming and time formatting utilities
 *
 * @note POSIX only (access(2), mkdtemp(3)).
 */

#ifndef YTP_FORGE_SYSTEM_HPP
#define YTP_FORGE_SYSTEM_HPP

#include <optional>
#include <string>

namespace ytp_forge {

// **---- Executables ----**

/**
 * @brief Locate an executable.
 *
 * @note A name containing '/' is checked as a path; otherwise each entry of
 *       PATH is searched in order, like execvp(3).
 *
 * @param name Bare name ("ffmpeg") or path ("/opt/ffmpeg/bin/ffmpeg")
 * @return Full path of an executable regular file, or std::nullopt
 */
std::optional<std::string> find_executable(const std::string &name);

// **---- Files ----**

/**
 * @brief Check that a path names an existing regular file.
 * @note Symlinks are followed. Empty paths are never regular files.
 */
bool is_regular_file(const std::string &path);

/**
 * @brief Create a fresh private directory under the system temp dir.
 *
 * @param prefix Directory name prefix, e.g. "ytp_preview_"
 * @return Path of the new directory, or std::nullopt on failure
 */
std::optional<std::string> make_temp_dir(const std::string &prefix);

/**
 * @brief Name for a generated video.
 * @param source Source video path
 * @return "<stem>_ytp_<unix seconds>.mp4"
 */
std::string default_output_name(const std::string &source);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace ytp_forge

#endif // YTP_FORGE_SYSTEM_HPP
