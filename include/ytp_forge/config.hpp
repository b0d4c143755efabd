/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/ytp_forge.env for detailed documentation of each
 *          parameter.
 *
 * @note Only the command-line front end and the EncodeSettings defaults read
 *       these values. Core components receive explicit parameters.
 */

#ifndef YTP_FORGE_CONFIG_HPP
#define YTP_FORGE_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

namespace ytp_forge {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable contents or default
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- ENCODER ----**

/// Encoder executable: bare name (searched on PATH) or explicit path
inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

inline const std::string &video_codec() {
  static std::string val = get_env_string("VIDEO_CODEC", "libx264");
  return val;
}

inline const std::string &audio_codec() {
  static std::string val = get_env_string("AUDIO_CODEC", "aac");
  return val;
}

// **---- PREVIEW MODE ----**

/**
 * @brief Length of processed media in preview mode (seconds)
 * @note Bounds the encoded media, not the encoder's wall-clock run time
 */
inline double preview_duration() {
  static double val = get_env_double("PREVIEW_DURATION", 10.0);
  return val;
}

inline const std::string &preview_preset() {
  static std::string val = get_env_string("PREVIEW_PRESET", "veryfast");
  return val;
}

inline int preview_crf() {
  static int val = get_env_int("PREVIEW_CRF", 28);
  return val;
}

// **---- FULL GENERATION MODE ----**

inline const std::string &full_preset() {
  static std::string val = get_env_string("FULL_PRESET", "fast");
  return val;
}

inline int full_crf() {
  static int val = get_env_int("FULL_CRF", 20);
  return val;
}

/// Target AAC bitrate for full generation, in ffmpeg notation
inline const std::string &full_audio_bitrate() {
  static std::string val = get_env_string("FULL_AUDIO_BITRATE", "192k");
  return val;
}

// **---- RUNTIME ----**

/**
 * @brief Seed for asset selection and probability gates
 * @note 0 = seed from std::random_device (runs are not reproducible)
 */
inline uint32_t random_seed() {
  static uint32_t val =
      static_cast<uint32_t>(std::stoul(get_env_string("RANDOM_SEED", "0")));
  return val;
}

/**
 * @brief Capacity of the queue between the output reader and the log sink
 * @note The reader blocks once this many lines are pending
 */
inline int line_channel_capacity() {
  static int val = get_env_int("LINE_CHANNEL_CAPACITY", 256);
  return val;
}

/// Default directory for generated videos
inline const std::string &output_dir() {
  static std::string val = get_env_string("OUTPUT_DIR", "outputs");
  return val;
}

} // namespace Config
} // namespace ytp_forge

#endif // YTP_FORGE_CONFIG_HPP
