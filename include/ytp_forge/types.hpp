/**
 * @file types.hpp
 * @brief Core data types and constants for ytp_forge
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Terminal label and separator constants of the filter graph
 *
 *          - EffectSelection: caller input per effect
 *
 *          - AssetPools: named lists of asset files
 *
 *          - EffectFragment: builder output with local placeholders
 */

#ifndef YTP_FORGE_TYPES_HPP
#define YTP_FORGE_TYPES_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ytp_forge {

// **----- CONSTANTS -----**

/// Terminal video label every fragment writes its video result to
constexpr const char *TERMINAL_VIDEO_LABEL = "[vout]";

/// Terminal audio label every fragment writes its audio result to
constexpr const char *TERMINAL_AUDIO_LABEL = "[aout]";

/// Joins rewritten fragments into one -filter_complex description
constexpr const char *FRAGMENT_SEPARATOR = "; ";

/// Slot 0 is always the primary input; extra inputs start here
constexpr int FIRST_EXTRA_SLOT = 1;

// **----- ASSET POOL NAMES -----**

namespace Pool {
constexpr const char *IMAGES = "images";
constexpr const char *SOUNDS = "sounds";
constexpr const char *ADVERTS = "adverts";
constexpr const char *ERRORS = "errors";
constexpr const char *MEMES = "memes";
constexpr const char *MEME_SOUNDS = "meme_sounds";
constexpr const char *OVERLAY_VIDEOS = "overlay_videos";
} // namespace Pool

// **----- DATA STRUCTURES -----**

/**
 * @struct EffectSelection
 * @brief What the caller asked for one effect.
 * @note probability is in [0, 1]; 1.0 applies the effect without drawing.
 *       intensity may be out of range; builders clamp it.
 */
struct EffectSelection {
  bool enabled = false;     //< Effect is requested at all
  double probability = 1.0; //< Chance the effect is applied
  double intensity = 1.0;   //< Effect strength ("level")
};

/**
 * @brief Pool name -> ordered list of asset paths.
 * @note Populated by gather_assets(); the compiler only reads it.
 */
using AssetPools = std::map<std::string, std::vector<std::string>>;

/**
 * @struct EffectFragment
 * @brief Extra inputs and filter templates contributed by one effect.
 *
 * @attention PLACEHOLDERS:
 *
 * - {0v} / {0a}: primary video / audio stream
 *
 * - {1v} / {1a}, {2v} / {2a}, ...: this fragment's own extra_inputs by
 *   1-based position
 *
 * Every placeholder index must refer to an entry of extra_inputs.
 */
struct EffectFragment {
  std::vector<std::string> extra_inputs;    //< Assets this effect consumes
  std::vector<std::string> graph_fragments; //< Filter templates, in order
};

} // namespace ytp_forge

#endif // YTP_FORGE_TYPES_HPP
