/**
 * @file effect_catalog.hpp
 * @brief Static catalog of effects and their fragment builders
 *
 * @details The catalog is an ordered table of EffectDescriptor. Its order is
 *          the compilation order: it fixes both the order of RNG draws and
 *          the order of fragments in the final filter graph.
 *
 *          build_fragment() dispatches on the closed EffectKey enum. Every
 *          builder:
 *
 *          - clamps intensity to its own [min, max] range
 *
 *          - never fails; with no asset available it returns noop_fragment()
 *
 *          - reports in extra_inputs exactly the assets its placeholders use
 */

#ifndef YTP_FORGE_EFFECT_CATALOG_HPP
#define YTP_FORGE_EFFECT_CATALOG_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "random_source.hpp"
#include "types.hpp"

namespace ytp_forge {

/**
 * @enum EffectKey
 * @brief One case per catalog entry, in compilation order.
 */
enum class EffectKey {
  RandomSound,
  Sounds,
  Reverse,
  Speed,
  Chorus,
  Vibrato,
  Stutter,
  Earrape,
  Autotune,
  DanceSquid,
  Invert,
  Rainbow,
  Mirror,
  Sus,
  ExplosionSpam,
  FrameShuffle,
  MemeInjection,
  MemeSounds,
  Memes,
  SentenceMix,
  Adverts,
  Errors,
  Images,
  OverlayVideos,
};

/**
 * @struct EffectDescriptor
 * @brief Immutable metadata of one effect.
 */
struct EffectDescriptor {
  EffectKey key;            //< Tag used for dispatch
  const char *id;           //< Stable string key, e.g. "reverse"
  const char *display_name; //< Human readable name
  double default_intensity; //< Intensity used when none is given
  double max_intensity;     //< Upper clamp for intensity
};

/// Caller's per-effect choices; keys absent from the map are disabled
using EffectSelections = std::map<EffectKey, EffectSelection>;

/**
 * @brief The full catalog in compilation order.
 */
const std::vector<EffectDescriptor> &effect_catalog();

/**
 * @brief Descriptor of one key.
 */
const EffectDescriptor &describe(EffectKey key);

/**
 * @brief Look up a key by its string id.
 * @return Key, or std::nullopt for an unknown id
 */
std::optional<EffectKey> find_effect(const std::string &id);

/**
 * @brief Fragment that passes both primary streams through unchanged.
 * @note {0v}copy[vout] and {0a}anull[aout]
 */
EffectFragment noop_fragment();

/**
 * @brief Split a speed factor into atempo steps.
 *
 * @param factor Requested speed, clamped to [0.125, 4.0]
 * @return Steps, each within [0.5, 2.0], whose product is factor (the last
 *         step rounded to 3 decimals)
 */
std::vector<double> decompose_tempo(double factor);

/**
 * @brief Build the fragment for one effect.
 *
 * @param key Effect to build
 * @param intensity Requested strength (clamped by the builder)
 * @param override_path Caller-supplied overlay asset ("" = none)
 * @param pools Asset pools to pick from
 * @param rng Random source for asset picks
 * @return Fragment with local placeholders
 */
EffectFragment build_fragment(EffectKey key, double intensity,
                              const std::string &override_path,
                              const AssetPools &pools, RandomSource &rng);

} // namespace ytp_forge

#endif // YTP_FORGE_EFFECT_CATALOG_HPP
