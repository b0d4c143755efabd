/**
 * @file effect_catalog.cpp
 * @brief Effect descriptors and fragment builders
 *
 * @details Builders emit ffmpeg filter templates. Conventions:
 *
 *          - every fragment ends in the terminal labels [vout] and [aout]
 *
 *          - intermediate labels are prefixed with the effect id so they
 *            never collide with another effect's labels
 *
 *          - numeric filter arguments go through num() for stable text
 */

#include "ytp_forge/effect_catalog.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "ytp_forge/asset_pool.hpp"

namespace ytp_forge {

// **---- Catalog Table ----**

const std::vector<EffectDescriptor> &effect_catalog() {
  static const std::vector<EffectDescriptor> catalog = {
      {EffectKey::RandomSound, "random_sound", "Add Random Sound", 1.0, 5.0},
      {EffectKey::Sounds, "sounds", "Add Sound from Assets", 1.0, 5.0},
      {EffectKey::Reverse, "reverse", "Reverse Clip (video & audio)", 1.0,
       1.0},
      {EffectKey::Speed, "speed", "Speed Up / Slow Down", 1.0, 4.0},
      {EffectKey::Chorus, "chorus", "Chorus Effect (aecho)", 0.6, 2.0},
      {EffectKey::Vibrato, "vibrato", "Vibrato / Pitch Bend (asetrate+atempo)",
       1.0, 2.0},
      {EffectKey::Stutter, "stutter", "Stutter Loop", 0.5, 3.0},
      {EffectKey::Earrape, "earrape", "Earrape Mode (gain)", 6.0, 30.0},
      {EffectKey::Autotune, "autotune", "Auto-Tune Chaos (placeholder)", 1.0,
       1.0},
      {EffectKey::DanceSquid, "dance_squid", "Dance & Squidward Mode", 1.0,
       3.0},
      {EffectKey::Invert, "invert", "Invert Colors", 1.0, 1.0},
      {EffectKey::Rainbow, "rainbow", "Rainbow Overlay (user PNG/GIF)", 1.0,
       1.0},
      {EffectKey::Mirror, "mirror", "Mirror Mode", 1.0, 1.0},
      {EffectKey::Sus, "sus", "Sus Effect (random pitch/tempo)", 1.0, 3.0},
      {EffectKey::ExplosionSpam, "explosion_spam",
       "Explosion Spam (repetitive overlays)", 2.0, 10.0},
      {EffectKey::FrameShuffle, "frame_shuffle", "Frame Shuffle (placeholder)",
       1.0, 1.0},
      {EffectKey::MemeInjection, "meme_injection",
       "Meme Injection (overlay image/audio)", 1.0, 3.0},
      {EffectKey::MemeSounds, "meme_sounds", "Meme Sounds (assets)", 1.0, 3.0},
      {EffectKey::Memes, "memes", "Memes (images + sounds)", 1.0, 3.0},
      {EffectKey::SentenceMix, "sentence_mix", "Sentence Mixing / Random Cuts",
       1.0, 5.0},
      {EffectKey::Adverts, "adverts", "Adverts (overlay ad video)", 1.0, 3.0},
      {EffectKey::Errors, "errors", "Error / Glitch Overlays", 1.0, 3.0},
      {EffectKey::Images, "images", "Image Montage / Injection", 1.0, 5.0},
      {EffectKey::OverlayVideos, "overlay_videos", "Overlay Short Videos", 1.0,
       5.0},
  };
  return catalog;
}

const EffectDescriptor &describe(EffectKey key) {
  for (const auto &d : effect_catalog()) {
    if (d.key == key)
      return d;
  }
  throw std::out_of_range("effect key missing from catalog");
}

std::optional<EffectKey> find_effect(const std::string &id) {
  for (const auto &d : effect_catalog()) {
    if (id == d.id)
      return d.key;
  }
  return std::nullopt;
}

// **---- Internal Helpers ----**

namespace {

/// Clamp with NaN mapped to lo
double clamp_level(double v, double lo, double hi) {
  if (std::isnan(v))
    return lo;
  return std::max(lo, std::min(hi, v));
}

/// Fixed-point text with trailing zeros removed ("0.5", "2", "0.3333")
std::string num(double v) {
  std::string s = fmt::format("{:.4f}", v);
  s.erase(s.find_last_not_of('0') + 1);
  if (!s.empty() && s.back() == '.')
    s.pop_back();
  return s == "-0" ? "0" : s;
}

/// Pick from a pool, falling back to the override path
std::optional<std::string> pick_or_override(const AssetPools &pools,
                                            const char *pool,
                                            const std::string &override_path,
                                            RandomSource &rng) {
  auto chosen = choose_asset(pools, pool, rng);
  if (chosen)
    return chosen;
  if (!override_path.empty())
    return override_path;
  return std::nullopt;
}

/// Pick uniformly across several pools as if they were one list
std::optional<std::string> pick_any(const AssetPools &pools,
                                    const std::vector<const char *> &names,
                                    RandomSource &rng) {
  std::vector<const std::string *> all;
  for (const char *name : names) {
    auto it = pools.find(name);
    if (it == pools.end())
      continue;
    for (const auto &path : it->second)
      all.push_back(&path);
  }
  if (all.empty())
    return std::nullopt;
  return *all[rng.index(all.size())];
}

/// Video-only effect: filter {0v} into [vout], pass audio through
EffectFragment video_filter(const std::string &filter) {
  return {{}, {fmt::format("{{0v}}{}[vout]", filter), "{0a}anull[aout]"}};
}

/// Audio-only effect: copy video, filter {0a} into [aout]
EffectFragment audio_filter(const std::string &filter) {
  return {{}, {"{0v}copy[vout]", fmt::format("{{0a}}{}[aout]", filter)}};
}

/// One visual asset laid over the primary video
EffectFragment overlay(const std::string &asset, const std::string &args) {
  return {{asset},
          {fmt::format("{{0v}}{{1v}}overlay={}[vout]", args),
           "{0a}anull[aout]"}};
}

/// Mix one sound asset into the primary audio; stops at the shorter stream
EffectFragment mix_sound(const char *id, const std::string &sound,
                         double volume) {
  return {{sound},
          {"{0v}copy[vout]",
           fmt::format("{{1a}}volume={}[{}_sfx]", num(volume), id),
           fmt::format("{{0a}}[{}_sfx]amix=inputs=2:duration=shortest:"
                       "dropout_transition=2[aout]",
                       id)}};
}

// **---- Builders ----**

EffectFragment build_speed(double level) {
  double factor = clamp_level(level, 0.125, 4.0);
  std::string atempo;
  for (double step : decompose_tempo(factor)) {
    if (!atempo.empty())
      atempo += ",";
    atempo += fmt::format("atempo={}", num(step));
  }
  return {{},
          {fmt::format("{{0v}}setpts={}*PTS[vout]", num(1.0 / factor)),
           fmt::format("{{0a}}{}[aout]", atempo)}};
}

EffectFragment build_chorus(double level) {
  level = clamp_level(level, 0.0, 2.0);
  int delay = static_cast<int>(20 + level * 60);
  double decay = clamp_level(0.2 + level * 0.2, 0.1, 0.9);
  return audio_filter(fmt::format("aecho=0.8:0.9:{}|{}:{}|{}", delay,
                                  delay * 2, num(decay), num(decay * 0.6)));
}

EffectFragment build_vibrato(double level) {
  double pitch = clamp_level(level, 0.5, 2.0);
  double tempo = clamp_level(1.0 / pitch, 0.5, 2.0);
  return audio_filter(fmt::format("asetrate=44100*{},aresample=44100,atempo={}",
                                  num(pitch), num(tempo)));
}

EffectFragment build_stutter(double level) {
  level = clamp_level(level, 0.0, 3.0);
  int loops = std::max(2, static_cast<int>(level * 3));
  return {{},
          {"{0v}trim=0:0.15,setpts=PTS-STARTPTS[stutter_v]",
           fmt::format("[stutter_v]loop={}:1:0[stutter_vl]", loops),
           "{0a}atrim=0:0.15,asetpts=PTS-STARTPTS[stutter_a]",
           fmt::format("[stutter_a]aloop=loop={}:size=2[stutter_al]", loops),
           "[stutter_vl]scale=iw:ih[vout]", "[stutter_al]anull[aout]"}};
}

EffectFragment build_earrape(double level) {
  double gain = clamp_level(level, 2.0, 30.0);
  return {{},
          {"{0v}eq=contrast=1.1:saturation=1.4[vout]",
           fmt::format("{{0a}}volume={}[aout]", num(gain))}};
}

EffectFragment build_dance_squid(double level) {
  level = clamp_level(level, 0.0, 3.0);
  std::string zoom = num(1.0 + 0.05 * level);
  return {{},
          {fmt::format("{{0v}}scale=trunc(iw*{0}/2)*2:trunc(ih*{0}/2)*2,"
                       "transpose=1,transpose=2,format=yuv420p[vout]",
                       zoom),
           "{0a}atempo=1.0[aout]"}};
}

EffectFragment build_explosion_spam(double level, const AssetPools &pools,
                                    const std::string &override_path,
                                    RandomSource &rng) {
  auto chosen = pick_or_override(pools, Pool::IMAGES, override_path, rng);
  if (!chosen)
    return noop_fragment();
  /// One 0.6s flash per period; higher level = more flashes
  level = clamp_level(level, 1.0, 10.0);
  double period = std::max(0.6, 6.0 / level);
  return overlay(*chosen,
                 fmt::format("enable='lt(mod(t,{}),0.6)':x=10:y=10",
                             num(period)));
}

/// Image (optional) plus sound (optional); placeholders follow push order
EffectFragment build_image_and_sound(const char *id,
                                     const std::optional<std::string> &image,
                                     const std::string &overlay_args,
                                     const std::optional<std::string> &sound,
                                     double volume) {
  EffectFragment frag;
  if (image) {
    frag.extra_inputs.push_back(*image);
    size_t idx = frag.extra_inputs.size();
    frag.graph_fragments.push_back(
        fmt::format("{{0v}}{{{}v}}overlay={}[vout]", idx, overlay_args));
  } else {
    frag.graph_fragments.push_back("{0v}copy[vout]");
  }

  if (sound) {
    frag.extra_inputs.push_back(*sound);
    size_t idx = frag.extra_inputs.size();
    frag.graph_fragments.push_back(
        fmt::format("{{{}a}}volume={}[{}_sfx]", idx, num(volume), id));
    frag.graph_fragments.push_back(
        fmt::format("{{0a}}[{}_sfx]amix=inputs=2:duration=shortest:"
                    "dropout_transition=2[aout]",
                    id));
  } else {
    frag.graph_fragments.push_back("{0a}anull[aout]");
  }
  return frag;
}

} // anonymous namespace

// **---- Public API ----**

EffectFragment noop_fragment() {
  return {{}, {"{0v}copy[vout]", "{0a}anull[aout]"}};
}

std::vector<double> decompose_tempo(double factor) {
  double t = clamp_level(factor, 0.125, 4.0);
  std::vector<double> steps;
  if (t < 0.5) {
    while (t < 0.5) {
      steps.push_back(0.5);
      t /= 0.5;
    }
  } else {
    while (t > 2.0) {
      steps.push_back(2.0);
      t /= 2.0;
    }
  }
  steps.push_back(std::round(t * 1000.0) / 1000.0);
  return steps;
}

EffectFragment build_fragment(EffectKey key, double intensity,
                              const std::string &override_path,
                              const AssetPools &pools, RandomSource &rng) {
  switch (key) {
  case EffectKey::RandomSound: {
    auto sound = pick_any(pools, {Pool::SOUNDS, Pool::MEME_SOUNDS}, rng);
    if (!sound)
      return noop_fragment();
    return mix_sound("random_sound", *sound, clamp_level(intensity, 0.0, 5.0));
  }

  case EffectKey::Sounds: {
    auto sound = choose_asset(pools, Pool::SOUNDS, rng);
    if (!sound)
      return noop_fragment();
    return mix_sound("sounds", *sound, clamp_level(intensity, 0.0, 5.0));
  }

  case EffectKey::Reverse:
    return {{},
            {"{0v}reverse[reverse_v]", "{0a}areverse[reverse_a]",
             "[reverse_v]setpts=PTS-STARTPTS[vout]",
             "[reverse_a]asetpts=PTS-STARTPTS[aout]"}};

  case EffectKey::Speed:
    return build_speed(intensity);

  case EffectKey::Chorus:
    return build_chorus(intensity);

  case EffectKey::Vibrato:
    return build_vibrato(intensity);

  case EffectKey::Stutter:
    return build_stutter(intensity);

  case EffectKey::Earrape:
    return build_earrape(intensity);

  case EffectKey::DanceSquid:
    return build_dance_squid(intensity);

  case EffectKey::Invert:
    return video_filter("negate");

  case EffectKey::Rainbow: {
    /// The caller's overlay wins; the image pool is the fallback
    std::optional<std::string> chosen;
    if (!override_path.empty())
      chosen = override_path;
    else
      chosen = choose_asset(pools, Pool::IMAGES, rng);
    if (!chosen)
      return noop_fragment();
    return overlay(*chosen, "10:10");
  }

  case EffectKey::Mirror:
    return video_filter("hflip");

  case EffectKey::ExplosionSpam:
    return build_explosion_spam(intensity, pools, override_path, rng);

  case EffectKey::FrameShuffle:
    return video_filter("tblend=all_mode='addition',framestep=1");

  case EffectKey::MemeInjection: {
    auto image = pick_or_override(pools, Pool::MEMES, override_path, rng);
    auto sound = choose_asset(pools, Pool::MEME_SOUNDS, rng);
    return build_image_and_sound("meme_injection", image, "W-w-10:H-h-10",
                                 sound, clamp_level(intensity, 0.0, 3.0));
  }

  case EffectKey::MemeSounds: {
    auto sound = choose_asset(pools, Pool::MEME_SOUNDS, rng);
    if (!sound)
      return noop_fragment();
    return mix_sound("meme_sounds", *sound, clamp_level(intensity, 0.0, 3.0));
  }

  case EffectKey::Memes: {
    auto image = pick_or_override(pools, Pool::MEMES, override_path, rng);
    auto sound = choose_asset(pools, Pool::MEME_SOUNDS, rng);
    return build_image_and_sound("memes", image, "10:10", sound,
                                 clamp_level(intensity, 0.0, 3.0));
  }

  case EffectKey::Adverts: {
    auto chosen = pick_or_override(pools, Pool::ADVERTS, override_path, rng);
    if (!chosen)
      return noop_fragment();
    double seconds = 3.0 * clamp_level(intensity, 1.0, 3.0);
    return overlay(*chosen,
                   fmt::format("enable='between(t,0,{})':x=W-w-10:y=10:"
                               "eof_action=pass",
                               num(seconds)));
  }

  case EffectKey::Errors: {
    auto chosen = pick_or_override(pools, Pool::ERRORS, override_path, rng);
    if (!chosen)
      return noop_fragment();
    return overlay(*chosen, "enable='gt(mod(t,0.8),0.0)':x=0:y=0");
  }

  case EffectKey::Images: {
    auto chosen = pick_or_override(pools, Pool::IMAGES, override_path, rng);
    if (!chosen)
      return noop_fragment();
    return overlay(*chosen,
                   "enable='between(t,1,4)':x=main_w/4:y=main_h/4");
  }

  case EffectKey::OverlayVideos: {
    auto chosen = choose_asset(pools, Pool::OVERLAY_VIDEOS, rng);
    if (!chosen)
      return noop_fragment();
    return overlay(*chosen, "10:10:eof_action=pass");
  }

  case EffectKey::Autotune:
  case EffectKey::Sus:
  case EffectKey::SentenceMix:
    return noop_fragment();
  }
  return noop_fragment();
}

} // namespace ytp_forge
