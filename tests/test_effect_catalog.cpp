#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "ytp_forge/effect_catalog.hpp"

using namespace ytp_forge;
using ytp_forge::tests::ScriptedRandom;

namespace {

AssetPools full_pools() {
  return {
      {Pool::IMAGES, {"/a/img.png"}},
      {Pool::SOUNDS, {"/a/boom.wav"}},
      {Pool::ADVERTS, {"/a/ad.mp4"}},
      {Pool::ERRORS, {"/a/err.png"}},
      {Pool::MEMES, {"/a/meme.png"}},
      {Pool::MEME_SOUNDS, {"/a/bruh.mp3"}},
      {Pool::OVERLAY_VIDEOS, {"/a/clip.mp4"}},
  };
}

int count_ending_with(const std::vector<std::string> &frags,
                      const std::string &label) {
  int n = 0;
  for (const auto &f : frags) {
    if (f.size() >= label.size() &&
        f.compare(f.size() - label.size(), label.size(), label) == 0)
      ++n;
  }
  return n;
}

} // namespace

TEST(EffectCatalogTest, OrderAndLookup) {
  const auto &catalog = effect_catalog();
  ASSERT_EQ(catalog.size(), 24u);
  EXPECT_STREQ(catalog.front().id, "random_sound");
  EXPECT_STREQ(catalog.back().id, "overlay_videos");

  std::set<std::string> ids;
  for (const auto &d : catalog) {
    EXPECT_TRUE(ids.insert(d.id).second) << "duplicate id " << d.id;
    EXPECT_LE(d.default_intensity, d.max_intensity) << d.id;
    EXPECT_TRUE(find_effect(d.id) == d.key) << d.id;
    EXPECT_STREQ(describe(d.key).id, d.id);
  }

  EXPECT_FALSE(find_effect("not_an_effect").has_value());
}

TEST(EffectCatalogTest, NoopFragmentIsExact) {
  EffectFragment noop = noop_fragment();
  EXPECT_TRUE(noop.extra_inputs.empty());
  EXPECT_EQ(noop.graph_fragments,
            (std::vector<std::string>{"{0v}copy[vout]", "{0a}anull[aout]"}));
}

TEST(EffectCatalogTest, ReverseFragment) {
  ScriptedRandom rng;
  EffectFragment f = build_fragment(EffectKey::Reverse, 1.0, "", {}, rng);
  EXPECT_TRUE(f.extra_inputs.empty());
  EXPECT_EQ(f.graph_fragments,
            (std::vector<std::string>{"{0v}reverse[reverse_v]",
                                      "{0a}areverse[reverse_a]",
                                      "[reverse_v]setpts=PTS-STARTPTS[vout]",
                                      "[reverse_a]asetpts=PTS-STARTPTS[aout]"}));
}

TEST(EffectCatalogTest, SpeedFragment) {
  ScriptedRandom rng;
  EffectFragment f2 = build_fragment(EffectKey::Speed, 2.0, "", {}, rng);
  EXPECT_EQ(f2.graph_fragments,
            (std::vector<std::string>{"{0v}setpts=0.5*PTS[vout]",
                                      "{0a}atempo=2[aout]"}));

  EffectFragment f4 = build_fragment(EffectKey::Speed, 4.0, "", {}, rng);
  EXPECT_EQ(f4.graph_fragments,
            (std::vector<std::string>{"{0v}setpts=0.25*PTS[vout]",
                                      "{0a}atempo=2,atempo=2[aout]"}));
}

TEST(EffectCatalogTest, TempoDecompositionStaysInRange) {
  for (double f = 0.125; f <= 4.0 + 1e-9; f += 0.005) {
    auto steps = decompose_tempo(f);
    ASSERT_FALSE(steps.empty());
    double product = 1.0;
    for (double s : steps) {
      EXPECT_GE(s, 0.5) << "factor " << f;
      EXPECT_LE(s, 2.0) << "factor " << f;
      product *= s;
    }
    EXPECT_NEAR(product, f, 0.002) << "factor " << f;
  }
}

TEST(EffectCatalogTest, TempoDecompositionClampsFactor) {
  double hi = 1.0;
  for (double s : decompose_tempo(10.0))
    hi *= s;
  EXPECT_DOUBLE_EQ(hi, 4.0);

  double lo = 1.0;
  for (double s : decompose_tempo(0.01))
    lo *= s;
  EXPECT_DOUBLE_EQ(lo, 0.125);
}

TEST(EffectCatalogTest, EmptyPoolsYieldNoop) {
  const EffectKey asset_effects[] = {
      EffectKey::RandomSound,   EffectKey::Sounds, EffectKey::Rainbow,
      EffectKey::ExplosionSpam, EffectKey::MemeInjection,
      EffectKey::MemeSounds,    EffectKey::Memes,  EffectKey::Adverts,
      EffectKey::Errors,        EffectKey::Images, EffectKey::OverlayVideos,
  };
  EffectFragment noop = noop_fragment();

  for (EffectKey key : asset_effects) {
    ScriptedRandom rng;
    EffectFragment f = build_fragment(key, 1.0, "", {}, rng);
    EXPECT_TRUE(f.extra_inputs.empty()) << describe(key).id;
    EXPECT_EQ(f.graph_fragments, noop.graph_fragments) << describe(key).id;
  }
}

TEST(EffectCatalogTest, PlaceholdersMatchExtraInputs) {
  std::regex placeholder(R"(\{(\d+)[va]\})");

  for (const auto &d : effect_catalog()) {
    ScriptedRandom rng;
    EffectFragment f =
        build_fragment(d.key, d.default_intensity, "", full_pools(), rng);

    for (const auto &frag : f.graph_fragments) {
      for (std::sregex_iterator it(frag.begin(), frag.end(), placeholder), end;
           it != end; ++it) {
        size_t j = std::stoul((*it)[1].str());
        EXPECT_LE(j, f.extra_inputs.size()) << d.id << ": " << frag;
      }
    }

    EXPECT_EQ(count_ending_with(f.graph_fragments, "[vout]"), 1) << d.id;
    EXPECT_EQ(count_ending_with(f.graph_fragments, "[aout]"), 1) << d.id;
  }
}

TEST(EffectCatalogTest, SoundMixStopsAtShortestStream) {
  ScriptedRandom rng;
  EffectFragment f = build_fragment(EffectKey::Sounds, 2.0, "", full_pools(), rng);
  ASSERT_EQ(f.extra_inputs, (std::vector<std::string>{"/a/boom.wav"}));
  EXPECT_EQ(f.graph_fragments,
            (std::vector<std::string>{
                "{0v}copy[vout]", "{1a}volume=2[sounds_sfx]",
                "{0a}[sounds_sfx]amix=inputs=2:duration=shortest:"
                "dropout_transition=2[aout]"}));
}

TEST(EffectCatalogTest, MemesUseLocalIndexForSound) {
  ScriptedRandom rng;
  EffectFragment f = build_fragment(EffectKey::Memes, 1.0, "", full_pools(), rng);
  ASSERT_EQ(f.extra_inputs,
            (std::vector<std::string>{"/a/meme.png", "/a/bruh.mp3"}));
  ASSERT_EQ(f.graph_fragments.size(), 3u);
  EXPECT_EQ(f.graph_fragments[0], "{0v}{1v}overlay=10:10[vout]");
  EXPECT_EQ(f.graph_fragments[1], "{2a}volume=1[memes_sfx]");

  AssetPools sound_only = {{Pool::MEME_SOUNDS, {"/a/bruh.mp3"}}};
  EffectFragment s = build_fragment(EffectKey::Memes, 1.0, "", sound_only, rng);
  ASSERT_EQ(s.extra_inputs, (std::vector<std::string>{"/a/bruh.mp3"}));
  EXPECT_EQ(s.graph_fragments[0], "{0v}copy[vout]");
  EXPECT_EQ(s.graph_fragments[1], "{1a}volume=1[memes_sfx]");
}

TEST(EffectCatalogTest, RainbowPrefersOverride) {
  ScriptedRandom rng;
  EffectFragment f =
      build_fragment(EffectKey::Rainbow, 1.0, "/user/rainbow.gif", full_pools(), rng);
  EXPECT_EQ(f.extra_inputs, (std::vector<std::string>{"/user/rainbow.gif"}));
  EXPECT_EQ(rng.index_calls, 0);

  EffectFragment pooled = build_fragment(EffectKey::Rainbow, 1.0, "", full_pools(), rng);
  EXPECT_EQ(pooled.extra_inputs, (std::vector<std::string>{"/a/img.png"}));
}

TEST(EffectCatalogTest, OverlayFallsBackToOverride) {
  ScriptedRandom rng;
  EffectFragment f = build_fragment(EffectKey::Images, 1.0, "/user/pic.png", {}, rng);
  EXPECT_EQ(f.extra_inputs, (std::vector<std::string>{"/user/pic.png"}));
  EXPECT_EQ(f.graph_fragments[0],
            "{0v}{1v}overlay=enable='between(t,1,4)':x=main_w/4:y=main_h/4[vout]");

  // overlay_videos never uses the override
  EffectFragment v = build_fragment(EffectKey::OverlayVideos, 1.0, "/user/pic.png", {}, rng);
  EXPECT_TRUE(v.extra_inputs.empty());
}

TEST(EffectCatalogTest, ExplosionSpamPeriodFollowsLevel) {
  ScriptedRandom rng;
  EffectFragment f = build_fragment(EffectKey::ExplosionSpam, 2.0, "", full_pools(), rng);
  EXPECT_EQ(f.graph_fragments[0],
            "{0v}{1v}overlay=enable='lt(mod(t,3),0.6)':x=10:y=10[vout]");

  EffectFragment max = build_fragment(EffectKey::ExplosionSpam, 10.0, "", full_pools(), rng);
  EXPECT_EQ(max.graph_fragments[0],
            "{0v}{1v}overlay=enable='lt(mod(t,0.6),0.6)':x=10:y=10[vout]");
}

TEST(EffectCatalogTest, PlaceholderEffectsAreNoop) {
  ScriptedRandom rng;
  for (EffectKey key : {EffectKey::Autotune, EffectKey::Sus, EffectKey::SentenceMix}) {
    EffectFragment f = build_fragment(key, 1.0, "", full_pools(), rng);
    EXPECT_EQ(f.graph_fragments, noop_fragment().graph_fragments);
  }
  EXPECT_EQ(rng.index_calls, 0);
}
