/**
 * @file fragment_compiler.cpp
 * @brief Fragment compiler implementation
 */

#include "ytp_forge/fragment_compiler.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

namespace ytp_forge {

// **---- Internal Helpers ----**

namespace {

void replace_all(std::string &s, const std::string &from,
                 const std::string &to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool is_noop(const EffectFragment &frag) {
  static const EffectFragment noop = noop_fragment();
  return frag.extra_inputs.empty() &&
         frag.graph_fragments == noop.graph_fragments;
}

double gate_probability(double p) {
  if (std::isnan(p))
    return 0.0;
  return std::max(0.0, std::min(1.0, p));
}

double compile_intensity(const EffectSelection &sel,
                         const EffectDescriptor &desc) {
  if (std::isnan(sel.intensity))
    return desc.default_intensity;
  return std::max(0.0, std::min(desc.max_intensity, sel.intensity));
}

} // anonymous namespace

// **---- IndependentComposer ----**

void IndependentComposer::reset() { fragments_.clear(); }

void IndependentComposer::append(EffectKey,
                                 const std::vector<std::string> &fragments) {
  fragments_.insert(fragments_.end(), fragments.begin(), fragments.end());
}

std::string IndependentComposer::finish() {
  std::string graph;
  for (size_t i = 0; i < fragments_.size(); ++i) {
    if (i > 0)
      graph += FRAGMENT_SEPARATOR;
    graph += fragments_[i];
  }
  return graph;
}

// **---- Placeholder Rewriting ----**

std::string resolve_placeholders(const std::string &fragment, int first_slot,
                                 int input_count) {
  std::string out = fragment;
  replace_all(out, "{0v}", "[0:v]");
  replace_all(out, "{0a}", "[0:a]");
  for (int j = 1; j <= input_count; ++j) {
    int slot = first_slot + (j - 1);
    replace_all(out, fmt::format("{{{}v}}", j), fmt::format("[{}:v]", slot));
    replace_all(out, fmt::format("{{{}a}}", j), fmt::format("[{}:a]", slot));
  }
  return out;
}

std::string global_noop_graph() {
  return fmt::format("[0:v]copy{}{}[0:a]anull{}", TERMINAL_VIDEO_LABEL,
                     FRAGMENT_SEPARATOR, TERMINAL_AUDIO_LABEL);
}

// **---- FragmentCompiler ----**

FragmentCompiler::FragmentCompiler(RandomSource &rng, GraphComposer *composer)
    : rng_(rng), composer_(composer ? composer : &default_composer_) {}

CompiledPlan FragmentCompiler::compile(const std::string &primary_input,
                                       const std::string &override_path,
                                       const EffectSelections &selections,
                                       const AssetPools &pools) {
  CompiledPlan plan;
  plan.primary_input = primary_input;
  composer_->reset();

  int next_slot = FIRST_EXTRA_SLOT;
  bool contributed = false;

  for (const auto &desc : effect_catalog()) {
    auto it = selections.find(desc.key);
    if (it == selections.end() || !it->second.enabled)
      continue;

    /// Gate: exactly one draw, only when the effect is not certain
    double p = gate_probability(it->second.probability);
    if (p < 1.0 && rng_.uniform() > p)
      continue;

    EffectFragment frag =
        build_fragment(desc.key, compile_intensity(it->second, desc),
                       override_path, pools, rng_);

    if (!is_noop(frag))
      contributed = true;

    int first_slot = next_slot;
    int input_count = static_cast<int>(frag.extra_inputs.size());
    for (auto &input : frag.extra_inputs) {
      plan.ordered_extra_inputs.push_back(std::move(input));
      ++next_slot;
    }

    std::vector<std::string> resolved;
    resolved.reserve(frag.graph_fragments.size());
    for (const auto &f : frag.graph_fragments) {
      resolved.push_back(resolve_placeholders(f, first_slot, input_count));
    }

    composer_->append(desc.key, resolved);
    plan.applied.push_back({desc.key, first_slot, input_count});
  }

  plan.passthrough = !contributed || composer_->fragment_count() == 0;
  plan.graph_description =
      plan.passthrough ? global_noop_graph() : composer_->finish();
  return plan;
}

} // namespace ytp_forge
