/**
 * @file fragment_compiler.hpp
 * @brief Compiles enabled effects into one filter graph and input list
 *
 * @details The FragmentCompiler walks the catalog in declared order and for
 *          every applied effect:
 *
 *          1. Gates it on its probability (one draw when p < 1)
 *
 *          2. Builds its fragment with the clamped intensity
 *
 *          3. Allocates consecutive global slots for its extra inputs
 *
 *          4. Rewrites local placeholders to global stream references
 *
 *          5. Hands the rewritten fragments to a GraphComposer
 *
 * @attention Fragments are NOT chained. Each one reads the primary streams
 *            [0:v]/[0:a] and writes [vout]/[aout]. With two or more effects
 *            that declare those labels the graph contains duplicate output
 *            declarations, which ffmpeg rejects when the command runs.
 *            GraphComposer is the place to add an ordered chaining policy.
 */

#ifndef YTP_FORGE_FRAGMENT_COMPILER_HPP
#define YTP_FORGE_FRAGMENT_COMPILER_HPP

#include <string>
#include <vector>

#include "effect_catalog.hpp"
#include "random_source.hpp"
#include "types.hpp"

namespace ytp_forge {

/**
 * @struct AppliedEffect
 * @brief Slot allocation of one effect that made it into the plan.
 */
struct AppliedEffect {
  EffectKey key;   //< Which effect
  int first_slot;  //< Global slot of its first extra input
  int input_count; //< Number of extra inputs it consumed
};

/**
 * @struct CompiledPlan
 * @brief Output of the compiler, consumed once by the command builder.
 * @note ordered_extra_inputs[i] is global slot i + 1.
 */
struct CompiledPlan {
  std::string primary_input;                     //< Slot 0
  std::vector<std::string> ordered_extra_inputs; //< Slots 1..N
  std::string graph_description;                 //< Joined -filter_complex
  std::vector<AppliedEffect> applied;            //< In compilation order
  bool passthrough = true; //< Graph is the global no-op
};

/**
 * @class GraphComposer
 * @brief Turns the stream of rewritten fragments into one description.
 */
class GraphComposer {
public:
  virtual ~GraphComposer() = default;

  /// Start a new compilation
  virtual void reset() = 0;

  /**
   * @brief Accept the rewritten fragments of one applied effect.
   * @param key Effect the fragments belong to
   * @param fragments Fragments with global stream references
   */
  virtual void append(EffectKey key,
                      const std::vector<std::string> &fragments) = 0;

  /// Number of fragments accepted since reset()
  virtual size_t fragment_count() const = 0;

  /// Final graph description
  virtual std::string finish() = 0;
};

/**
 * @class IndependentComposer
 * @brief Default composer: joins every fragment with FRAGMENT_SEPARATOR.
 */
class IndependentComposer : public GraphComposer {
public:
  void reset() override;
  void append(EffectKey key,
              const std::vector<std::string> &fragments) override;
  size_t fragment_count() const override { return fragments_.size(); }
  std::string finish() override;

private:
  std::vector<std::string> fragments_;
};

/**
 * @brief Replace local placeholders with global stream references.
 *
 * @param fragment Template containing {0v}/{0a}/{jv}/{ja}
 * @param first_slot Global slot of local input 1
 * @param input_count Number of local inputs; higher indices are left as-is
 * @return Fragment with [0:v], [0:a], [slot:v], [slot:a] references
 */
std::string resolve_placeholders(const std::string &fragment, int first_slot,
                                 int input_count);

/// Global fallback used when no effect contributed anything
std::string global_noop_graph();

/**
 * @class FragmentCompiler
 * @brief Maps effect selections onto one CompiledPlan.
 * @note Holds no state between compile() calls except the references it
 *       was constructed with.
 */
class FragmentCompiler {
public:
  /**
   * @brief Construct a compiler.
   * @param rng Source of every random draw of a compile
   * @param composer Composition policy (nullptr = IndependentComposer)
   */
  explicit FragmentCompiler(RandomSource &rng,
                            GraphComposer *composer = nullptr);

  /// Disable copy (composer_ may point at default_composer_)
  FragmentCompiler(const FragmentCompiler &) = delete;
  FragmentCompiler &operator=(const FragmentCompiler &) = delete;

  /**
   * @brief Compile the selections into a plan.
   *
   * @param primary_input Source video (slot 0)
   * @param override_path Caller-supplied overlay asset ("" = none)
   * @param selections Per-effect choices
   * @param pools Asset pools
   * @return Plan with contiguous extra-input slots starting at 1
   */
  CompiledPlan compile(const std::string &primary_input,
                       const std::string &override_path,
                       const EffectSelections &selections,
                       const AssetPools &pools);

private:
  RandomSource &rng_;
  IndependentComposer default_composer_;
  GraphComposer *composer_;
};

} // namespace ytp_forge

#endif // YTP_FORGE_FRAGMENT_COMPILER_HPP
