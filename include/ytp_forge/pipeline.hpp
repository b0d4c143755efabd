/**
 * @file pipeline.hpp
 * @brief Compile-and-run orchestration for one preview or generation
 *
 * @details The GenerationPipeline runs one invocation end to end:
 *
 *          1. Compile the effect selections into a filter graph
 *
 *          2. Build the encoder command for the requested mode
 *
 *          3. Run the encoder, forwarding its output to the sink
 *
 *          4. Print a run summary and the timing table
 *
 * @note A pipeline is single use. Preview and full generation of the same
 *       selections are two pipelines, each compiling (and drawing) afresh.
 */

#ifndef YTP_FORGE_PIPELINE_HPP
#define YTP_FORGE_PIPELINE_HPP

#include <cstddef>
#include <string>

#include "command_builder.hpp"
#include "effect_catalog.hpp"
#include "fragment_compiler.hpp"
#include "logging.hpp"
#include "process_runner.hpp"
#include "random_source.hpp"
#include "types.hpp"

namespace ytp_forge {

/**
 * @struct GenerationRequest
 * @brief Everything one invocation needs, gathered by the front end.
 */
struct GenerationRequest {
  RunMode mode = RunMode::Preview;
  std::string source;        //< Primary input video
  std::string override_path; //< Optional overlay asset ("" = none)
  EffectSelections selections;
  AssetPools pools;
  std::string output_path; //< Destination file
  EncodeSettings settings;
  size_t channel_capacity = 256; //< Lines buffered from the encoder
};

/**
 * @class GenerationPipeline
 * @brief Orchestrates compile, build and run for one request.
 */
class GenerationPipeline {
  GenerationRequest request_;
  RandomSource &rng_;
  CompiledPlan plan_;
  CommandLine command_;
  TimingCollector timings_; //< Phases of this pipeline only
  double elapsed_sec_ = 0;

  /**
   * @brief Log which effects were applied and the slots they occupy.
   */
  void log_plan();

  /**
   * @brief Print a boxed summary of the run outcome.
   */
  void print_run_summary(const RunStatus &status);

public:
  /**
   * @brief Construct a pipeline.
   * @param request Invocation parameters
   * @param rng Random source for gates and asset picks
   */
  GenerationPipeline(GenerationRequest request, RandomSource &rng);

  /**
   * @brief Run the complete pipeline.
   * @param sink Receives every encoder output line
   * @return Outcome of the encoder run
   */
  RunStatus run(const LineSink &sink);

  /**
   * @brief Plan of the last run().
   */
  const CompiledPlan &plan() const { return plan_; }

  /**
   * @brief Command of the last run().
   */
  const CommandLine &command() const { return command_; }

  /**
   * @brief Wall-clock duration of the last run() in seconds.
   */
  double elapsed_sec() const { return elapsed_sec_; }

  /**
   * @brief Phase timings of the last run() (empty when timing is disabled).
   */
  const TimingCollector &timings() const { return timings_; }
};

} // namespace ytp_forge

#endif // YTP_FORGE_PIPELINE_HPP
