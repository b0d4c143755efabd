/**
 * @file pipeline.cpp
 * @brief Generation pipeline implementation
 *
 * @details Orchestrates one invocation:
 *
 *          1. Compile effect selections into a plan
 *
 *          2. Build the encoder command
 *
 *          3. Run the encoder and stream its output
 *
 *          4. Print run summary and timings
 */

#include "ytp_forge/pipeline.hpp"

#include <chrono>
#include <cstdio>

#include <fmt/color.h>
#include <fmt/core.h>

#include "ytp_forge/logging.hpp"
#include "ytp_forge/system.hpp"

namespace ytp_forge {

// **---- Constructor ----**

GenerationPipeline::GenerationPipeline(GenerationRequest request,
                                       RandomSource &rng)
    : request_(std::move(request)), rng_(rng) {}

// **---- Main Processing ----**

RunStatus GenerationPipeline::run(const LineSink &sink) {
  auto run_start = std::chrono::steady_clock::now();
  timings_.clear();
  TIMER_START(total_run);

  // **----- PHASE 1: COMPILE -----**

  LOG_PHASE("Compiling effects...");
  TIMER_START(compile);

  FragmentCompiler compiler(rng_);
  plan_ = compiler.compile(request_.source, request_.override_path,
                           request_.selections, request_.pools);

  TIMER_END(timings_, compile);
  log_plan();

  // **----- PHASE 2: BUILD COMMAND -----**

  TIMER_START(build_command);
  command_ = build_arguments(request_.mode, request_.source, plan_,
                             request_.output_path, request_.settings);
  TIMER_END(timings_, build_command);

  LOG_INFO("FFmpeg command: {}", format_command_line(command_));

  // **----- PHASE 3: RUN ENCODER -----**

  LOG_PHASE("Running {} ({})...", command_.executable,
            mode_name(request_.mode));
  TIMER_START(ffmpeg_exec);
  RunStatus status = run_process(command_, sink, request_.channel_capacity);
  TIMER_END(timings_, ffmpeg_exec);

  TIMER_END(timings_, total_run);

  auto run_end = std::chrono::steady_clock::now();
  elapsed_sec_ = std::chrono::duration<double>(run_end - run_start).count();

  if (status.ok()) {
    LOG_SUCCESS("Output saved to: {}", request_.output_path);
  }

  timings_.print_summary(
      fmt::format("{} TIMING", request_.mode == RunMode::Preview ? "PREVIEW"
                                                                 : "GENERATE"));
  print_run_summary(status);

  return status;
}

// **---- Plan Logging ----**

void GenerationPipeline::log_plan() {
  if (plan_.applied.empty()) {
    LOG_WARN("No effect applied, passing streams through unchanged");
    return;
  }
  if (plan_.passthrough) {
    LOG_WARN("{} effect(s) applied but none changes the streams, passing "
             "through unchanged",
             plan_.applied.size());
    return;
  }

  LOG_INFO("Applied {} effect(s), {} extra input(s)", plan_.applied.size(),
           plan_.ordered_extra_inputs.size());
  for (const auto &a : plan_.applied) {
    const auto &d = describe(a.key);
    if (a.input_count == 0) {
      LOG_INFO("  {:<16} no extra inputs", d.id);
    } else {
      LOG_INFO("  {:<16} slots {}..{}", d.id, a.first_slot,
               a.first_slot + a.input_count - 1);
    }
  }
}

// **---- Run Summary ----**

void GenerationPipeline::print_run_summary(const RunStatus &status) {
  std::lock_guard<std::mutex> lock(log_mutex);

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== RUN SUMMARY ====================\n");

  fmt::print("{:<20} {:>31}\n", "Mode:", mode_name(request_.mode));
  fmt::print("{:<20} {:>31}\n", "Effects applied:", plan_.applied.size());
  fmt::print("{:<20} {:>31}\n",
             "Extra inputs:", plan_.ordered_extra_inputs.size());
  fmt::print("{:<20} {:>31}\n", "Elapsed:", format_time(elapsed_sec_));

  if (status.ok()) {
    fmt::print("{:<20} ", "Result:");
    fmt::print(fg(fmt::color::green), "{:>31}\n", "ok");
  } else {
    fmt::print("{:<20} ", "Result:");
    fmt::print(fg(fmt::color::red), "{:>31}\n", error_kind_name(status.kind));
  }

  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

} // namespace ytp_forge
