/**
 * @file process_runner.hpp
 * @brief Encoder process execution with streamed output
 *
 * @details run_process() is the only place encoder output is produced:
 *
 *          1. Validate that every input file exists (nothing is spawned
 *             otherwise)
 *
 *          2. Resolve and spawn the executable with stdout and stderr joined
 *             onto one pipe
 *
 *          3. A reader thread splits the pipe into lines and pushes them
 *             into a bounded LineChannel
 *
 *          4. The calling thread forwards every line to the sink as it
 *             arrives
 *
 *          5. Wait for the child and normalize its exit status
 *
 * @attention The child is never left running when run_process() returns: on
 *            a reader failure, a sink failure or an exception it is killed
 *            with SIGKILL and reaped.
 */

#ifndef YTP_FORGE_PROCESS_RUNNER_HPP
#define YTP_FORGE_PROCESS_RUNNER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "command_builder.hpp"

namespace ytp_forge {

/**
 * @enum RunErrorKind
 * @brief Why a run failed. None = success.
 */
enum class RunErrorKind {
  None,
  MissingInput,         //< An input file does not exist
  ExecutableNotFound,   //< The encoder could not be located
  ProcessStartFailed,   //< fork/exec failed at the OS level
  ProcessExitedNonzero, //< The encoder ran and reported failure
  StreamInterrupted,    //< Reading or forwarding output failed mid-run
};

/// Stable name of a kind, e.g. "missing-input"
const char *error_kind_name(RunErrorKind kind);

/**
 * @struct MissingInput
 * @brief One input path that failed validation.
 */
struct MissingInput {
  std::string role; //< "source" or "extra"
  std::string path; //< Path as given
};

/**
 * @struct RunStatus
 * @brief Outcome of one run, with enough detail to show a user verbatim.
 */
struct RunStatus {
  RunErrorKind kind = RunErrorKind::None;
  std::string message;                //< Human readable description
  std::vector<MissingInput> missing;  //< Set for MissingInput
  int64_t raw_exit_code = 0;          //< As reported by the OS
  int64_t exit_code = 0;              //< normalize_exit_code(raw_exit_code)

  bool ok() const { return kind == RunErrorKind::None; }
};

/// Receives each output line, on the thread that called run_process()
using LineSink = std::function<void(const std::string &)>;

/**
 * @brief Reinterpret an unsigned 32-bit wraparound as a negative code.
 * @note 4294967294 -> -2. Values below 2^31 are returned unchanged.
 */
int64_t normalize_exit_code(int64_t raw);

/**
 * @brief Check that the primary input and every extra input exist.
 * @return MissingInput status listing every offending path, or success
 */
RunStatus validate_inputs(const CommandLine &cmd);

/**
 * @class LineSplitter
 * @brief Incremental splitter for raw pipe output.
 *
 * @note "\n", "\r\n" and a bare "\r" (progress updates) each end one line.
 *       Trailing spaces and tabs are stripped.
 */
class LineSplitter {
public:
  /**
   * @brief Consume a chunk of bytes.
   * @param data Chunk start
   * @param size Chunk length
   * @param out Completed lines are appended here
   */
  void feed(const char *data, size_t size, std::vector<std::string> &out);

  /**
   * @brief Emit the unterminated tail, if any.
   */
  void flush(std::vector<std::string> &out);

private:
  void emit(std::vector<std::string> &out);

  std::string pending_;
  bool last_was_cr_ = false;
};

/**
 * @brief Run an encoder invocation to completion.
 *
 * @param cmd Invocation and the input paths to validate
 * @param sink Receives every output line in emission order
 * @param channel_capacity Lines buffered between reader and sink
 * @return Success, or the first failure encountered
 */
RunStatus run_process(const CommandLine &cmd, const LineSink &sink,
                      size_t channel_capacity = 256);

} // namespace ytp_forge

#endif // YTP_FORGE_PROCESS_RUNNER_HPP
