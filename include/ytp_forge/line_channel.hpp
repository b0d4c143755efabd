/**
 * @file line_channel.hpp
 * @brief Bounded, thread-safe line queue for producer-consumer streaming
 *
 * @details Connects the process runner's reader thread to the caller's log
 *          sink:
 *
 *          - Reader thread (producer) pushes each output line as it is read
 *
 *          - Calling thread (consumer) pops lines and forwards them
 *
 *          - Capacity bounds memory if the sink is slower than the encoder
 */

#ifndef YTP_FORGE_LINE_CHANNEL_HPP
#define YTP_FORGE_LINE_CHANNEL_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace ytp_forge {

/**
 * @class LineChannel
 * @brief Bounded queue of lines with finish/close signalling.
 *
 * @attention USAGE:
 *
 *   - Producer calls push() per line, then finish() at end of stream
 *
 *   - Consumer calls pop() in a loop until it returns false
 *
 *   - Either side calls close() to abandon the stream; blocked push() and
 *     pop() calls return false immediately
 */
class LineChannel {
public:
  /**
   * @brief Construct a channel.
   * @param capacity Maximum pending lines (minimum 1)
   */
  explicit LineChannel(size_t capacity);

  /**
   * @brief Push a line (blocks while full).
   * @param line The line to forward
   * @return false if the channel was closed and the line dropped
   */
  bool push(std::string line);

  /**
   * @brief Pop a line (blocking).
   * @param line Output: the next line
   * @return true if a line was retrieved, false once finished and drained
   *         or closed
   */
  bool pop(std::string &line);

  /**
   * @brief Signal that no more lines will be pushed.
   * @note Pending lines can still be popped.
   */
  void finish();

  /**
   * @brief Abandon the stream; pending lines are discarded.
   */
  void close();

  /**
   * @brief Check if channel was closed.
   */
  bool is_closed() const { return closed_.load(); }

  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<std::string> lines_;
  std::atomic<bool> done_{false};
  std::atomic<bool> closed_{false};
};

} // namespace ytp_forge

#endif // YTP_FORGE_LINE_CHANNEL_HPP
