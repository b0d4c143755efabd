/**
 * @file line_channel.cpp
 * @brief Bounded line queue implementation
 */

#include "ytp_forge/line_channel.hpp"

#include <algorithm>

namespace ytp_forge {

LineChannel::LineChannel(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

bool LineChannel::push(std::string line) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
      return lines_.size() < capacity_ || closed_.load();
    });

    if (closed_.load()) {
      return false;
    }
    lines_.push_back(std::move(line));
  }
  not_empty_.notify_one();
  return true;
}

bool LineChannel::pop(std::string &line) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] {
      return !lines_.empty() || done_.load() || closed_.load();
    });

    if (closed_.load() || lines_.empty()) {
      return false;
    }

    line = std::move(lines_.front());
    lines_.pop_front();
  }
  not_full_.notify_one();
  return true;
}

void LineChannel::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  not_empty_.notify_all();
}

void LineChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_.store(true);
    lines_.clear();
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

} // namespace ytp_forge
