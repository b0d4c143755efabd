/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides:
 *          - Global log mutex
 *
 *          - TimingCollector methods (per-run phase table)
 */

#include "ytp_forge/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace ytp_forge {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR -----**

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({name, us});
}

std::vector<TimingEntry> TimingCollector::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

void TimingCollector::print_summary(const std::string &title) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.empty())
    return;

  long total_us = 0;
  for (const auto &e : entries_)
    if (e.name == "total_run")
      total_us = e.microseconds;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan), "{:=^52}\n", fmt::format(" {} ", title));
  fmt::print("{:<24} {:>12} {:>8} {:>5}\n", "Phase", "us", "sec", "%");
  fmt::print("{:-<24} {:-<12} {:-<8} {:-<5}\n", "", "", "", "");

  for (const auto &e : entries_) {
    double seconds = e.microseconds / 1000000.0;
    double share = total_us > 0 ? 100.0 * e.microseconds / total_us : 0.0;
    fmt::print("{:<24} {:>12} {:>8.2f} {:>5.1f}\n", e.name, e.microseconds,
               seconds, share);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

} // namespace ytp_forge
