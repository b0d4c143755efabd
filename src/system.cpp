/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - PATH search for the encoder executable
 *
 *          - Regular-file checks
 *
 *          - Temporary directory creation
 *
 *          - Output naming and time formatting utilities
 */

#include "ytp_forge/system.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>

namespace ytp_forge {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Helper to test one candidate path for execute permission
bool is_executable_file(const std::string &path) {
  return is_regular_file(path) && access(path.c_str(), X_OK) == 0;
}

/// Helper to split PATH-style strings like "/usr/bin:/bin"
std::vector<std::string> split_path_list(const std::string &list) {
  std::vector<std::string> dirs;
  size_t pos = 0;
  while (pos <= list.size()) {
    size_t end = list.find(':', pos);
    if (end == std::string::npos)
      end = list.size();

    /// An empty entry means the current directory
    std::string dir = list.substr(pos, end - pos);
    dirs.push_back(dir.empty() ? "." : dir);

    pos = end + 1;
  }
  return dirs;
}

} // anonymous namespace

// **---- Executables ----**

std::optional<std::string> find_executable(const std::string &name) {
  if (name.empty())
    return std::nullopt;

  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name))
      return name;
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  std::string path_list = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

  for (const auto &dir : split_path_list(path_list)) {
    std::string candidate = (fs::path(dir) / name).string();
    if (is_executable_file(candidate))
      return candidate;
  }
  return std::nullopt;
}

// **---- Files ----**

bool is_regular_file(const std::string &path) {
  if (path.empty())
    return false;
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

std::optional<std::string> make_temp_dir(const std::string &prefix) {
  std::error_code ec;
  fs::path base = fs::temp_directory_path(ec);
  if (ec)
    base = "/tmp";

  std::string pattern = (base / (prefix + "XXXXXX")).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  if (mkdtemp(buf.data()) == nullptr)
    return std::nullopt;
  return std::string(buf.data());
}

std::string default_output_name(const std::string &source) {
  auto now = std::chrono::system_clock::now();
  auto epoch =
      std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch())
          .count();
  return fmt::format("{}_ytp_{}.mp4", fs::path(source).stem().string(), epoch);
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace ytp_forge
