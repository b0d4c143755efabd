#ifndef YTP_FORGE_TEST_SUPPORT_HPP
#define YTP_FORGE_TEST_SUPPORT_HPP

#include <cstddef>
#include <deque>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "ytp_forge/random_source.hpp"
#include "ytp_forge/system.hpp"

namespace ytp_forge::tests {

// Replays fixed draws, then falls back to a constant.
class ScriptedRandom : public RandomSource {
public:
  std::deque<double> uniforms;
  std::deque<size_t> indices;
  double default_uniform = 0.0;
  int uniform_calls = 0;
  int index_calls = 0;

  double uniform() override {
    ++uniform_calls;
    if (uniforms.empty())
      return default_uniform;
    double v = uniforms.front();
    uniforms.pop_front();
    return v;
  }

  size_t index(size_t n) override {
    ++index_calls;
    size_t v = 0;
    if (!indices.empty()) {
      v = indices.front();
      indices.pop_front();
    }
    return n == 0 ? 0 : v % n;
  }
};

// Fresh directory under /tmp, removed with its contents on destruction.
class TempDir {
public:
  TempDir() : path_(make_temp_dir("ytp_forge_test_").value_or("")) {}
  ~TempDir() {
    std::error_code ec;
    if (!path_.empty())
      std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::string &path() const { return path_; }

  std::string file(const std::string &name) const {
    return (std::filesystem::path(path_) / name).string();
  }

  // Create a file with some content and return its path.
  std::string touch(const std::string &name,
                    const std::string &content = "x") const {
    std::string p = file(name);
    std::filesystem::create_directories(std::filesystem::path(p).parent_path());
    std::ofstream(p) << content;
    return p;
  }

private:
  std::string path_;
};

} // namespace ytp_forge::tests

#endif // YTP_FORGE_TEST_SUPPORT_HPP
