/**
 * @file random_source.cpp
 * @brief std::mt19937-backed RandomSource
 */

#include "ytp_forge/random_source.hpp"

namespace ytp_forge {

namespace {

uint32_t resolve_seed(uint32_t seed) {
  if (seed != 0)
    return seed;
  std::random_device rd;
  uint32_t s = rd();
  return s != 0 ? s : 1u;
}

} // anonymous namespace

Mt19937Source::Mt19937Source(uint32_t seed)
    : seed_(resolve_seed(seed)), engine_(seed_) {}

double Mt19937Source::uniform() {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(engine_);
}

size_t Mt19937Source::index(size_t n) {
  if (n <= 1)
    return 0;
  std::uniform_int_distribution<size_t> dist(0, n - 1);
  return dist(engine_);
}

} // namespace ytp_forge
