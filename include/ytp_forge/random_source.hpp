/**
 * @file random_source.hpp
 * @brief Injectable randomness for asset choice and probability gates
 *
 * @details Every random decision of a compile goes through one RandomSource
 *          passed in by the caller:
 *
 *          - one uniform() draw per probability gate with p < 1
 *
 *          - one index() draw per asset pick from a non-empty pool
 *
 *          Tests substitute a scripted source to pin exact outcomes.
 */

#ifndef YTP_FORGE_RANDOM_SOURCE_HPP
#define YTP_FORGE_RANDOM_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <random>

namespace ytp_forge {

/**
 * @class RandomSource
 * @brief Source of the two kinds of draws the compiler makes.
 */
class RandomSource {
public:
  virtual ~RandomSource() = default;

  /// Uniform value in [0, 1)
  virtual double uniform() = 0;

  /**
   * @brief Uniform index in [0, n).
   * @param n Number of choices, must be > 0
   */
  virtual size_t index(size_t n) = 0;
};

/**
 * @class Mt19937Source
 * @brief Production source backed by std::mt19937.
 * @note Not thread-safe; use one instance per invocation.
 */
class Mt19937Source : public RandomSource {
public:
  /**
   * @brief Construct a source.
   * @param seed Fixed seed, or 0 to seed from std::random_device
   */
  explicit Mt19937Source(uint32_t seed = 0);

  double uniform() override;
  size_t index(size_t n) override;

  uint32_t seed() const { return seed_; }

private:
  uint32_t seed_;
  std::mt19937 engine_;
};

} // namespace ytp_forge

#endif // YTP_FORGE_RANDOM_SOURCE_HPP
