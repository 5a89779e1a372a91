#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "core/Random.hpp"

namespace core {

// Largest power of two below which every integer is an exact double.
constexpr double kExactIntegerLimit = 9007199254740992.0; // 2^53

// Parameters of X' = (a X + c) mod m, all held as integral doubles.
struct LcgParams {
  double modulus = 0.0;    // m
  double multiplier = 0.0; // a
  double increment = 0.0;  // c
};

// True when the largest intermediate of one step, (m-1)*a + c, stays below
// 2^53 so the step is exact in double arithmetic.
constexpr bool IsNumericallySafe(const LcgParams &p) {
  return p.modulus > 1.0 && p.multiplier > 0.0 && p.increment >= 0.0 &&
         (p.modulus - 1.0) * p.multiplier + p.increment < kExactIntegerLimit;
}

// m = 2^32, a = 1664525 = 5^2 x 139 x 479, c = 1013904223 (prime).
// c is coprime to m and a-1 = 2^2 x 71 x 5861 is a multiple of 4, so the
// Hull-Dobell conditions hold and every seed has the full period 2^32.
constexpr LcgParams kStandardLcgParams{4294967296.0, 1664525.0, 1013904223.0};

static_assert(IsNumericallySafe(kStandardLcgParams),
              "standard LCG constants exceed the exact double range");

// Linear congruential generator that produces the same numbers as other
// implementations of the same recurrence, in any language that computes in
// IEEE-754 doubles. Every step is done in doubles and never uses the modulo
// operator:
//
//   r     = seed * a + c
//   seed' = r - floor(r / m) * m
//
// Not suitable for anything security related.
class RandomLcg final : public Random {
public:
  // Returns a seed value; called once by FromClock().
  using SeedClock = std::function<double()>;

  // Seeds from the system clock. The sequence is not reproducible; pass an
  // explicit seed wherever results must be repeatable.
  RandomLcg();

  // The seed is normalized into range: absolute value, floor, then reduced
  // modulo m. Throws InvalidSeedError for NaN or infinite seeds and
  // NumericOverflowError for unsafe params.
  explicit RandomLcg(double seed,
                     const LcgParams &params = kStandardLcgParams);

  static RandomLcg FromClock(const SeedClock &clock,
                             const LcgParams &params = kStandardLcgParams);

  // Milliseconds since the Unix epoch.
  static double SystemClockMillis();

  uint64_t GetModulus() const override;
  uint32_t GetSeed() const override;
  void SetSeed(double seed) override;

  uint32_t NextInt() override;
  double NextFloat() override;
  int NextRange(int n) override;
  std::vector<int> RandomInts(int n) override;

  const LcgParams &GetParams() const { return m_params; }

  std::string ToString() const;

private:
  // Applies the recurrence once and returns the new seed.
  double Advance();
  int DrawRange(int n);
  void CheckSeed(double seed) const;

  LcgParams m_params;
  double m_seed = 0.0;
};

std::ostream &operator<<(std::ostream &os, const RandomLcg &rng);

// Throws NumericOverflowError unless `params` describe an exact LCG.
void ValidateLcgParams(const LcgParams &params);

} // namespace core
