#pragma once

#include <cstdint>
#include <vector>

namespace core {

// Source of reproducible pseudo-random values. Implementations must give the
// same sequence for the same seed and call sequence on every platform.
//
// An instance belongs to one stream of draws; callers serialize access if
// they share it between threads.
class Random {
public:
  virtual ~Random() = default;

  // Exclusive upper bound of NextInt().
  virtual uint64_t GetModulus() const = 0;

  virtual uint32_t GetSeed() const = 0;

  // Restarts the sequence from `seed`. Throws InvalidSeedError unless `seed`
  // is an integer in [0, GetModulus()).
  virtual void SetSeed(double seed) = 0;

  // Next raw value in [0, GetModulus()).
  virtual uint32_t NextInt() = 0;

  // Next value in [0, 1]. The upper bound is inclusive.
  virtual double NextFloat() = 0;

  // Next integer in [0, n). Throws InvalidRangeError if n <= 0.
  virtual int NextRange(int n) = 0;

  // A random permutation of 0..n-1. Throws InvalidRangeError if n < 0.
  virtual std::vector<int> RandomInts(int n) = 0;
};

} // namespace core
