#include "core/RandomLcg.hpp"

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/RandomErrors.hpp"

#include <chrono>
#include <cmath>
#include <numeric>
#include <ostream>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace core {

namespace {

constexpr double kMaxModulus = 4294967296.0; // 2^32, NextInt() returns uint32_t

bool IsIntegral(const double x) { return std::isfinite(x) && x == std::floor(x); }

} // namespace

void ValidateLcgParams(const LcgParams &params) {
  if (!IsIntegral(params.modulus) || !IsIntegral(params.multiplier) ||
      !IsIntegral(params.increment)) {
    LOG_CRITICAL("LCG params must be integers: m={} a={} c={}",
                 params.modulus, params.multiplier, params.increment);
    throw NumericOverflowError("LCG params must be finite integers");
  }
  if (params.modulus > kMaxModulus) {
    LOG_CRITICAL("LCG modulus {} exceeds 2^32", params.modulus);
    throw NumericOverflowError(
        fmt::format("LCG modulus must be at most 2^32, was {}", params.modulus));
  }
  if (!IsNumericallySafe(params)) {
    LOG_CRITICAL("LCG params m={} a={} c={} leave the exact double range",
                 params.modulus, params.multiplier, params.increment);
    throw NumericOverflowError(fmt::format(
        "(m-1)*a + c must be below 2^53 with m > 1, a > 0, c >= 0; "
        "m={} a={} c={}",
        params.modulus, params.multiplier, params.increment));
  }
}

RandomLcg::RandomLcg() : RandomLcg(SystemClockMillis()) {}

RandomLcg::RandomLcg(const double seed, const LcgParams &params)
    : m_params(params) {
  ValidateLcgParams(m_params);
  if (!std::isfinite(seed)) {
    LOG_ERROR("Cannot seed RandomLcg from non-finite value {}", seed);
    throw InvalidSeedError(
        fmt::format("random seed must be a finite number, was {}", seed));
  }
  m_seed = std::fmod(std::floor(std::fabs(seed)), m_params.modulus);
  CheckSeed(m_seed);
}

RandomLcg RandomLcg::FromClock(const SeedClock &clock,
                               const LcgParams &params) {
  if (!clock) {
    throw std::invalid_argument("RandomLcg::FromClock requires a clock");
  }
  const double now = clock();
  RandomLcg rng(now, params);
  LOG_DEBUG("RandomLcg seeded from clock value {} -> {}", now, rng.m_seed);
  return rng;
}

double RandomLcg::SystemClockMillis() {
  using namespace std::chrono;
  const auto ms =
      duration_cast<milliseconds>(system_clock::now().time_since_epoch());
  return static_cast<double>(ms.count());
}

void RandomLcg::CheckSeed(const double seed) const {
  const char *err = "random seed must be ";
  if (std::isnan(seed)) {
    throw InvalidSeedError(fmt::format("{}a number", err));
  }
  if (seed < 0.0) {
    throw InvalidSeedError(fmt::format("{}0 or greater {}", err, seed));
  }
  if (seed >= m_params.modulus) {
    throw InvalidSeedError(fmt::format("{}less than {:.0f} was {}", err,
                                       m_params.modulus, seed));
  }
  if (seed != std::floor(seed)) {
    throw InvalidSeedError(fmt::format("{}an integer {}", err, seed));
  }
}

uint64_t RandomLcg::GetModulus() const {
  return static_cast<uint64_t>(m_params.modulus);
}

uint32_t RandomLcg::GetSeed() const { return static_cast<uint32_t>(m_seed); }

void RandomLcg::SetSeed(const double seed) {
  try {
    CheckSeed(seed);
  } catch (const InvalidSeedError &e) {
    LOG_ERROR("RandomLcg::SetSeed rejected {}: {}", seed, e.what());
    throw;
  }
  m_seed = seed;
}

double RandomLcg::Advance() {
  const double m = m_params.modulus;
  const double r = m_seed * m_params.multiplier + m_params.increment;
  const double next = r - std::floor(r / m) * m;
  try {
    CheckSeed(next);
  } catch (const InvalidSeedError &e) {
    // Unreachable with validated params; treat as a defect.
    LOG_CRITICAL("RandomLcg invariant broken after {}: {}", ToString(),
                 e.what());
    throw;
  }
  m_seed = next;
  return m_seed;
}

uint32_t RandomLcg::NextInt() {
  const double x = Advance();
  if (cfg::kTraceRandomDraws) {
    LOG_TRACE("RandomLcg::NextInt {}", x);
  }
  return static_cast<uint32_t>(x);
}

double RandomLcg::NextFloat() {
  const double x = Advance();
  if (cfg::kTraceRandomDraws) {
    LOG_TRACE("RandomLcg::NextFloat {}", x);
  }
  return x / (m_params.modulus - 1.0);
}

int RandomLcg::NextRange(const int n) {
  const int x = DrawRange(n);
  if (cfg::kTraceRandomDraws) {
    LOG_TRACE("RandomLcg::NextRange({}) {}", n, x);
  }
  return x;
}

int RandomLcg::DrawRange(const int n) {
  if (n <= 0) {
    LOG_ERROR("RandomLcg::NextRange called with n={}", n);
    throw InvalidRangeError(fmt::format("n must be positive, was {}", n));
  }
  // Scale instead of taking raw % n: the low bits of an LCG are weak.
  const double randomUnder1 = Advance() / m_params.modulus;
  return static_cast<int>(std::floor(randomUnder1 * n));
}

std::vector<int> RandomLcg::RandomInts(const int n) {
  if (n < 0) {
    LOG_ERROR("RandomLcg::RandomInts called with n={}", n);
    throw InvalidRangeError(
        fmt::format("n must be zero or greater, was {}", n));
  }
  // Indices not yet placed, kept in their original order.
  std::vector<int> src(static_cast<size_t>(n));
  std::iota(src.begin(), src.end(), 0);

  std::vector<int> set;
  set.reserve(src.size());
  for (int remaining = n; remaining > 0; --remaining) {
    const int k = DrawRange(remaining);
    set.push_back(src[static_cast<size_t>(k)]);
    src.erase(src.begin() + k);
  }

  if (cfg::kTraceRandomPermutations) {
    LOG_TRACE("RandomLcg::RandomInts({}) [{}]", n, fmt::join(set, " "));
  }
  return set;
}

std::string RandomLcg::ToString() const {
  return fmt::format("RandomLcg{{seed: {:.0f}}}", m_seed);
}

std::ostream &operator<<(std::ostream &os, const RandomLcg &rng) {
  return os << rng.ToString();
}

} // namespace core
