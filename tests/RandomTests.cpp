#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <vector>

#include "core/Log.hpp"
#include "core/RandomErrors.hpp"
#include "core/RandomLcg.hpp"

using core::InvalidRangeError;
using core::InvalidSeedError;
using core::LcgParams;
using core::NumericOverflowError;
using core::RandomLcg;

namespace {

constexpr double kModulus = 4294967296.0; // 2^32

// m = 2^16 with a Hull-Dobell triple, small enough to walk the whole period.
constexpr LcgParams kSmallParams{65536.0, 25173.0, 13849.0};

bool IsPermutation(const std::vector<int> &values, const int n) {
  if (static_cast<int>(values.size()) != n)
    return false;
  std::vector<bool> seen(static_cast<size_t>(n), false);
  for (const int v : values) {
    if (v < 0 || v >= n || seen[static_cast<size_t>(v)])
      return false;
    seen[static_cast<size_t>(v)] = true;
  }
  return true;
}

template <typename Error, typename Fn> bool Throws(Fn &&fn) {
  try {
    fn();
  } catch (const Error &) {
    return true;
  }
  return false;
}

bool TestKnownVectorFromSeedZero() {
  RandomLcg rng(0);
  const uint32_t expected[] = {1013904223u, 1196435762u, 3519870697u,
                               2868466484u, 1649599747u};
  for (const uint32_t e : expected) {
    if (rng.NextInt() != e)
      return false;
  }
  return rng.GetSeed() == 1649599747u;
}

bool TestSameSeedSameSequence() {
  RandomLcg a(987654321);
  RandomLcg b(987654321);
  for (int i = 0; i < 1000; ++i) {
    switch (i % 4) {
    case 0:
      if (a.NextInt() != b.NextInt())
        return false;
      break;
    case 1:
      if (a.NextFloat() != b.NextFloat())
        return false;
      break;
    case 2:
      if (a.NextRange(i) != b.NextRange(i))
        return false;
      break;
    default:
      if (a.RandomInts(i % 13) != b.RandomInts(i % 13))
        return false;
      break;
    }
  }
  return a.GetSeed() == b.GetSeed();
}

bool TestGetSeedAfterConstruction() {
  const RandomLcg rng(5);
  return rng.GetSeed() == 5u && rng.GetModulus() == 4294967296ull;
}

bool TestGetSeedDoesNotAdvance() {
  RandomLcg rng(5);
  const uint32_t before = rng.GetSeed();
  (void)rng.GetSeed();
  return rng.GetSeed() == before && rng.NextInt() == 1022226848u;
}

bool TestClockSeedInRange() {
  const RandomLcg rng;
  return static_cast<double>(rng.GetSeed()) < kModulus;
}

bool TestInjectedClockIsReproducible() {
  auto fixedClock = [] { return 1700000000123.0; };
  RandomLcg a = RandomLcg::FromClock(fixedClock);
  RandomLcg b(1700000000123.0);
  if (a.GetSeed() != b.GetSeed())
    return false;
  // 1700000000123 mod 2^32
  if (a.GetSeed() != static_cast<uint32_t>(1700000000123ull % 4294967296ull))
    return false;
  return a.NextInt() == b.NextInt();
}

bool TestEmptyClockRejected() {
  return Throws<std::invalid_argument>(
      [] { RandomLcg::FromClock(RandomLcg::SeedClock{}); });
}

bool TestConstructionNormalizesSeed() {
  const RandomLcg negative(-7.9);
  const RandomLcg wrapped(kModulus + 5.0);
  const RandomLcg fractional(12.75);
  const RandomLcg top(kModulus - 1.0);
  return negative.GetSeed() == 7u && wrapped.GetSeed() == 5u &&
         fractional.GetSeed() == 12u && top.GetSeed() == 4294967295u;
}

bool TestConstructionRejectsNonFinite() {
  return Throws<InvalidSeedError>([] { RandomLcg rng(std::nan("")); }) &&
         Throws<InvalidSeedError>([] { RandomLcg rng(INFINITY); });
}

bool TestSetSeedStrict() {
  RandomLcg rng(11);
  const bool rejected =
      Throws<InvalidSeedError>([&] { rng.SetSeed(-1); }) &&
      Throws<InvalidSeedError>([&] { rng.SetSeed(kModulus); }) &&
      Throws<InvalidSeedError>([&] { rng.SetSeed(4294967296.0); }) &&
      Throws<InvalidSeedError>([&] { rng.SetSeed(3.5); }) &&
      Throws<InvalidSeedError>([&] { rng.SetSeed(std::nan("")); });
  // Failed calls leave the state alone.
  return rejected && rng.GetSeed() == 11u;
}

bool TestSetSeedRestartsSequence() {
  RandomLcg rng(123);
  rng.NextInt();
  rng.NextInt();
  rng.SetSeed(0);
  if (rng.GetSeed() != 0u || rng.NextInt() != 1013904223u)
    return false;
  rng.SetSeed(kModulus - 1.0);
  return rng.GetSeed() == 4294967295u;
}

bool TestNextFloatKnownValues() {
  RandomLcg rng(0);
  const double first = rng.NextFloat();
  const double second = rng.NextFloat();
  return first == 1013904223.0 / 4294967295.0 &&
         second == 1196435762.0 / 4294967295.0;
}

bool TestNextFloatInUnitInterval() {
  RandomLcg rng(2024);
  for (int i = 0; i < 100000; ++i) {
    const double x = rng.NextFloat();
    if (!(x >= 0.0 && x <= 1.0))
      return false;
  }
  return true;
}

bool TestNextFloatReachesOne() {
  // 653637408 * a + c is congruent to m - 1.
  RandomLcg rng(653637408);
  return rng.NextFloat() == 1.0 && rng.GetSeed() == 4294967295u;
}

bool TestNextRangeBounds() {
  RandomLcg rng(31337);
  for (int n = 1; n < 200; ++n) {
    for (int i = 0; i < 50; ++i) {
      const int x = rng.NextRange(n);
      if (x < 0 || x >= n)
        return false;
    }
  }
  return rng.NextRange(1) == 0;
}

bool TestNextRangeKnownValues() {
  RandomLcg rng(12345);
  const int expected[] = {0, 0, 5, 6, 9, 1, 4, 5, 5, 7};
  for (const int e : expected) {
    if (rng.NextRange(10) != e)
      return false;
  }
  return true;
}

bool TestNextRangeRejectsNonPositive() {
  RandomLcg rng(77);
  const uint32_t before = rng.GetSeed();
  const bool rejected =
      Throws<InvalidRangeError>([&] { rng.NextRange(0); }) &&
      Throws<InvalidRangeError>([&] { rng.NextRange(-3); });
  return rejected && rng.GetSeed() == before;
}

bool TestNextRangeUsesHighBits() {
  // With the top-bit scaling, NextRange(2) is the high bit of the raw value.
  RandomLcg a(4242);
  RandomLcg b(4242);
  for (int i = 0; i < 1000; ++i) {
    const uint32_t raw = a.NextInt();
    if (b.NextRange(2) != static_cast<int>(raw >> 31))
      return false;
  }
  return true;
}

bool TestNextRangeDistribution() {
  RandomLcg rng(42);
  int counts[10] = {};
  for (int i = 0; i < 100000; ++i) {
    ++counts[rng.NextRange(10)];
  }
  for (const int c : counts) {
    if (c < 9500 || c > 10500)
      return false;
  }
  return true;
}

bool TestRandomIntsKnownPermutation() {
  RandomLcg rng(0);
  const std::vector<int> expected = {2, 3, 8, 6, 4, 7, 1, 5, 9, 0};
  if (rng.RandomInts(10) != expected)
    return false;
  const std::vector<int> next = {3, 2, 1, 4, 0};
  return rng.RandomInts(5) == next;
}

bool TestRandomIntsIsPermutation() {
  RandomLcg rng(8675309);
  for (int n = 0; n <= 64; ++n) {
    if (!IsPermutation(rng.RandomInts(n), n))
      return false;
  }
  return IsPermutation(rng.RandomInts(1000), 1000);
}

bool TestRandomIntsSmallCases() {
  RandomLcg rng(99);
  const uint32_t before = rng.GetSeed();
  if (!rng.RandomInts(0).empty() || rng.GetSeed() != before)
    return false;
  return rng.RandomInts(1) == std::vector<int>{0};
}

bool TestRandomIntsAdvancesOncePerElement() {
  RandomLcg shuffled(5150);
  RandomLcg stepped(5150);
  shuffled.RandomInts(37);
  for (int i = 0; i < 37; ++i) {
    stepped.NextInt();
  }
  return shuffled.GetSeed() == stepped.GetSeed();
}

bool TestRandomIntsRejectsNegative() {
  RandomLcg rng(1);
  return Throws<InvalidRangeError>([&] { rng.RandomInts(-1); }) &&
         rng.GetSeed() == 1u;
}

bool TestRandomIntsCoversAllOrders() {
  // Every ordering of 3 elements shows up, none wildly over-represented.
  RandomLcg rng(606);
  std::vector<std::vector<int>> orders;
  std::vector<int> counts;
  for (int i = 0; i < 6000; ++i) {
    const std::vector<int> p = rng.RandomInts(3);
    const auto it = std::find(orders.begin(), orders.end(), p);
    if (it == orders.end()) {
      orders.push_back(p);
      counts.push_back(1);
    } else {
      ++counts[static_cast<size_t>(it - orders.begin())];
    }
  }
  if (orders.size() != 6)
    return false;
  for (const int c : counts) {
    if (c < 800 || c > 1200)
      return false;
  }
  return true;
}

bool TestFullPeriodOnSmallModulus() {
  RandomLcg rng(0, kSmallParams);
  if (rng.GetModulus() != 65536u)
    return false;
  const uint32_t start = rng.GetSeed();
  std::vector<bool> visited(65536, false);
  int returns = 0;
  for (int i = 0; i < 65536; ++i) {
    const uint32_t x = rng.NextInt();
    if (x >= 65536u || visited[x])
      return false;
    visited[x] = true;
    if (x == start)
      ++returns;
  }
  return returns == 1 && rng.GetSeed() == start;
}

bool TestFullPeriodFromAnySeed() {
  RandomLcg rng(40000, kSmallParams);
  const uint32_t start = rng.GetSeed();
  for (int i = 1; i < 65536; ++i) {
    if (rng.NextInt() == start)
      return false;
  }
  return rng.NextInt() == start;
}

bool TestSmallModulusNormalizesSeed() {
  const RandomLcg rng(65536.0 * 3 + 17, kSmallParams);
  return rng.GetSeed() == 17u;
}

bool TestUnsafeParamsRejected() {
  // (2^32 - 1) * 2^22 + c passes 2^53.
  const LcgParams tooBig{4294967296.0, 4194304.0, 1.0};
  const LcgParams fractional{65536.0, 25173.5, 13849.0};
  const LcgParams hugeModulus{8589934592.0, 5.0, 1.0};
  const LcgParams noModulus{1.0, 5.0, 1.0};
  return Throws<NumericOverflowError>([&] { RandomLcg rng(0, tooBig); }) &&
         Throws<NumericOverflowError>([&] { RandomLcg rng(0, fractional); }) &&
         Throws<NumericOverflowError>(
             [&] { RandomLcg rng(0, hugeModulus); }) &&
         Throws<NumericOverflowError>([&] { RandomLcg rng(0, noModulus); });
}

bool TestStandardParamsAreSafe() {
  return core::IsNumericallySafe(core::kStandardLcgParams) &&
         (kModulus - 1.0) * 1664525.0 + 1013904223.0 < core::kExactIntegerLimit;
}

bool TestCopiesAreIndependent() {
  RandomLcg a(2718);
  a.NextInt();
  RandomLcg b = a;
  const uint32_t fromA = a.NextInt();
  a.NextInt();
  return b.NextInt() == fromA;
}

bool TestUsableThroughInterface() {
  RandomLcg lcg(0);
  core::Random &rng = lcg;
  return rng.NextInt() == 1013904223u && rng.GetSeed() == 1013904223u;
}

bool TestToString() { return RandomLcg(5).ToString() == "RandomLcg{seed: 5}"; }

bool TestStreamsAsToString() {
  RandomLcg rng(0);
  rng.NextInt();
  std::ostringstream os;
  os << rng;
  return os.str() == "RandomLcg{seed: 1013904223}";
}

bool TestGetParams() {
  const RandomLcg standard(1);
  const RandomLcg small(1, kSmallParams);
  return standard.GetParams().modulus == 4294967296.0 &&
         standard.GetParams().multiplier == 1664525.0 &&
         standard.GetParams().increment == 1013904223.0 &&
         small.GetParams().modulus == 65536.0 &&
         small.GetParams().multiplier == 25173.0 &&
         small.GetParams().increment == 13849.0;
}

} // namespace

int main() {
  Log::Init(nullptr);
  int failed = 0;

  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("known_vector_from_seed_zero", TestKnownVectorFromSeedZero());
  run("same_seed_same_sequence", TestSameSeedSameSequence());
  run("get_seed_after_construction", TestGetSeedAfterConstruction());
  run("get_seed_does_not_advance", TestGetSeedDoesNotAdvance());
  run("clock_seed_in_range", TestClockSeedInRange());
  run("injected_clock_is_reproducible", TestInjectedClockIsReproducible());
  run("empty_clock_rejected", TestEmptyClockRejected());
  run("construction_normalizes_seed", TestConstructionNormalizesSeed());
  run("construction_rejects_non_finite", TestConstructionRejectsNonFinite());
  run("set_seed_strict", TestSetSeedStrict());
  run("set_seed_restarts_sequence", TestSetSeedRestartsSequence());
  run("next_float_known_values", TestNextFloatKnownValues());
  run("next_float_in_unit_interval", TestNextFloatInUnitInterval());
  run("next_float_reaches_one", TestNextFloatReachesOne());
  run("next_range_bounds", TestNextRangeBounds());
  run("next_range_known_values", TestNextRangeKnownValues());
  run("next_range_rejects_non_positive", TestNextRangeRejectsNonPositive());
  run("next_range_uses_high_bits", TestNextRangeUsesHighBits());
  run("next_range_distribution", TestNextRangeDistribution());
  run("random_ints_known_permutation", TestRandomIntsKnownPermutation());
  run("random_ints_is_permutation", TestRandomIntsIsPermutation());
  run("random_ints_small_cases", TestRandomIntsSmallCases());
  run("random_ints_advances_once_per_element",
      TestRandomIntsAdvancesOncePerElement());
  run("random_ints_rejects_negative", TestRandomIntsRejectsNegative());
  run("random_ints_covers_all_orders", TestRandomIntsCoversAllOrders());
  run("full_period_on_small_modulus", TestFullPeriodOnSmallModulus());
  run("full_period_from_any_seed", TestFullPeriodFromAnySeed());
  run("small_modulus_normalizes_seed", TestSmallModulusNormalizesSeed());
  run("unsafe_params_rejected", TestUnsafeParamsRejected());
  run("standard_params_are_safe", TestStandardParamsAreSafe());
  run("copies_are_independent", TestCopiesAreIndependent());
  run("usable_through_interface", TestUsableThroughInterface());
  run("to_string", TestToString());
  run("streams_as_to_string", TestStreamsAsToString());
  run("get_params", TestGetParams());

  Log::Shutdown();
  return (failed == 0) ? 0 : 1;
}
