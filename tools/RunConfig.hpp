#pragma once

#include <cstdint>
#include <string>

#include "core/Config.hpp"

// What lcg_runner draws from the generator.
enum class RunMode : int {
  Int = 0,   // raw NextInt() values
  Float = 1, // NextFloat() values
  Range = 2, // NextRange(range) values
  Perm = 3,  // one RandomInts(count) permutation
  Path = 4   // random points on a cardioid
};

struct RunConfig {
  uint32_t seed = cfg::kDefaultRunnerSeed;
  bool seedFromClock = false;
  int count = cfg::kDefaultRunnerCount;
  RunMode mode = RunMode::Int;
  int range = cfg::kDefaultRunnerRange;
  double radius = cfg::kDefaultCardioidRadius;
};

const char *RunModeName(RunMode mode);
bool ParseRunMode(const std::string &text, RunMode &mode);

// Accepts decimal, 0x-prefixed hex, or "now" for a clock seed.
bool ParseSeedText(const std::string &text, RunConfig &config);

// Overlays keys present in the JSON document onto `config`. Keys: seed
// (number or string), count, mode (name or number), range, radius. Returns
// false and logs on I/O, parse or type errors; `config` is then unchanged.
bool LoadRunConfigFromString(RunConfig &config, const std::string &text);
bool LoadRunConfigFromFile(RunConfig &config, const char *path);

// Range checks shared by file and command-line values.
bool ValidateRunConfig(const RunConfig &config);
