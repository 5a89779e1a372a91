#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/RandomLcg.hpp"
#include "tools/RunConfig.hpp"

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitGenerator = 2;

enum class RunOutput { Text, Quiet, Json };

// Flags as given; unset ones fall back to the config file, then defaults.
struct RunnerArgs {
  std::optional<std::string> seed;
  std::optional<int> count;
  std::optional<std::string> mode;
  std::optional<int> range;
  std::optional<double> radius;
  std::optional<std::string> configPath;
  RunOutput output = RunOutput::Text;
  bool help = false;
  bool bad = false; // unknown option or malformed value
};

RunnerArgs ParseRunnerArgs(const std::vector<std::string> &argv);

// Loads the config file, then applies flags over it. Returns false on any
// error.
bool BuildRunConfig(const RunnerArgs &args, RunConfig &config);

// Draws the values for `config` from `rng`: numbers, or [x, y] pairs in path
// mode. Generator errors propagate.
nlohmann::json DrawValues(core::RandomLcg &rng, const RunConfig &config);

// Runs a validated config and writes the report to `out`. Returns kExitOk,
// or kExitGenerator if the generator rejects the config.
int ExecuteRun(const RunConfig &config, RunOutput output, std::string &out);

// Full command line to exit code; the report or usage text goes to `out`.
int RunRunner(const std::vector<std::string> &argv, std::string &out);

const char *RunnerUsage();
