#include "tools/Runner.hpp"

#include "core/Log.hpp"
#include "core/RandomErrors.hpp"
#include "sim/CardioidPath.hpp"
#include "sim/PathSampler.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <exception>

#include <spdlog/fmt/fmt.h>

namespace {

bool ParseInt(const std::string &str, int &out) {
  errno = 0;
  char *end = nullptr;
  const long value = std::strtol(str.c_str(), &end, 10);
  if (errno != 0 || end == str.c_str() || *end != '\0' ||
      value < -2147483647L || value > 2147483647L) {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

bool ParseDouble(const std::string &str, double &out) {
  errno = 0;
  char *end = nullptr;
  const double value = std::strtod(str.c_str(), &end);
  if (errno != 0 || end == str.c_str() || *end != '\0' ||
      !std::isfinite(value)) {
    return false;
  }
  out = value;
  return true;
}

void AppendValue(std::string &out, const nlohmann::json &v) {
  if (v.is_array()) {
    out += fmt::format("{:.17g} {:.17g}", v[0].get<double>(),
                       v[1].get<double>());
  } else if (v.is_number_float()) {
    out += fmt::format("{:.17g}", v.get<double>());
  } else {
    out += fmt::format("{}", v.get<long long>());
  }
}

} // namespace

RunnerArgs ParseRunnerArgs(const std::vector<std::string> &argv) {
  RunnerArgs args{};
  const size_t argc = argv.size();
  for (size_t i = 1; i < argc; ++i) {
    const std::string &arg = argv[i];
    const bool hasValue = i + 1 < argc;
    if (arg == "--seed" && hasValue) {
      args.seed = argv[++i];
    } else if (arg == "--count" && hasValue) {
      int value = 0;
      if (!ParseInt(argv[++i], value)) {
        LOG_ERROR("--count expects an integer, got '{}'", argv[i]);
        args.bad = true;
      }
      args.count = value;
    } else if (arg == "--mode" && hasValue) {
      args.mode = argv[++i];
    } else if (arg == "--range" && hasValue) {
      int value = 0;
      if (!ParseInt(argv[++i], value)) {
        LOG_ERROR("--range expects an integer, got '{}'", argv[i]);
        args.bad = true;
      }
      args.range = value;
    } else if (arg == "--radius" && hasValue) {
      double value = 0.0;
      if (!ParseDouble(argv[++i], value)) {
        LOG_ERROR("--radius expects a finite number, got '{}'", argv[i]);
        args.bad = true;
      }
      args.radius = value;
    } else if (arg == "--config" && hasValue) {
      args.configPath = argv[++i];
    } else if (arg == "--json") {
      args.output = RunOutput::Json;
    } else if (arg == "--quiet") {
      args.output = RunOutput::Quiet;
    } else if (arg == "-h" || arg == "--help") {
      args.help = true;
    } else {
      LOG_ERROR("Unknown or incomplete option '{}'", arg);
      args.bad = true;
    }
  }
  return args;
}

bool BuildRunConfig(const RunnerArgs &args, RunConfig &config) {
  RunConfig merged = config;
  if (args.configPath &&
      !LoadRunConfigFromFile(merged, args.configPath->c_str())) {
    return false;
  }
  if (args.seed && !ParseSeedText(*args.seed, merged)) {
    LOG_ERROR("--seed expects a 32-bit decimal, 0x hex or 'now', got '{}'",
              *args.seed);
    return false;
  }
  if (args.mode && !ParseRunMode(*args.mode, merged.mode)) {
    LOG_ERROR("--mode expects int|float|range|perm|path, got '{}'",
              *args.mode);
    return false;
  }
  if (args.count)
    merged.count = *args.count;
  if (args.range)
    merged.range = *args.range;
  if (args.radius)
    merged.radius = *args.radius;
  if (!ValidateRunConfig(merged))
    return false;
  config = merged;
  return true;
}

nlohmann::json DrawValues(core::RandomLcg &rng, const RunConfig &config) {
  nlohmann::json values = nlohmann::json::array();
  switch (config.mode) {
  case RunMode::Int:
    for (int i = 0; i < config.count; ++i)
      values.push_back(rng.NextInt());
    break;
  case RunMode::Float:
    for (int i = 0; i < config.count; ++i)
      values.push_back(rng.NextFloat());
    break;
  case RunMode::Range:
    for (int i = 0; i < config.count; ++i)
      values.push_back(rng.NextRange(config.range));
    break;
  case RunMode::Perm:
    values = rng.RandomInts(config.count);
    break;
  case RunMode::Path: {
    const CardioidPath path(config.radius);
    for (int i = 0; i < config.count; ++i) {
      const PathPoint p = RandomPointOnPath(path, rng);
      values.push_back(nlohmann::json::array({p.x, p.y}));
    }
    break;
  }
  }
  return values;
}

int ExecuteRun(const RunConfig &config, const RunOutput output,
               std::string &out) {
  try {
    core::RandomLcg rng =
        config.seedFromClock ? core::RandomLcg()
                             : core::RandomLcg(static_cast<double>(config.seed));
    const uint32_t startSeed = rng.GetSeed();
    const nlohmann::json values = DrawValues(rng, config);

    if (output == RunOutput::Json) {
      nlohmann::json doc;
      doc["seed"] = startSeed;
      doc["modulus"] = rng.GetModulus();
      doc["mode"] = RunModeName(config.mode);
      doc["count"] = config.count;
      if (config.mode == RunMode::Range)
        doc["range"] = config.range;
      if (config.mode == RunMode::Path)
        doc["radius"] = config.radius;
      doc["values"] = values;
      doc["final_seed"] = rng.GetSeed();
      out += doc.dump(2);
      out += '\n';
    } else if (output == RunOutput::Quiet) {
      for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0)
          out += values[i].is_array() ? '\n' : ' ';
        AppendValue(out, values[i]);
      }
      out += '\n';
    } else {
      out += "=== LCG Runner ===\n";
      out += fmt::format("seed:       {} (0x{:08X})\n", startSeed, startSeed);
      out += fmt::format("mode:       {}\n", RunModeName(config.mode));
      out += fmt::format("count:      {}\n", config.count);
      if (config.mode == RunMode::Range)
        out += fmt::format("range:      {}\n", config.range);
      if (config.mode == RunMode::Path)
        out += fmt::format("radius:     {:.17g}\n", config.radius);
      for (size_t i = 0; i < values.size(); ++i) {
        out += fmt::format("{:6}  ", i);
        AppendValue(out, values[i]);
        out += '\n';
      }
      out += fmt::format("final_seed: {}\n", rng.GetSeed());
    }
  } catch (const core::InvalidSeedError &e) {
    LOG_ERROR("Invalid seed: {}", e.what());
    return kExitGenerator;
  } catch (const core::InvalidRangeError &e) {
    LOG_ERROR("Invalid range: {}", e.what());
    return kExitGenerator;
  } catch (const std::exception &e) {
    LOG_ERROR("Generator failed: {}", e.what());
    return kExitGenerator;
  }
  return kExitOk;
}

int RunRunner(const std::vector<std::string> &argv, std::string &out) {
  const RunnerArgs args = ParseRunnerArgs(argv);
  if (args.help) {
    out += RunnerUsage();
    return kExitOk;
  }
  if (args.bad) {
    out += RunnerUsage();
    return kExitUsage;
  }
  RunConfig config{};
  if (!BuildRunConfig(args, config)) {
    return kExitUsage;
  }
  return ExecuteRun(config, args.output, out);
}

const char *RunnerUsage() {
  return "lcg_runner: reference sequences for the LCG generator\n"
         "\n"
         "Usage: lcg_runner [options]\n"
         "  --seed <hex|dec|now>          Seed (default: 0xC0FFEE)\n"
         "  --count <n>                   Draws, or permutation size "
         "(default: 10)\n"
         "  --mode <mode>                 int|float|range|perm|path "
         "(default: int)\n"
         "  --range <n>                   Exclusive bound for range mode "
         "(default: 10)\n"
         "  --radius <r>                  Cardioid radius for path mode "
         "(default: 1)\n"
         "  --config <file.json>          Load settings; flags override them\n"
         "  --json                        Output as JSON\n"
         "  --quiet                       Only the values\n"
         "  -h, --help                    This message\n";
}
