#include "tools/RunConfig.hpp"

#include "core/Log.hpp"
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Helper to load enums from JSON (supporting both numbers and strings)
bool GetRunMode(const json &j, const char *key, RunMode &mode) {
  if (!j.contains(key))
    return true;
  const auto &val = j[key];
  if (val.is_number_integer()) {
    const int raw = val.get<int>();
    if (raw < static_cast<int>(RunMode::Int) ||
        raw > static_cast<int>(RunMode::Path)) {
      LOG_ERROR("Run config '{}' out of range: {}", key, raw);
      return false;
    }
    mode = static_cast<RunMode>(raw);
    return true;
  }
  if (val.is_string() && ParseRunMode(val.get<std::string>(), mode))
    return true;
  LOG_ERROR("Run config '{}' is not a known mode: {}", key, val.dump());
  return false;
}

bool GetSeed(const json &j, const char *key, RunConfig &config) {
  if (!j.contains(key))
    return true;
  const auto &val = j[key];
  if (val.is_number_unsigned() && val.get<uint64_t>() <= UINT32_MAX) {
    config.seed = val.get<uint32_t>();
    config.seedFromClock = false;
    return true;
  }
  if (val.is_string() && ParseSeedText(val.get<std::string>(), config))
    return true;
  LOG_ERROR("Run config '{}' must be a 32-bit unsigned seed, got {}", key,
            val.dump());
  return false;
}

} // namespace

const char *RunModeName(const RunMode mode) {
  switch (mode) {
  case RunMode::Int:
    return "int";
  case RunMode::Float:
    return "float";
  case RunMode::Range:
    return "range";
  case RunMode::Perm:
    return "perm";
  case RunMode::Path:
    return "path";
  }
  return "unknown";
}

bool ParseRunMode(const std::string &text, RunMode &mode) {
  for (const RunMode m : {RunMode::Int, RunMode::Float, RunMode::Range,
                          RunMode::Perm, RunMode::Path}) {
    if (text == RunModeName(m)) {
      mode = m;
      return true;
    }
  }
  return false;
}

bool ParseSeedText(const std::string &text, RunConfig &config) {
  if (text == "now") {
    config.seedFromClock = true;
    return true;
  }
  if (text.empty() || text[0] == '-')
    return false;
  // Accept 0x prefix for hex, otherwise decimal.
  errno = 0;
  char *end = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end, 0);
  if (errno != 0 || end == text.c_str() || *end != '\0' || value > UINT32_MAX)
    return false;
  config.seed = static_cast<uint32_t>(value);
  config.seedFromClock = false;
  return true;
}

bool LoadRunConfigFromString(RunConfig &config, const std::string &text) {
  RunConfig parsed = config;
  try {
    const json data = json::parse(text);
    if (!data.is_object()) {
      LOG_ERROR("Run config must be a JSON object");
      return false;
    }

    if (!GetSeed(data, "seed", parsed))
      return false;
    if (!GetRunMode(data, "mode", parsed.mode))
      return false;
    parsed.count = data.value("count", parsed.count);
    parsed.range = data.value("range", parsed.range);
    parsed.radius = data.value("radius", parsed.radius);
  } catch (const json::parse_error &e) {
    LOG_ERROR("Run config parse error: {}", e.what());
    return false;
  } catch (const json::type_error &e) {
    LOG_ERROR("Run config type error: {}", e.what());
    return false;
  }

  if (!ValidateRunConfig(parsed))
    return false;
  config = parsed;
  return true;
}

bool LoadRunConfigFromFile(RunConfig &config, const char *path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open run config file: {}", path);
    return false;
  }
  std::stringstream buffer;
  buffer << f.rdbuf();
  if (!LoadRunConfigFromString(config, buffer.str())) {
    LOG_ERROR("Rejected run config file: {}", path);
    return false;
  }
  LOG_DEBUG("Loaded run config from {}", path);
  return true;
}

bool ValidateRunConfig(const RunConfig &config) {
  if (config.count < 0 || config.count > cfg::kMaxRunnerCount) {
    LOG_ERROR("count must be in [0, {}], was {}", cfg::kMaxRunnerCount,
              config.count);
    return false;
  }
  if (config.mode == RunMode::Range && config.range <= 0) {
    LOG_ERROR("range must be positive, was {}", config.range);
    return false;
  }
  if (!std::isfinite(config.radius)) {
    LOG_ERROR("radius must be finite, was {}", config.radius);
    return false;
  }
  return true;
}
