#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;
// Guards creation and replacement of s_Logger.
static std::mutex s_LoggerMutex;

static constexpr const char *kLoggerName = "LCGLAB";

void Init(const char *fileName) {
  std::lock_guard<std::mutex> lock(s_LoggerMutex);
  if (s_Logger) {
    spdlog::drop(kLoggerName);
    s_Logger.reset();
  }

  std::vector<spdlog::sink_ptr> sinks;

  // Console sink with color
  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  sinks.push_back(consoleSink);

  // File sink
  if (fileName != nullptr) {
    auto fileSink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(fileName, true);
    fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
    sinks.push_back(fileSink);
  }

  s_Logger =
      std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(spdlog::level::trace);
  s_Logger->flush_on(spdlog::level::warn);

  s_Logger->info("Logging initialized");
}

void Shutdown() {
  std::lock_guard<std::mutex> lock(s_LoggerMutex);
  s_Logger.reset();
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> &GetLogger() {
  std::lock_guard<std::mutex> lock(s_LoggerMutex);
  if (!s_Logger) {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_pattern("%^[%T] %n: %v%$");
    s_Logger = std::make_shared<spdlog::logger>(kLoggerName, consoleSink);
    s_Logger->set_level(spdlog::level::info);
  }
  return s_Logger;
}

} // namespace Log
