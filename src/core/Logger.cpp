#include "dockpipe/core/Logger.hpp"

#include <ctime>
#include <filesystem>
#include <unordered_map>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dockpipe {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

std::shared_ptr<spdlog::logger> gLogger;
bool gEnabled = true;
spdlog::level::level_enum gLevel = spdlog::level::info;
RunLogConfig_t gRunLogConfig{};
std::string gRunLogPath;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> gClassLoggers;

std::string makeRunLogPath(const RunLogConfig_t& config) {
  const std::filesystem::path dir(config.directory);
  const std::string fileName =
      fmt::format("{}{:%Y-%m-%d_%H%M%S}.log", config.prefix, fmt::localtime(std::time(nullptr)));
  return (dir / fileName).string();
}

void DropAll() {
  for (auto& entry : gClassLoggers) {
    spdlog::drop(entry.first);
  }
  gClassLoggers.clear();
  spdlog::drop("dockpipe");
  if (gLogger) {
    gLogger->flush();
  }
  gLogger.reset();
}

void BuildLogger() {
  DropAll();
  if (!gEnabled) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  gRunLogPath.clear();
  if (gRunLogConfig.enabled) {
    const std::string path = makeRunLogPath(gRunLogConfig);
    const std::filesystem::path logPath(path);
    if (logPath.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(logPath.parent_path(), ec);
    }
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false));
      gRunLogPath = path;
    } catch (const spdlog::spdlog_ex& ex) {
      fmt::print(stderr, "[WARN] run log unavailable ({}), console only\n", ex.what());
    }
  }

  gLogger = std::make_shared<spdlog::logger>("dockpipe", sinks.begin(), sinks.end());
  gLogger->set_pattern(kPattern);
  gLogger->set_level(gLevel);
  // Every record reaches the file before the next child is spawned.
  gLogger->flush_on(spdlog::level::trace);
  spdlog::register_logger(gLogger);
}

std::shared_ptr<spdlog::logger> BuildClassLogger(const std::string& name) {
  if (!gLogger) {
    return nullptr;
  }
  auto logger = std::make_shared<spdlog::logger>(name, gLogger->sinks().begin(), gLogger->sinks().end());
  logger->set_pattern(kPattern);
  logger->set_level(gLevel);
  logger->flush_on(spdlog::level::trace);
  spdlog::drop(name);
  spdlog::register_logger(logger);
  return logger;
}

} // namespace

void Logger::Initialize() {
  if (!gLogger && gEnabled) {
    BuildLogger();
  }
}

std::shared_ptr<spdlog::logger> Logger::Get() {
  if (!gEnabled) {
    return nullptr;
  }
  if (!gLogger) {
    Initialize();
  }
  return gLogger;
}

std::shared_ptr<spdlog::logger> Logger::GetClass(const std::string& name) {
  if (!gEnabled) {
    return nullptr;
  }
  if (!gLogger) {
    Initialize();
  }
  auto it = gClassLoggers.find(name);
  if (it != gClassLoggers.end()) {
    return it->second;
  }
  auto logger = BuildClassLogger(name);
  if (logger) {
    gClassLoggers[name] = logger;
    return logger;
  }
  return Get();
}

void Logger::SetEnabled(bool enabled) {
  if (gEnabled == enabled) {
    return;
  }
  gEnabled = enabled;
  if (gLogger || !enabled) {
    BuildLogger();
  }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
  gLevel = level;
  if (gLogger) {
    gLogger->set_level(level);
  }
  for (auto& entry : gClassLoggers) {
    entry.second->set_level(level);
  }
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& value) {
  if (value == "trace") {
    return spdlog::level::trace;
  }
  if (value == "debug") {
    return spdlog::level::debug;
  }
  if (value == "warn") {
    return spdlog::level::warn;
  }
  if (value == "error") {
    return spdlog::level::err;
  }
  if (value == "critical") {
    return spdlog::level::critical;
  }
  if (value == "off") {
    return spdlog::level::off;
  }
  return spdlog::level::info;
}

// Takes effect immediately when the logger already exists, otherwise on first use.
void Logger::ConfigureRunLog(const RunLogConfig_t& config) {
  gRunLogConfig = config;
  if (gLogger) {
    BuildLogger();
  }
}

std::string Logger::RunLogPath() {
  return gRunLogPath;
}

void Logger::Flush() {
  if (gLogger) {
    gLogger->flush();
  }
}

void Logger::Shutdown() {
  DropAll();
  gRunLogPath.clear();
}

} // namespace dockpipe
