#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace dockpipe {

// Append-only run log written next to the console output.
struct RunLogConfig_t {
  bool enabled = true;
  std::string directory = "logs";
  std::string prefix = "pipeline_";
};

class Logger {
 public:
  static void Initialize();
  static std::shared_ptr<spdlog::logger> Get();
  // Component logger tagged with `name`; shares the console and run-log sinks.
  static std::shared_ptr<spdlog::logger> GetClass(const std::string& name);
  static void SetEnabled(bool enabled);
  static void SetLevel(spdlog::level::level_enum level);
  static spdlog::level::level_enum ParseLevel(const std::string& value);
  static void ConfigureRunLog(const RunLogConfig_t& config);
  static std::string RunLogPath();
  static void Flush();
  static void Shutdown();
};

} // namespace dockpipe
