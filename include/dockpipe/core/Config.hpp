#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "dockpipe/artifacts/ArtifactStore.hpp"
#include "dockpipe/core/Logger.hpp"
#include "dockpipe/docking/BoundingBox.hpp"
#include "dockpipe/docking/ResultParser.hpp"

namespace dockpipe {

struct LoggingConfig_t {
  bool enabled = true;
  std::string level = "info";
  RunLogConfig_t runLog;
};

// One installed toolchain, reached through a single executable.
struct EnvironmentConfig_t {
  std::string name;
  std::string executable;
  // When set, the resolved executable must be this file (unless ignoreIdentityCheck).
  std::string expectedExecutable;
  bool ignoreIdentityCheck = false;
  // Extra {placeholders} available to the tools of this environment.
  std::map<std::string, std::string> variables;
  // Set in the child process environment of every tool run here.
  std::map<std::string, std::string> exports;
};

// Argument template of one external tool; {placeholders} are filled per work unit.
struct ToolConfig_t {
  std::string name;
  std::string environment;
  std::vector<std::string> args;
};

struct DownloadConfig_t {
  // (label, structure id). The JSON list form keeps its order; the object form
  // is read in label order.
  std::vector<std::pair<std::string, std::string>> structures;
  std::vector<std::string> ligands;
  std::vector<std::string> skipLigands;
};

struct PreparationConfig_t {
  std::string ligandAddFlag = "checkhydrogens";
  std::string receptorCleanFlag = "nphs_lps_waters";
  bool splitAltLocs = true;
};

struct DockingConfig_t {
  int exhaustiveness = 8;
  int verbosity = 2;
  BoxOptions_t box;
  std::map<std::string, ManualBox_t> manualBoxes;
  ResultFormat_t resultFormat;
};

// Built once at startup and passed by const reference; never modified afterwards.
struct PipelineConfig_t {
  LoggingConfig_t logging;
  bool forceRebuild = false;
  // Relative layout paths resolve against this directory when set.
  std::string workingDirectory;
  std::vector<std::string> stages;
  ArtifactLayout_t layout;
  std::map<std::string, EnvironmentConfig_t> environments;
  std::map<std::string, ToolConfig_t> tools;
  DownloadConfig_t download;
  PreparationConfig_t preparation;
  DockingConfig_t docking;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> systemEnvironment(const std::string& name);
// "1", "true" and "True" only.
bool isTruthy(const std::string& value);

std::vector<std::string> defaultStageOrder();
PipelineConfig_t defaultConfig();

// Defaults, then the JSON document, then environment flags; validated before returning.
PipelineConfig_t parseConfig(const nlohmann::json& root, const EnvLookup& env = systemEnvironment);
PipelineConfig_t loadConfig(const std::string& path, const EnvLookup& env = systemEnvironment);
void validateConfig(const PipelineConfig_t& config);

const ToolConfig_t& findTool(const PipelineConfig_t& config, const std::string& name);
const EnvironmentConfig_t& findEnvironment(const PipelineConfig_t& config, const std::string& name);

} // namespace dockpipe
