#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "dockpipe/core/Config.hpp"
#include "dockpipe/core/Errors.hpp"
#include "dockpipe/core/Logger.hpp"
#include "dockpipe/pipeline/StageSequencer.hpp"
#include "dockpipe/process/Interrupt.hpp"
#include "dockpipe/process/ProcessRunner.hpp"
#include "dockpipe/stages/StageFactory.hpp"

namespace {

constexpr const char* kUsage =
    "Usage: dockpipe_cli [--config <path>] [--force] [--help] [<command> [args...]]\n"
    "\n"
    "Commands:\n"
    "  run                                              all configured stages (default)\n"
    "  download                                         fetch structures and ligands\n"
    "  convert   [<sdf-dir> <pdb-dir>]                  ligand SDF -> PDB\n"
    "  prepare   [<protein-dir> <receptor-out> <ligand-out>]\n"
    "                                                   receptor and ligand PDBQT\n"
    "  dock      [<receptor-dir> <ligand-dir> <out-dir>]\n"
    "                                                   dock every receptor/ligand pair\n"
    "  extract   [<docking-dir> <csv-path>]             affinity table\n"
    "  visualize [<ligand-dir> <docking-dir> <out-dir>] ligand and complex images\n";

struct CliOptions_t {
  std::string configPath = "config/default.json";
  std::string command = "run";
  std::vector<std::string> positional;
  bool forceRebuild = false;
  bool showHelp = false;
  std::string error;
};

CliOptions_t parseArgs(int argc, char** argv) {
  CliOptions_t options;
  bool haveCommand = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.showHelp = true;
      return options;
    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        options.error = "--config needs a path";
        return options;
      }
      options.configPath = argv[++i];
    } else if (arg == "--force") {
      options.forceRebuild = true;
    } else if (!arg.empty() && arg[0] == '-') {
      options.error = "unknown option '" + arg + "'";
      return options;
    } else if (!haveCommand) {
      options.command = arg;
      haveCommand = true;
    } else {
      options.positional.push_back(arg);
    }
  }
  return options;
}

// Layout entries a single-stage command may override, in positional order.
std::vector<std::filesystem::path*> overridableLayout(const std::string& command, dockpipe::ArtifactLayout_t& layout) {
  if (command == "convert") {
    return {&layout.ligandSdfDir, &layout.ligandPdbDir};
  }
  if (command == "prepare") {
    return {&layout.proteinDir, &layout.receptorDir, &layout.ligandDir};
  }
  if (command == "dock") {
    return {&layout.receptorDir, &layout.ligandDir, &layout.dockingDir};
  }
  if (command == "extract") {
    return {&layout.dockingDir, &layout.affinityTable};
  }
  if (command == "visualize") {
    return {&layout.ligandSdfDir, &layout.dockingDir, &layout.visualizationDir};
  }
  return {};
}

void applyCommand(const CliOptions_t& options, dockpipe::PipelineConfig_t& config) {
  if (options.forceRebuild) {
    config.forceRebuild = true;
  }
  if (options.command == "run") {
    if (!options.positional.empty()) {
      throw dockpipe::ConfigError("'run' takes no arguments");
    }
    return;
  }
  const auto known = dockpipe::defaultStageOrder();
  if (std::find(known.begin(), known.end(), options.command) == known.end()) {
    throw dockpipe::ConfigError("unknown command '" + options.command + "'");
  }
  const auto targets = overridableLayout(options.command, config.layout);
  if (options.positional.size() > targets.size()) {
    throw dockpipe::ConfigError("too many arguments for '" + options.command + "'");
  }
  for (std::size_t i = 0; i < options.positional.size(); ++i) {
    *targets[i] = options.positional[i];
  }
  config.stages = {options.command};
}

void applyLoggingConfig(const dockpipe::LoggingConfig_t& logging) {
  dockpipe::Logger::ConfigureRunLog(logging.runLog);
  dockpipe::Logger::SetEnabled(logging.enabled);
  dockpipe::Logger::SetLevel(dockpipe::Logger::ParseLevel(logging.level));
}

int runPipeline(const CliOptions_t& cliOptions) {
  dockpipe::PipelineConfig_t config = dockpipe::loadConfig(cliOptions.configPath);
  applyCommand(cliOptions, config);
  if (!config.workingDirectory.empty()) {
    std::error_code ec;
    std::filesystem::current_path(config.workingDirectory, ec);
    if (ec) {
      throw dockpipe::ConfigError("cannot enter working directory " + config.workingDirectory + ": " + ec.message());
    }
  }
  applyLoggingConfig(config.logging);
  if (auto logger = dockpipe::Logger::Get()) {
    logger->info("dockpipe_cli using config: {}", cliOptions.configPath);
    if (config.forceRebuild) {
      logger->info("Force rebuild enabled: existing artifacts are regenerated");
    }
  }

  const auto stages = dockpipe::createStages(config.stages);
  dockpipe::PosixProcessRunner runner;
  dockpipe::StageSequencer sequencer(config, runner);
  return sequencer.run(stages);
}

} // namespace

int main(int argc, char** argv) {
  const CliOptions_t cliOptions = parseArgs(argc, argv);
  if (cliOptions.showHelp) {
    fmt::print("{}", kUsage);
    return 0;
  }
  if (!cliOptions.error.empty()) {
    fmt::print(stderr, "dockpipe_cli: {}\n{}", cliOptions.error, kUsage);
    return dockpipe::kExitFailure;
  }

  dockpipe::InterruptGuard interruptGuard;
  int status = 0;
  try {
    status = runPipeline(cliOptions);
  } catch (const dockpipe::PipelineError& ex) {
    if (auto logger = dockpipe::Logger::Get()) {
      logger->error("[ERROR] {}", ex.what());
    } else {
      fmt::print(stderr, "[ERROR] {}\n", ex.what());
    }
    status = ex.exitStatus();
  } catch (const std::exception& ex) {
    if (auto logger = dockpipe::Logger::Get()) {
      logger->critical("[FATAL] {}", ex.what());
    } else {
      fmt::print(stderr, "[FATAL] {}\n", ex.what());
    }
    status = dockpipe::kExitFailure;
  }
  dockpipe::Logger::Shutdown();
  return status;
}
