#include "dockpipe/pipeline/StageSequencer.hpp"

#include <ctime>
#include <filesystem>
#include <set>

#include <fmt/chrono.h>

#include "dockpipe/core/Errors.hpp"
#include "dockpipe/core/Logger.hpp"
#include "dockpipe/process/Interrupt.hpp"

namespace dockpipe {

namespace {

void verifyEnvironment(const EnvironmentConfig_t& env) {
  const auto resolved = resolveExecutable(env.executable);
  if (!resolved) {
    throw MissingToolError("runtime environment '" + env.name + "': executable not found: " + env.executable);
  }
  if (env.expectedExecutable.empty()) {
    return;
  }
  std::error_code ec;
  const auto actual = std::filesystem::weakly_canonical(*resolved, ec);
  const auto expected = std::filesystem::weakly_canonical(env.expectedExecutable, ec);
  if (actual == expected) {
    return;
  }
  if (env.ignoreIdentityCheck) {
    if (auto logger = Logger::GetClass("StageSequencer")) {
      logger->warn("Environment '{}' runs {} instead of {} (identity check overridden)",
                   env.name,
                   actual.string(),
                   expected.string());
    }
    return;
  }
  throw EnvironmentMismatchError("runtime environment '" + env.name + "' must run " + expected.string() +
                                 " (got " + actual.string() + "); set VIZ_IGNORE_PY_CHECK=1 to override");
}

} // namespace

StageSequencer::StageSequencer(const PipelineConfig_t& config, IProcessRunner& runner)
    : config(config), runner(runner) {}

void StageSequencer::verifyEnvironments(const std::vector<std::shared_ptr<IStage>>& stages) const {
  std::set<std::string> checked;
  for (const auto& stage : stages) {
    for (const auto& name : stage->environments()) {
      if (!checked.insert(name).second) {
        continue;
      }
      verifyEnvironment(findEnvironment(config, name));
    }
  }
}

int StageSequencer::abort(int status) {
  runState = RunState_e::kAborted;
  finalStatus = status;
  return status;
}

int StageSequencer::run(const std::vector<std::shared_ptr<IStage>>& stages) {
  auto logger = Logger::GetClass("StageSequencer");
  runState = RunState_e::kInitializing;
  currentStage = 0;
  finalStatus = 0;
  startTime = std::chrono::system_clock::now();

  if (logger) {
    logger->info("========================================");
    logger->info("Docking Pipeline Run");
    logger->info("Started at {:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(startTime)));
    logger->info("========================================");
  }

  try {
    verifyEnvironments(stages);
  } catch (const PipelineError& ex) {
    if (logger) {
      logger->error("[ERROR] {}", ex.what());
    }
    return abort(ex.exitStatus());
  }

  ArtifactStore store(config.layout);
  ToolInvoker tools(config, runner);
  StageContext_t context{config, store, tools};

  for (std::size_t i = 0; i < stages.size(); ++i) {
    if (interruptRequested()) {
      const InterruptedError interrupted(pendingInterrupt());
      if (logger) {
        logger->error("[ABORTED] {}", interrupted.what());
      }
      return abort(interrupted.exitStatus());
    }

    runState = RunState_e::kRunning;
    currentStage = i;
    const auto& stage = stages[i];
    if (logger) {
      logger->info("[{}/{}] {}", i + 1, stages.size(), stage->description());
    }

    int status = 0;
    try {
      status = stage->run(context);
    } catch (const InterruptedError& ex) {
      if (logger) {
        logger->error("[ABORTED] {}", ex.what());
      }
      status = ex.exitStatus();
    } catch (const PipelineError& ex) {
      if (logger) {
        logger->error("[ERROR] {}", ex.what());
      }
      status = ex.exitStatus();
    } catch (const std::exception& ex) {
      if (logger) {
        logger->critical("[FATAL] {}", ex.what());
      }
      status = kExitFailure;
    }

    if (status == 0 && interruptRequested()) {
      status = kExitSignalBase + pendingInterrupt();
      if (logger) {
        logger->error("[ABORTED] interrupted by signal {}", pendingInterrupt());
      }
    }
    if (status != 0) {
      if (logger) {
        logger->error("Stage '{}' failed with exit status {}; aborting pipeline", stage->name(), status);
      }
      return abort(status);
    }
  }

  runState = RunState_e::kCompleted;
  finalStatus = 0;
  if (logger) {
    logger->info("[{}/{}] Workflow completed successfully!", stages.size(), stages.size());
    const std::string logPath = Logger::RunLogPath();
    if (!logPath.empty()) {
      logger->info("Log saved to {}", logPath);
    }
  }
  return 0;
}

const char* toString(RunState_e state) {
  switch (state) {
    case RunState_e::kInitializing:
      return "initializing";
    case RunState_e::kRunning:
      return "running";
    case RunState_e::kAborted:
      return "aborted";
    case RunState_e::kCompleted:
      return "completed";
  }
  return "unknown";
}

} // namespace dockpipe
