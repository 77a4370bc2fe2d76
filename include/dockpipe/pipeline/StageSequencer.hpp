#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

#include "dockpipe/core/Config.hpp"
#include "dockpipe/pipeline/Stage.hpp"
#include "dockpipe/process/ProcessRunner.hpp"

namespace dockpipe {

enum class RunState_e { kInitializing, kRunning, kAborted, kCompleted };

// Runs stages strictly in order and stops at the first nonzero status.
class StageSequencer {
public:
  StageSequencer(const PipelineConfig_t& config, IProcessRunner& runner);

  // 0 when every stage succeeded, otherwise the status of the failing stage.
  int run(const std::vector<std::shared_ptr<IStage>>& stages);

  // Throws MissingToolError when a declared environment cannot be used.
  void verifyEnvironments(const std::vector<std::shared_ptr<IStage>>& stages) const;

  RunState_e state() const { return runState; }
  // Index of the running (or aborting) stage.
  std::size_t stageIndex() const { return currentStage; }
  int exitStatus() const { return finalStatus; }
  std::chrono::system_clock::time_point startedAt() const { return startTime; }

private:
  int abort(int status);

  const PipelineConfig_t& config;
  IProcessRunner& runner;
  RunState_e runState = RunState_e::kInitializing;
  std::size_t currentStage = 0;
  int finalStatus = 0;
  std::chrono::system_clock::time_point startTime;
};

const char* toString(RunState_e state);

} // namespace dockpipe
