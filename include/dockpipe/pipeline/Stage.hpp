#pragma once

#include <string>
#include <vector>

#include "dockpipe/artifacts/ArtifactStore.hpp"
#include "dockpipe/core/Config.hpp"
#include "dockpipe/pipeline/ToolInvoker.hpp"

namespace dockpipe {

struct StageContext_t {
  const PipelineConfig_t& config;
  const ArtifactStore& store;
  ToolInvoker& tools;
};

// One ordered pipeline step. run() returns 0 on success or the exit status that
// aborts the pipeline; it may also throw a PipelineError.
class IStage {
public:
  virtual ~IStage() = default;
  virtual std::string name() const = 0;
  virtual std::string description() const = 0;
  // Runtime environments whose executables must resolve before the run starts.
  virtual std::vector<std::string> environments() const = 0;
  virtual int run(StageContext_t& context) = 0;
};

} // namespace dockpipe
