#include "dockpipe/stages/StageFactory.hpp"

#include "dockpipe/core/Errors.hpp"
#include "dockpipe/core/Logger.hpp"
#include "dockpipe/stages/ConvertStage.hpp"
#include "dockpipe/stages/DockingStage.hpp"
#include "dockpipe/stages/DownloadStage.hpp"
#include "dockpipe/stages/ExtractStage.hpp"
#include "dockpipe/stages/PrepareStage.hpp"
#include "dockpipe/stages/VisualizeStage.hpp"

namespace dockpipe {

std::shared_ptr<IStage> createStage(const std::string& name) {
  if (name == "download") {
    return std::make_shared<DownloadStage>();
  }
  if (name == "convert") {
    return std::make_shared<ConvertStage>();
  }
  if (name == "prepare") {
    return std::make_shared<PrepareStage>();
  }
  if (name == "dock") {
    return std::make_shared<DockingStage>();
  }
  if (name == "extract") {
    return std::make_shared<ExtractStage>();
  }
  if (name == "visualize") {
    return std::make_shared<VisualizeStage>();
  }
  if (auto logger = Logger::Get()) {
    logger->error("StageFactory: unknown stage '{}'.", name);
  }
  return nullptr;
}

std::vector<std::shared_ptr<IStage>> createStages(const std::vector<std::string>& names) {
  std::vector<std::shared_ptr<IStage>> stages;
  stages.reserve(names.size());
  for (const auto& name : names) {
    auto stage = createStage(name);
    if (!stage) {
      throw ConfigError("unknown stage '" + name + "'");
    }
    stages.push_back(stage);
  }
  return stages;
}

} // namespace dockpipe
