#pragma once

#include <memory>
#include <string>
#include <vector>

#include "dockpipe/pipeline/Stage.hpp"

namespace dockpipe {

// Creates a stage by its configured name; nullptr for unknown names.
std::shared_ptr<IStage> createStage(const std::string& name);

// All named stages in the given order; throws ConfigError on an unknown name.
std::vector<std::shared_ptr<IStage>> createStages(const std::vector<std::string>& names);

} // namespace dockpipe
