#pragma once

#include "dockpipe/pipeline/Stage.hpp"

namespace dockpipe {

// Fetches the configured protein structures and ligand records.
class DownloadStage final : public IStage {
public:
  std::string name() const override { return "download"; }
  std::string description() const override { return "Downloading protein and ligand data..."; }
  std::vector<std::string> environments() const override { return {"fetch"}; }
  int run(StageContext_t& context) override;
};

} // namespace dockpipe
