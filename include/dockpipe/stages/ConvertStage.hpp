#pragma once

#include "dockpipe/pipeline/Stage.hpp"

namespace dockpipe {

// SDF ligand records to PDB through the small-molecule toolkit.
class ConvertStage final : public IStage {
public:
  std::string name() const override { return "convert"; }
  std::string description() const override { return "Converting ligand SDF files to PDB..."; }
  std::vector<std::string> environments() const override { return {"chem"}; }
  int run(StageContext_t& context) override;
};

} // namespace dockpipe
