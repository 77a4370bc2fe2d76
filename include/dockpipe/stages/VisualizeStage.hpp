#pragma once

#include <filesystem>
#include <string>

#include "dockpipe/pipeline/Stage.hpp"

namespace dockpipe {

// Structure file shown next to a docked pose: the raw protein when present,
// else the prepared receptor, else empty (the pose is rendered alone).
std::filesystem::path complexReceptorFor(const ArtifactStore& store, const std::string& receptorName);

// Ligand depictions and docked-complex renders.
class VisualizeStage final : public IStage {
public:
  std::string name() const override { return "visualize"; }
  std::string description() const override { return "Generating visualizations..."; }
  std::vector<std::string> environments() const override { return {"viz"}; }
  int run(StageContext_t& context) override;

private:
  void renderLigands(StageContext_t& context) const;
  void renderComplexes(StageContext_t& context) const;
};

} // namespace dockpipe
