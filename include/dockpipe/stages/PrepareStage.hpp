#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "dockpipe/pipeline/Stage.hpp"

namespace dockpipe {

// One ligand file per stem; earlier directories win. Sorted by stem.
std::vector<std::filesystem::path> collectLigandInputs(const std::vector<std::filesystem::path>& directories);

// Picks the split-tool output for `splitPrefix` (`.../<stem>_split.pdb`):
// the A conformer, then B, then the newest `<stem>_split*.pdb`.
std::optional<std::filesystem::path> selectSplitOutput(const std::filesystem::path& splitPrefix);

// Receptor and ligand PDBQT preparation with the AutoDock utilities.
class PrepareStage final : public IStage {
public:
  std::string name() const override { return "prepare"; }
  std::string description() const override { return "Preparing receptors and ligands..."; }
  std::vector<std::string> environments() const override { return {"mgltools"}; }
  int run(StageContext_t& context) override;

private:
  std::filesystem::path splitAltLocs(StageContext_t& context, const std::filesystem::path& pdb) const;
  bool prepareReceptor(StageContext_t& context, const std::filesystem::path& pdb) const;
  bool prepareLigand(StageContext_t& context, const std::filesystem::path& input) const;
};

} // namespace dockpipe
