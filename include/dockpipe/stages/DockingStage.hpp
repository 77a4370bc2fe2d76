#pragma once

#include <optional>
#include <string>
#include <vector>

#include "dockpipe/pipeline/Stage.hpp"

namespace dockpipe {

struct AffinityRow_t {
  std::string receptor;
  std::string ligand;
  std::optional<double> score;
};

// Summary table lines, header first; an absent score reads "N/A".
std::vector<std::string> formatAffinityTable(const std::vector<AffinityRow_t>& rows);

// Docks every prepared receptor against every prepared ligand.
class DockingStage final : public IStage {
public:
  std::string name() const override { return "dock"; }
  std::string description() const override { return "Running molecular docking..."; }
  std::vector<std::string> environments() const override { return {"vina"}; }
  int run(StageContext_t& context) override;

  // Rows of the last run, in docking order.
  const std::vector<AffinityRow_t>& results() const { return rows; }

private:
  std::vector<AffinityRow_t> rows;
};

} // namespace dockpipe
