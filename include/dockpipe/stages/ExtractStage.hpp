#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "dockpipe/docking/ResultParser.hpp"
#include "dockpipe/pipeline/Stage.hpp"

namespace dockpipe {

struct AffinityRecord_t {
  std::string protein;
  std::string ligand;
  std::optional<double> score;
};

// One record per `*.log` in `dockingDir`, sorted by file name. Stems that do not
// split into exactly two identifiers carry the whole stem in both columns.
std::vector<AffinityRecord_t> collectAffinities(const std::filesystem::path& dockingDir, const ResultParser& parser);

void writeAffinityCsv(std::ostream& out, const std::vector<AffinityRecord_t>& records);

// Builds the affinity table from the docking logs. Rewritten on every run.
class ExtractStage final : public IStage {
public:
  std::string name() const override { return "extract"; }
  std::string description() const override { return "Extracting binding affinities..."; }
  std::vector<std::string> environments() const override { return {}; }
  int run(StageContext_t& context) override;
};

} // namespace dockpipe
