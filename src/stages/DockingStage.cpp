#include "dockpipe/stages/DockingStage.hpp"

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>

#include "dockpipe/core/Errors.hpp"
#include "dockpipe/core/Logger.hpp"
#include "dockpipe/docking/BoundingBox.hpp"
#include "dockpipe/docking/ResultParser.hpp"
#include "dockpipe/io/FileScan.hpp"

namespace dockpipe {

namespace {

TemplateValues dockingValues(const DockingConfig_t& docking,
                             const BoundingBox_t& box,
                             const std::filesystem::path& receptor,
                             const std::filesystem::path& ligand,
                             const std::filesystem::path& output) {
  return {{"receptor", receptor.string()},
          {"ligand", ligand.string()},
          {"center_x", formatNumber(box.center.x())},
          {"center_y", formatNumber(box.center.y())},
          {"center_z", formatNumber(box.center.z())},
          {"size_x", formatNumber(box.size.x())},
          {"size_y", formatNumber(box.size.y())},
          {"size_z", formatNumber(box.size.z())},
          {"exhaustiveness", std::to_string(docking.exhaustiveness)},
          {"verbosity", std::to_string(docking.verbosity)},
          {"output", output.string()}};
}

} // namespace

std::vector<std::string> formatAffinityTable(const std::vector<AffinityRow_t>& rows) {
  std::vector<std::string> lines;
  lines.push_back(fmt::format("{:<30} {:<30} {:>20}", "Protein", "Ligand", "Affinity (kcal/mol)"));
  lines.push_back(std::string(82, '-'));
  for (const auto& row : rows) {
    const std::string score = row.score ? fmt::format("{:.2f}", *row.score) : "N/A";
    lines.push_back(fmt::format("{:<30} {:<30} {:>20}", row.receptor, row.ligand, score));
  }
  return lines;
}

int DockingStage::run(StageContext_t& context) {
  auto logger = Logger::GetClass("DockingStage");
  const PipelineConfig_t& config = context.config;
  const ArtifactLayout_t& layout = context.store.layout();
  rows.clear();

  const auto receptors = listFiles(layout.receptorDir, {".pdbqt"});
  if (receptors.empty()) {
    throw MissingInputError("No receptor PDBQT files found in " + layout.receptorDir.string());
  }
  const auto ligands = listFiles(layout.ligandDir, {".pdbqt"});
  if (ligands.empty()) {
    throw MissingInputError("No ligand PDBQT files found in " + layout.ligandDir.string());
  }

  BoundingBoxCalculator boxes(config.docking.box, config.docking.manualBoxes);
  const ResultParser logParser(config.docking.resultFormat);

  for (const auto& receptor : receptors) {
    const std::string receptorName = receptor.stem().string();
    for (const auto& ligand : ligands) {
      const std::string ligandName = ligand.stem().string();
      if (!isPairIdentifier(receptorName) || !isPairIdentifier(ligandName)) {
        if (logger) {
          logger->warn("[WARN] Skipping {} + {}: names cannot contain '{}' or start or end with '_'", receptorName, ligandName,
                       kPairDelimiter);
        }
        continue;
      }

      const ArtifactKey_t poseKey{ArtifactKind_e::kDockingPose, receptorName, ligandName};
      const ArtifactKey_t logKey{ArtifactKind_e::kDockingLog, receptorName, ligandName};
      if (!context.store.shouldBuild(poseKey, config.forceRebuild)) {
        // The pose decides for the pair; its log is reused with it.
        const bool logPresent = !context.store.shouldBuild(logKey, false);
        rows.push_back({receptorName, ligandName,
                        logPresent ? logParser.parseFile(context.store.locationFor(logKey)).score : std::nullopt});
        continue;
      }

      const BoundingBox_t box = boxes.forReceptor(receptorName, receptor);
      if (logger) {
        logger->info("Running docking: {} + {}", receptor.filename().string(), ligand.filename().string());
        logger->info("  Search box ({}): center=({:.2f}, {:.2f}, {:.2f}), size=({:.2f}, {:.2f}, {:.2f})",
                     toString(box.provenance), box.center.x(), box.center.y(), box.center.z(), box.size.x(),
                     box.size.y(), box.size.z());
      }

      const auto poseStaging = context.store.stagingFor(poseKey);
      const auto logStaging = context.store.stagingFor(logKey);
      ResultParser streaming(config.docking.resultFormat);
      {
        std::ofstream pairLog(logStaging);
        if (!pairLog.is_open()) {
          throw std::runtime_error("cannot open docking log " + logStaging.string());
        }
        context.tools.invokeOrThrow("dock",
                                    dockingValues(config.docking, box, receptor, ligand, poseStaging),
                                    {},
                                    [&](const std::string& line) {
                                      pairLog << line << '\n';
                                      streaming.consume(line);
                                    });
        pairLog.close();
        if (!pairLog) {
          throw std::runtime_error("failed writing docking log " + logStaging.string());
        }
      }

      // The pose decides skip-vs-build, so it is committed last.
      context.store.commit(logKey);
      if (!context.store.commit(poseKey)) {
        if (logger) {
          logger->warn("[WARN] Docking produced no pose for {} + {}", receptorName, ligandName);
        }
      } else if (logger) {
        logger->info("[OK] Docking complete. Output: {}", context.store.locationFor(poseKey).string());
      }

      const ScoreResult_t score = streaming.result();
      if (!score.score && logger) {
        logger->warn("No affinity found for {} + {} ({})", receptorName, ligandName, toString(score.status));
      }
      rows.push_back({receptorName, ligandName, score.score});
    }
  }

  if (logger) {
    logger->info("Docking summary:");
    for (const auto& line : formatAffinityTable(rows)) {
      logger->info("{}", line);
    }
  }
  return 0;
}

} // namespace dockpipe
