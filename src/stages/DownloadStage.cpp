#include "dockpipe/stages/DownloadStage.hpp"

#include <algorithm>

#include "dockpipe/core/Logger.hpp"
#include "dockpipe/io/FileScan.hpp"

namespace dockpipe {

namespace {

bool isSkipped(const std::vector<std::string>& skipList, const std::string& ligand) {
  const std::string wanted = toUpper(ligand);
  return std::any_of(skipList.begin(), skipList.end(), [&](const std::string& item) {
    return toUpper(item) == wanted;
  });
}

} // namespace

int DownloadStage::run(StageContext_t& context) {
  auto logger = Logger::GetClass("DownloadStage");
  const PipelineConfig_t& config = context.config;
  const DownloadConfig_t& download = config.download;

  std::size_t requested = 0;
  std::size_t available = 0;

  for (const auto& entry : download.structures) {
    const std::string& label = entry.first;
    const std::string& id = entry.second;
    ++requested;
    const ArtifactKey_t key{ArtifactKind_e::kRawReceptor, id, {}};
    if (!context.store.shouldBuild(key, config.forceRebuild)) {
      ++available;
      continue;
    }
    if (logger) {
      logger->info("Downloading {} ({})...", label, id);
    }
    const auto staging = context.store.stagingFor(key);
    context.tools.invokeOrThrow("fetchStructure", {{"id", id}, {"label", label}, {"output", staging.string()}});
    if (context.store.commit(key)) {
      ++available;
      if (logger) {
        logger->info("[OK] Saved {} -> {}", id, context.store.locationFor(key).string());
      }
    } else if (logger) {
      logger->warn("[WARN] Failed to download PDB {}: no file was written", id);
    }
  }

  for (const auto& ligand : download.ligands) {
    if (isSkipped(download.skipLigands, ligand)) {
      if (logger) {
        logger->info("Skipping antibody ligand {}", ligand);
      }
      continue;
    }
    ++requested;
    const ArtifactKey_t key{ArtifactKind_e::kRawLigand, ligand, {}};
    if (!context.store.shouldBuild(key, config.forceRebuild)) {
      ++available;
      continue;
    }
    if (logger) {
      logger->info("Downloading ligand {}...", ligand);
    }
    const auto staging = context.store.stagingFor(key);
    context.tools.invokeOrThrow("fetchLigand", {{"name", ligand}, {"output", staging.string()}});
    if (context.store.commit(key)) {
      ++available;
      if (logger) {
        logger->info("[OK] Saved {} -> {}", ligand, context.store.locationFor(key).string());
      }
    } else if (logger) {
      logger->warn("[WARN] Failed to download ligand {}: no file was written", ligand);
    }
  }

  if (logger) {
    if (requested == 0) {
      logger->info("[INFO] No structures or ligands configured for download.");
    } else {
      logger->info("Download summary: {} / {} files available", available, requested);
    }
  }
  return 0;
}

} // namespace dockpipe
