#include "dockpipe/stages/ConvertStage.hpp"

#include "dockpipe/core/Logger.hpp"
#include "dockpipe/io/FileScan.hpp"

namespace dockpipe {

int ConvertStage::run(StageContext_t& context) {
  auto logger = Logger::GetClass("ConvertStage");
  const ArtifactLayout_t& layout = context.store.layout();
  const auto inputs = listFiles(layout.ligandSdfDir, {".sdf"});
  if (inputs.empty()) {
    if (logger) {
      logger->info("[INFO] No SDF files in {}", layout.ligandSdfDir.string());
    }
    return 0;
  }

  std::size_t converted = 0;
  for (const auto& input : inputs) {
    const std::string stem = input.stem().string();
    const ArtifactKey_t key{ArtifactKind_e::kLigandPdb, stem, {}};
    if (!context.store.shouldBuild(key, context.config.forceRebuild)) {
      ++converted;
      continue;
    }
    const auto staging = context.store.stagingFor(key);
    context.tools.invokeOrThrow("convertLigand", {{"input", input.string()}, {"output", staging.string()}});
    if (context.store.commit(key)) {
      ++converted;
      if (logger) {
        logger->info("[OK] {} -> {}", input.filename().string(), context.store.locationFor(key).string());
      }
    } else if (logger) {
      logger->warn("[WARN] converter produced no PDB for {}", input.filename().string());
    }
  }

  if (logger) {
    logger->info("[DONE] Converted {}/{} SDF to PDB in {}", converted, inputs.size(), layout.ligandPdbDir.string());
  }
  return 0;
}

} // namespace dockpipe
