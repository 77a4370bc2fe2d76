#include "dockpipe/stages/VisualizeStage.hpp"

#include <system_error>

#include "dockpipe/core/Errors.hpp"
#include "dockpipe/core/Logger.hpp"
#include "dockpipe/io/FileScan.hpp"

namespace dockpipe {

namespace {

constexpr const char* kPoseSuffix = "_out.pdbqt";

bool renderInto(StageContext_t& context,
                const ArtifactKey_t& key,
                const std::string& tool,
                TemplateValues values) {
  if (!context.store.shouldBuild(key, context.config.forceRebuild)) {
    return true;
  }
  values["output"] = context.store.stagingFor(key).string();
  context.tools.invokeOrThrow(tool, values);
  return context.store.commit(key);
}

} // namespace

std::filesystem::path complexReceptorFor(const ArtifactStore& store, const std::string& receptorName) {
  std::error_code ec;
  const auto raw = store.locationFor({ArtifactKind_e::kRawReceptor, receptorName, {}});
  if (std::filesystem::is_regular_file(raw, ec)) {
    return raw;
  }
  const auto prepared = store.locationFor({ArtifactKind_e::kReceptor, receptorName, {}});
  if (std::filesystem::is_regular_file(prepared, ec)) {
    return prepared;
  }
  return {};
}

void VisualizeStage::renderLigands(StageContext_t& context) const {
  auto logger = Logger::GetClass("VisualizeStage");
  const ArtifactLayout_t& layout = context.store.layout();
  const auto ligands = listFiles(layout.ligandSdfDir, {".sdf", ".mol2"});
  if (ligands.empty()) {
    if (logger) {
      logger->info("[INFO] No ligand files found in {}", layout.ligandSdfDir.string());
    }
    return;
  }
  for (const auto& ligand : ligands) {
    const ArtifactKey_t key{ArtifactKind_e::kLigandImage, ligand.stem().string(), {}};
    if (renderInto(context, key, "depictLigand", {{"input", ligand.string()}})) {
      if (logger) {
        logger->info("Saved 2D image: {}", context.store.locationFor(key).string());
      }
    } else if (logger) {
      logger->warn("[WARN] Failed to render ligand: {}", ligand.filename().string());
    }
  }
}

void VisualizeStage::renderComplexes(StageContext_t& context) const {
  auto logger = Logger::GetClass("VisualizeStage");
  const ArtifactLayout_t& layout = context.store.layout();
  std::error_code ec;
  if (!std::filesystem::is_directory(layout.dockingDir, ec)) {
    throw MissingInputError("Docking directory " + layout.dockingDir.string() + " not found.");
  }

  std::size_t poses = 0;
  for (const auto& pose : listFiles(layout.dockingDir, {kPoseSuffix})) {
    const std::string fileName = pose.filename().string();
    const std::string stem = fileName.substr(0, fileName.size() - std::string(kPoseSuffix).size());
    const auto pair = splitPairStem(stem);
    if (!pair) {
      continue;
    }
    ++poses;
    const std::filesystem::path receptor = complexReceptorFor(context.store, pair->first);
    if (receptor.empty() && logger) {
      logger->warn("[WARN] No structure found for receptor {}; rendering the pose alone", pair->first);
    }

    const ArtifactKey_t flatKey{ArtifactKind_e::kComplexFlatImage, pair->first, pair->second};
    if (renderInto(context, flatKey, "renderComplex",
                   {{"mode", "flat"}, {"pose", pose.string()}, {"receptor", receptor.string()}})) {
      if (logger) {
        logger->info("Saved 2D-style complex image: {}", context.store.locationFor(flatKey).string());
      }
    } else if (logger) {
      logger->warn("[WARN] Failed to render flat complex for {}", fileName);
    }

    const ArtifactKey_t imageKey{ArtifactKind_e::kComplexImage, pair->first, pair->second};
    if (renderInto(context, imageKey, "renderComplex",
                   {{"mode", "ray"}, {"pose", pose.string()}, {"receptor", receptor.string()}})) {
      if (logger) {
        logger->info("Saved 3D complex image: {}", context.store.locationFor(imageKey).string());
      }
    } else if (logger) {
      logger->warn("[WARN] Failed to render 3D complex for {}", fileName);
    }
  }

  if (poses == 0 && logger) {
    logger->info("[INFO] No vina output files (*__*{}) found in {}", kPoseSuffix, layout.dockingDir.string());
  }
}

int VisualizeStage::run(StageContext_t& context) {
  renderLigands(context);
  renderComplexes(context);
  if (auto logger = Logger::GetClass("VisualizeStage")) {
    logger->info("Visualizations saved under {}", context.store.layout().visualizationDir.string());
  }
  return 0;
}

} // namespace dockpipe
