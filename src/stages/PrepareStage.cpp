#include "dockpipe/stages/PrepareStage.hpp"

#include <map>
#include <system_error>

#include "dockpipe/core/Errors.hpp"
#include "dockpipe/core/Logger.hpp"
#include "dockpipe/io/FileScan.hpp"

namespace dockpipe {

namespace {

// Scratch directory for alternate-location split output, kept out of the protein inputs.
constexpr const char* kSplitDir = ".altloc";

} // namespace

std::vector<std::filesystem::path> collectLigandInputs(const std::vector<std::filesystem::path>& directories) {
  std::map<std::string, std::filesystem::path> byStem;
  for (const auto& dir : directories) {
    for (const auto& file : listFiles(dir, {".pdb", ".mol2", ".sdf"})) {
      byStem.emplace(file.stem().string(), file);
    }
  }
  std::vector<std::filesystem::path> inputs;
  inputs.reserve(byStem.size());
  for (const auto& entry : byStem) {
    inputs.push_back(entry.second);
  }
  return inputs;
}

std::optional<std::filesystem::path> selectSplitOutput(const std::filesystem::path& splitPrefix) {
  std::error_code ec;
  for (const char* conformer : {"_A.pdb", "_B.pdb"}) {
    const std::filesystem::path candidate = splitPrefix.string() + conformer;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }

  // `<stem>_split.pdb` -> `<stem>_split`
  const std::string base = splitPrefix.stem().string();
  std::optional<std::filesystem::path> newest;
  std::filesystem::file_time_type newestTime{};
  for (const auto& file : listFiles(splitPrefix.parent_path(), {".pdb"})) {
    if (file.filename().string().compare(0, base.size(), base) != 0) {
      continue;
    }
    const auto time = std::filesystem::last_write_time(file, ec);
    if (ec) {
      continue;
    }
    if (!newest || time > newestTime) {
      newest = file;
      newestTime = time;
    }
  }
  return newest;
}

std::filesystem::path PrepareStage::splitAltLocs(StageContext_t& context, const std::filesystem::path& pdb) const {
  if (!context.config.preparation.splitAltLocs) {
    return pdb;
  }
  auto logger = Logger::GetClass("PrepareStage");
  const std::filesystem::path scratch = context.store.layout().receptorDir / kSplitDir;
  std::error_code ec;
  std::filesystem::create_directories(scratch, ec);
  if (ec) {
    if (logger) {
      logger->warn("[WARN] cannot create {} ({}); using {}", scratch.string(), ec.message(), pdb.filename().string());
    }
    return pdb;
  }

  const std::filesystem::path prefix = scratch / (pdb.stem().string() + "_split.pdb");
  const ProcessResult_t result =
      context.tools.invoke("splitAltLocs", {{"input", pdb.string()}, {"output", prefix.string()}});
  if (result.outcome == ProcessOutcome_e::kInterrupted) {
    throw InterruptedError(result.signalNumber);
  }
  if (!result.ok()) {
    if (logger) {
      logger->warn("[WARN] alt-loc split failed for {} (exit {}); using original", pdb.filename().string(),
                   result.exitStatus);
    }
    return pdb;
  }
  if (auto split = selectSplitOutput(prefix)) {
    if (logger) {
      logger->info("Using split conformer {}", split->filename().string());
    }
    return *split;
  }
  if (logger) {
    logger->warn("[WARN] alt-loc split wrote nothing for {}; using original", pdb.filename().string());
  }
  return pdb;
}

bool PrepareStage::prepareReceptor(StageContext_t& context, const std::filesystem::path& pdb) const {
  auto logger = Logger::GetClass("PrepareStage");
  const std::string stem = pdb.stem().string();
  if (!isPairIdentifier(stem)) {
    if (logger) {
      logger->warn("[WARN] Skipping receptor {}: name cannot contain '{}' or start or end with '_'",
                   pdb.filename().string(), kPairDelimiter);
    }
    return false;
  }
  const ArtifactKey_t key{ArtifactKind_e::kReceptor, stem, {}};
  if (!context.store.shouldBuild(key, context.config.forceRebuild)) {
    return true;
  }

  const std::filesystem::path input = splitAltLocs(context, pdb);
  const auto staging = context.store.stagingFor(key);
  context.tools.invokeOrThrow("prepareReceptor", {{"input", input.string()}, {"output", staging.string()}});
  if (!context.store.commit(key)) {
    if (logger) {
      logger->warn("[WARN] Receptor preparation produced no output for {}", pdb.filename().string());
    }
    return false;
  }
  if (logger) {
    logger->info("[OK] Receptor -> {}", context.store.locationFor(key).string());
  }
  return true;
}

bool PrepareStage::prepareLigand(StageContext_t& context, const std::filesystem::path& input) const {
  auto logger = Logger::GetClass("PrepareStage");
  const std::string stem = input.stem().string();
  if (!isPairIdentifier(stem)) {
    if (logger) {
      logger->warn("[WARN] Skipping ligand {}: name cannot contain '{}' or start or end with '_'",
                   input.filename().string(), kPairDelimiter);
    }
    return false;
  }
  const ArtifactKey_t key{ArtifactKind_e::kLigand, stem, {}};
  if (!context.store.shouldBuild(key, context.config.forceRebuild)) {
    return true;
  }

  // The ligand tool resolves its input relative to the working directory.
  const auto staging = std::filesystem::absolute(context.store.stagingFor(key));
  context.tools.invokeOrThrow("prepareLigand",
                              {{"input", input.filename().string()}, {"output", staging.string()}},
                              input.parent_path());
  if (!context.store.commit(key)) {
    if (logger) {
      logger->warn("[WARN] Ligand preparation produced no output for {}", input.filename().string());
    }
    return false;
  }
  if (logger) {
    logger->info("[OK] Ligand -> {}", context.store.locationFor(key).string());
  }
  return true;
}

int PrepareStage::run(StageContext_t& context) {
  auto logger = Logger::GetClass("PrepareStage");
  const ArtifactLayout_t& layout = context.store.layout();

  const auto receptors = listFiles(layout.proteinDir, {".pdb"});
  if (receptors.empty() && logger) {
    logger->info("[INFO] No .pdb files found in {}.", layout.proteinDir.string());
  }
  std::size_t receptorsReady = 0;
  for (const auto& pdb : receptors) {
    if (prepareReceptor(context, pdb)) {
      ++receptorsReady;
    }
  }

  const auto ligands = collectLigandInputs({layout.ligandPdbDir, layout.ligandSdfDir});
  if (ligands.empty() && logger) {
    logger->info("[INFO] No ligand files found in {} or {}.", layout.ligandPdbDir.string(),
                 layout.ligandSdfDir.string());
  }
  std::size_t ligandsReady = 0;
  for (const auto& ligand : ligands) {
    if (prepareLigand(context, ligand)) {
      ++ligandsReady;
    }
  }

  if (logger) {
    logger->info("Receptors prepared: {} / {}", receptorsReady, receptors.size());
    logger->info("Ligands prepared: {} / {}", ligandsReady, ligands.size());
  }
  if ((!receptors.empty() && receptorsReady == 0) || (!ligands.empty() && ligandsReady == 0)) {
    throw NoArtifactsError(std::string("preparation produced no ") +
                           (receptorsReady == 0 && !receptors.empty() ? "receptors" : "ligands"));
  }
  return 0;
}

} // namespace dockpipe
