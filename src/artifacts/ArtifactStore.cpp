#include "dockpipe/artifacts/ArtifactStore.hpp"

#include <stdexcept>
#include <system_error>

#include "dockpipe/core/Logger.hpp"

namespace dockpipe {

namespace {

constexpr const char* kStagingDir = ".staging";

bool isPairKind(ArtifactKind_e kind) {
  return kind == ArtifactKind_e::kDockingPose || kind == ArtifactKind_e::kDockingLog ||
         kind == ArtifactKind_e::kComplexFlatImage || kind == ArtifactKind_e::kComplexImage;
}

} // namespace

bool isPairIdentifier(const std::string& name) {
  // An edge underscore would merge into the delimiter and make the join key ambiguous.
  return !name.empty() && name.front() != '_' && name.back() != '_' &&
         name.find(kPairDelimiter) == std::string::npos;
}

std::string pairStem(const std::string& receptor, const std::string& ligand) {
  if (!isPairIdentifier(receptor) || !isPairIdentifier(ligand)) {
    throw std::invalid_argument("identifier cannot form a join key: '" + receptor + "', '" + ligand + "'");
  }
  return receptor + kPairDelimiter + ligand;
}

std::optional<std::pair<std::string, std::string>> splitPairStem(const std::string& stem) {
  const std::string delimiter(kPairDelimiter);
  const auto pos = stem.find(delimiter);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  const std::string rest = stem.substr(pos + delimiter.size());
  if (rest.find(delimiter) != std::string::npos) {
    return std::nullopt;
  }
  return std::make_pair(stem.substr(0, pos), rest);
}

ArtifactStore::ArtifactStore(ArtifactLayout_t layout) : artifactLayout(std::move(layout)) {}

std::filesystem::path ArtifactStore::locationFor(const ArtifactKey_t& key) const {
  const ArtifactLayout_t& l = artifactLayout;
  if (isPairKind(key.kind)) {
    const std::string stem = pairStem(key.primary, key.secondary);
    switch (key.kind) {
      case ArtifactKind_e::kDockingPose:
        return l.dockingDir / (stem + "_out.pdbqt");
      case ArtifactKind_e::kDockingLog:
        return l.dockingDir / (stem + ".log");
      case ArtifactKind_e::kComplexFlatImage:
        return l.visualizationDir / l.complexFlatSubdir / (stem + "_out__flat.png");
      case ArtifactKind_e::kComplexImage:
        return l.visualizationDir / l.complexImageSubdir / (stem + "_out.png");
      default:
        break;
    }
  }
  switch (key.kind) {
    case ArtifactKind_e::kRawReceptor:
      return l.proteinDir / (key.primary + ".pdb");
    case ArtifactKind_e::kRawLigand:
      return l.ligandSdfDir / (key.primary + ".sdf");
    case ArtifactKind_e::kLigandPdb:
      return l.ligandPdbDir / (key.primary + ".pdb");
    case ArtifactKind_e::kReceptor:
      return l.receptorDir / (key.primary + ".pdbqt");
    case ArtifactKind_e::kLigand:
      return l.ligandDir / (key.primary + ".pdbqt");
    case ArtifactKind_e::kAffinityTable:
      return l.affinityTable;
    case ArtifactKind_e::kLigandImage:
      return l.visualizationDir / l.ligandImageSubdir / (key.primary + ".png");
    default:
      break;
  }
  throw std::invalid_argument(std::string("no location for artifact kind ") + toString(key.kind));
}

bool ArtifactStore::exists(const ArtifactKey_t& key) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(locationFor(key), ec);
}

bool ArtifactStore::shouldBuild(const ArtifactKey_t& key, bool forceRebuild) const {
  if (!forceRebuild && exists(key)) {
    if (auto logger = Logger::GetClass("ArtifactStore")) {
      logger->info("[SKIP] {} exists -> {}", toString(key.kind), locationFor(key).string());
    }
    return false;
  }
  return true;
}

std::filesystem::path ArtifactStore::stagingFor(const ArtifactKey_t& key) const {
  const std::filesystem::path target = locationFor(key);
  const std::filesystem::path staging = target.parent_path() / kStagingDir / target.filename();
  std::error_code ec;
  std::filesystem::create_directories(staging.parent_path(), ec);
  if (ec) {
    throw std::filesystem::filesystem_error("cannot create staging directory", staging.parent_path(), ec);
  }
  std::filesystem::remove(staging, ec);
  return staging;
}

bool ArtifactStore::commit(const ArtifactKey_t& key) const {
  const std::filesystem::path target = locationFor(key);
  const std::filesystem::path staging = target.parent_path() / kStagingDir / target.filename();
  std::error_code ec;
  if (!std::filesystem::is_regular_file(staging, ec)) {
    return false;
  }
  std::filesystem::rename(staging, target, ec);
  if (ec) {
    throw std::filesystem::filesystem_error("cannot commit artifact", staging, target, ec);
  }
  return true;
}

const char* toString(ArtifactKind_e kind) {
  switch (kind) {
    case ArtifactKind_e::kRawReceptor:
      return "Protein";
    case ArtifactKind_e::kRawLigand:
      return "Ligand SDF";
    case ArtifactKind_e::kLigandPdb:
      return "Ligand PDB";
    case ArtifactKind_e::kReceptor:
      return "Receptor";
    case ArtifactKind_e::kLigand:
      return "Ligand";
    case ArtifactKind_e::kDockingPose:
      return "Docking pose";
    case ArtifactKind_e::kDockingLog:
      return "Docking log";
    case ArtifactKind_e::kAffinityTable:
      return "Affinity table";
    case ArtifactKind_e::kLigandImage:
      return "Ligand image";
    case ArtifactKind_e::kComplexFlatImage:
      return "Flat complex image";
    case ArtifactKind_e::kComplexImage:
      return "3D complex image";
  }
  return "Artifact";
}

} // namespace dockpipe
