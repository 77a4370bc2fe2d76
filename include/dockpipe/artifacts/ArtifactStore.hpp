#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace dockpipe {

enum class ArtifactKind_e {
  kRawReceptor,
  kRawLigand,
  kLigandPdb,
  kReceptor,
  kLigand,
  kDockingPose,
  kDockingLog,
  kAffinityTable,
  kLigandImage,
  kComplexFlatImage,
  kComplexImage
};

// Logical identity of an artifact. Pair kinds use both identifiers (receptor, ligand).
struct ArtifactKey_t {
  ArtifactKind_e kind = ArtifactKind_e::kReceptor;
  std::string primary;
  std::string secondary;
};

struct ArtifactLayout_t {
  std::filesystem::path proteinDir = "data/proteins";
  std::filesystem::path ligandSdfDir = "data/ligands";
  std::filesystem::path ligandPdbDir = "data/ligands_pdb";
  std::filesystem::path receptorDir = "results/docking/receptors";
  std::filesystem::path ligandDir = "results/docking/ligands";
  std::filesystem::path dockingDir = "results/docking/vina_outputs";
  std::filesystem::path affinityTable = "results/binding_energies.csv";
  std::filesystem::path visualizationDir = "results/visualizations";
  // Sub-directories of visualizationDir.
  std::string ligandImageSubdir = "2D";
  std::string complexFlatSubdir = "2D_complex";
  std::string complexImageSubdir = "3D";
};

constexpr const char* kPairDelimiter = "__";

// `<receptor>__<ligand>`; throws std::invalid_argument when an identifier would break the join key.
std::string pairStem(const std::string& receptor, const std::string& ligand);
// Inverse of pairStem; nullopt unless the stem holds exactly one delimiter.
std::optional<std::pair<std::string, std::string>> splitPairStem(const std::string& stem);
// Non-empty, no delimiter, and no leading or trailing '_'.
bool isPairIdentifier(const std::string& name);

// Maps artifact keys to files and decides skip-vs-build from file presence.
// Producers write to stagingFor(key); commit() moves the finished file into place,
// so a file at locationFor(key) is always the output of a completed step.
class ArtifactStore {
public:
  explicit ArtifactStore(ArtifactLayout_t layout);

  std::filesystem::path locationFor(const ArtifactKey_t& key) const;
  bool exists(const ArtifactKey_t& key) const;
  bool shouldBuild(const ArtifactKey_t& key, bool forceRebuild) const;

  // Fresh staging path with its directory created and any stale file removed.
  std::filesystem::path stagingFor(const ArtifactKey_t& key) const;
  // Renames the staged file over the artifact. False when nothing was staged.
  bool commit(const ArtifactKey_t& key) const;

  const ArtifactLayout_t& layout() const { return artifactLayout; }

private:
  ArtifactLayout_t artifactLayout;
};

const char* toString(ArtifactKind_e kind);

} // namespace dockpipe
