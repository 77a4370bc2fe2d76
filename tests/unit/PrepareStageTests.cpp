#include <algorithm>
#include <iterator>

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "dockpipe/core/Errors.hpp"
#include "dockpipe/stages/PrepareStage.hpp"

namespace {

class PrepareStageTests : public ::testing::Test {
protected:
  void SetUp() override {
    config = dockpipe::configUnder(temp.path());
    config.preparation.splitAltLocs = false;
    dockpipe::writeFile(config.layout.proteinDir / "4G6J.pdb", "ATOM\n");
    dockpipe::writeFile(config.layout.proteinDir / "5CRB.pdb", "ATOM\n");
    dockpipe::writeFile(config.layout.ligandPdbDir / "ATENOLOL.pdb", "HETATM\n");
    dockpipe::writeFile(config.layout.ligandSdfDir / "ATENOLOL.sdf", "$$$$\n");
    dockpipe::writeFile(config.layout.ligandSdfDir / "MEROPENEM.SDF", "$$$$\n");
    dockpipe::writeFile(config.layout.ligandSdfDir / ".hidden.sdf", "$$$$\n");
    dockpipe::writeFile(config.layout.ligandSdfDir / "notes.txt", "not a ligand\n");
  }

  int runStage() {
    dockpipe::ArtifactStore store(config.layout);
    dockpipe::ToolInvoker tools(config, runner);
    dockpipe::StageContext_t context{config, store, tools};
    dockpipe::PrepareStage stage;
    return stage.run(context);
  }

  std::vector<dockpipe::ProcessRequest_t> requestsFor(const std::string& label) const {
    std::vector<dockpipe::ProcessRequest_t> matching;
    std::copy_if(runner.requests.begin(), runner.requests.end(), std::back_inserter(matching),
                 [&](const dockpipe::ProcessRequest_t& request) { return request.label == label; });
    return matching;
  }

  dockpipe::ScopedTempDir temp;
  dockpipe::PipelineConfig_t config;
  dockpipe::FakeProcessRunner runner;
};

} // namespace

TEST_F(PrepareStageTests, PreparesEveryReceptorAndUniqueLigand) {
  ASSERT_EQ(runStage(), 0);

  EXPECT_EQ(runner.callsFor("prepareReceptor"), 2u);
  EXPECT_EQ(runner.callsFor("prepareLigand"), 2u);
  EXPECT_TRUE(std::filesystem::is_regular_file(config.layout.receptorDir / "4G6J.pdbqt"));
  EXPECT_TRUE(std::filesystem::is_regular_file(config.layout.receptorDir / "5CRB.pdbqt"));
  EXPECT_TRUE(std::filesystem::is_regular_file(config.layout.ligandDir / "ATENOLOL.pdbqt"));
  EXPECT_TRUE(std::filesystem::is_regular_file(config.layout.ligandDir / "MEROPENEM.pdbqt"));
}

TEST_F(PrepareStageTests, ReceptorArgumentsCarryCleanupFlag) {
  ASSERT_EQ(runStage(), 0);
  const auto receptors = requestsFor("prepareReceptor");
  ASSERT_EQ(receptors.size(), 2u);
  const auto& args = receptors.front().args;
  EXPECT_EQ(args[2], (config.layout.proteinDir / "4G6J.pdb").string());
  EXPECT_NE(std::find(args.begin(), args.end(), "hydrogens"), args.end());
  EXPECT_EQ(args.back(), "nphs_lps_waters");
}

TEST_F(PrepareStageTests, LigandRunsInItsOwnDirectoryWithBasename) {
  ASSERT_EQ(runStage(), 0);
  const auto ligands = requestsFor("prepareLigand");
  ASSERT_EQ(ligands.size(), 2u);

  // ATENOLOL comes from the PDB directory, which takes priority over SDF.
  EXPECT_EQ(ligands[0].workingDirectory, config.layout.ligandPdbDir);
  EXPECT_EQ(ligands[0].args[2], "ATENOLOL.pdb");
  EXPECT_TRUE(std::filesystem::path(ligands[0].args[4]).is_absolute());
  EXPECT_EQ(ligands[0].args.back(), "checkhydrogens");

  EXPECT_EQ(ligands[1].workingDirectory, config.layout.ligandSdfDir);
  EXPECT_EQ(ligands[1].args[2], "MEROPENEM.SDF");
}

TEST_F(PrepareStageTests, SecondRunSkipsExistingArtifacts) {
  ASSERT_EQ(runStage(), 0);
  ASSERT_EQ(runStage(), 0);
  EXPECT_EQ(runner.requests.size(), 4u);
}

TEST_F(PrepareStageTests, NoReceptorOutputRaisesReservedStatus) {
  dockpipe::FakeProcessRunner::Reply_t silent;
  silent.writeOutputs = false;
  runner.script("prepareReceptor", silent);

  try {
    runStage();
    FAIL() << "expected NoArtifactsError";
  } catch (const dockpipe::NoArtifactsError& ex) {
    EXPECT_EQ(ex.exitStatus(), dockpipe::kExitNoArtifacts);
  }
  EXPECT_FALSE(std::filesystem::exists(config.layout.receptorDir / "4G6J.pdbqt"));
}

TEST_F(PrepareStageTests, ToolFailureAborts) {
  dockpipe::FakeProcessRunner::Reply_t failing;
  failing.exitStatus = 1;
  runner.script("prepareLigand", failing);
  EXPECT_THROW(runStage(), dockpipe::ChildProcessFailure);
}

TEST_F(PrepareStageTests, FailedAltLocSplitFallsBackToOriginal) {
  config.preparation.splitAltLocs = true;
  dockpipe::FakeProcessRunner::Reply_t failing;
  failing.exitStatus = 1;
  runner.script("splitAltLocs", failing);

  ASSERT_EQ(runStage(), 0);
  EXPECT_EQ(runner.callsFor("splitAltLocs"), 2u);
  const auto receptors = requestsFor("prepareReceptor");
  ASSERT_EQ(receptors.size(), 2u);
  EXPECT_EQ(receptors[0].args[2], (config.layout.proteinDir / "4G6J.pdb").string());
  EXPECT_TRUE(std::filesystem::is_regular_file(config.layout.receptorDir / "4G6J.pdbqt"));
}

TEST_F(PrepareStageTests, EmptyInputsAreNotAnError) {
  std::filesystem::remove_all(config.layout.proteinDir);
  std::filesystem::remove_all(config.layout.ligandPdbDir);
  std::filesystem::remove_all(config.layout.ligandSdfDir);
  EXPECT_EQ(runStage(), 0);
  EXPECT_TRUE(runner.requests.empty());
}

TEST(PrepareStageSelectionTests, PrefersConformerAThenB) {
  dockpipe::ScopedTempDir temp;
  const auto prefix = temp.path() / "5CRB_split.pdb";
  dockpipe::writeFile(prefix.string() + "_B.pdb", "B");
  dockpipe::writeFile(prefix.string() + "_A.pdb", "A");
  EXPECT_EQ(dockpipe::selectSplitOutput(prefix)->filename(), "5CRB_split.pdb_A.pdb");

  std::filesystem::remove(prefix.string() + "_A.pdb");
  EXPECT_EQ(dockpipe::selectSplitOutput(prefix)->filename(), "5CRB_split.pdb_B.pdb");

  std::filesystem::remove(prefix.string() + "_B.pdb");
  dockpipe::writeFile(temp.path() / "5CRB_split_C.pdb", "C");
  dockpipe::writeFile(temp.path() / "4G6J_split_A.pdb", "other receptor");
  EXPECT_EQ(dockpipe::selectSplitOutput(prefix)->filename(), "5CRB_split_C.pdb");

  std::filesystem::remove(temp.path() / "5CRB_split_C.pdb");
  EXPECT_FALSE(dockpipe::selectSplitOutput(prefix).has_value());
}

TEST(PrepareStageSelectionTests, LigandInputsAreUniqueByStem) {
  dockpipe::ScopedTempDir temp;
  dockpipe::writeFile(temp.path() / "pdb/ZED.pdb", "");
  dockpipe::writeFile(temp.path() / "sdf/ZED.sdf", "");
  dockpipe::writeFile(temp.path() / "sdf/ALPHA.mol2", "");
  dockpipe::writeFile(temp.path() / "sdf/readme.md", "");

  const auto inputs = dockpipe::collectLigandInputs({temp.path() / "pdb", temp.path() / "sdf"});
  ASSERT_EQ(inputs.size(), 2u);
  EXPECT_EQ(inputs[0].filename(), "ALPHA.mol2");
  EXPECT_EQ(inputs[1], temp.path() / "pdb/ZED.pdb");
}
