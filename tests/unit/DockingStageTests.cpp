#include <algorithm>
#include <csignal>
#include <map>
#include <stdexcept>

#include <sys/resource.h>

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "dockpipe/core/Errors.hpp"
#include "dockpipe/io/FileScan.hpp"
#include "dockpipe/stages/DockingStage.hpp"

namespace {

std::string argAfter(const dockpipe::ProcessRequest_t& request, const std::string& flag) {
  auto it = std::find(request.args.begin(), request.args.end(), flag);
  if (it == request.args.end() || it + 1 == request.args.end()) {
    return {};
  }
  return *(it + 1);
}

// Caps the size of files this process writes, as a full disk would.
class ScopedFileSizeLimit final {
public:
  explicit ScopedFileSizeLimit(rlim_t bytes) {
    ::getrlimit(RLIMIT_FSIZE, &saved);
    previousHandler = std::signal(SIGXFSZ, SIG_IGN);
    rlimit limit = saved;
    limit.rlim_cur = bytes;
    ::setrlimit(RLIMIT_FSIZE, &limit);
  }
  ~ScopedFileSizeLimit() {
    ::setrlimit(RLIMIT_FSIZE, &saved);
    std::signal(SIGXFSZ, previousHandler);
  }

  ScopedFileSizeLimit(const ScopedFileSizeLimit&) = delete;
  ScopedFileSizeLimit& operator=(const ScopedFileSizeLimit&) = delete;

private:
  rlimit saved{};
  void (*previousHandler)(int) = SIG_DFL;
};

class DockingStageTests : public ::testing::Test {
protected:
  void SetUp() override {
    config = dockpipe::configUnder(temp.path());
    const std::string receptor = dockpipe::readFile(dockpipe::testDataPath("receptor_small.pdbqt"));
    dockpipe::writeFile(config.layout.receptorDir / "5CRB.pdbqt", receptor);
    dockpipe::writeFile(config.layout.receptorDir / "1IVS.pdbqt", receptor);
    dockpipe::writeFile(config.layout.ligandDir / "ATENOLOL.pdbqt", "ROOT\n");
    dockpipe::writeFile(config.layout.ligandDir / "MEROPENEM.pdbqt", "ROOT\n");

    dockpipe::FakeProcessRunner::Reply_t reply;
    reply.lines = {"AutoDock Vina", "REMARK VINA RESULT:    -7.1      0.000      0.000",
                   "REMARK VINA RESULT:    -6.0      1.000      2.000"};
    runner.script("dock", reply);
  }

  int runStage() {
    dockpipe::ArtifactStore store(config.layout);
    dockpipe::ToolInvoker tools(config, runner);
    dockpipe::StageContext_t context{config, store, tools};
    return stage.run(context);
  }

  dockpipe::ScopedTempDir temp;
  dockpipe::PipelineConfig_t config;
  dockpipe::FakeProcessRunner runner;
  dockpipe::DockingStage stage;
};

} // namespace

TEST_F(DockingStageTests, DocksEveryPairAndNamesOutputsByJoinKey) {
  ASSERT_EQ(runStage(), 0);

  EXPECT_EQ(runner.callsFor("dock"), 4u);
  const auto pose = config.layout.dockingDir / "5CRB__ATENOLOL_out.pdbqt";
  const auto log = config.layout.dockingDir / "5CRB__ATENOLOL.log";
  EXPECT_TRUE(std::filesystem::is_regular_file(pose));
  EXPECT_TRUE(std::filesystem::is_regular_file(log));
  EXPECT_TRUE(std::filesystem::is_regular_file(config.layout.dockingDir / "1IVS__MEROPENEM_out.pdbqt"));
  EXPECT_NE(dockpipe::readFile(log).find("REMARK VINA RESULT:    -7.1"), std::string::npos);

  ASSERT_EQ(stage.results().size(), 4u);
  EXPECT_EQ(stage.results()[0].receptor, "1IVS");
  EXPECT_EQ(stage.results()[0].ligand, "ATENOLOL");
  for (const auto& row : stage.results()) {
    ASSERT_TRUE(row.score.has_value());
    EXPECT_DOUBLE_EQ(*row.score, -7.1);
  }
}

TEST_F(DockingStageTests, PassesComputedBoxAndSearchSettings) {
  ASSERT_EQ(runStage(), 0);
  const auto& request = runner.requests.front();

  EXPECT_EQ(request.executable, "vina");
  EXPECT_EQ(argAfter(request, "--center_x"), "13");
  EXPECT_EQ(argAfter(request, "--center_y"), "1");
  EXPECT_EQ(argAfter(request, "--center_z"), "10");
  EXPECT_EQ(argAfter(request, "--size_x"), "28");
  EXPECT_EQ(argAfter(request, "--size_y"), "20");
  EXPECT_EQ(argAfter(request, "--size_z"), "22");
  EXPECT_EQ(argAfter(request, "--exhaustiveness"), "8");
  EXPECT_EQ(argAfter(request, "--verbosity"), "2");
  EXPECT_NE(argAfter(request, "--out").find("/.staging/"), std::string::npos);
}

TEST_F(DockingStageTests, ManualBoxOverridesComputation) {
  dockpipe::ManualBox_t manual;
  manual.center = dockpipe::Vector3(11.9145, 38.904, 40.986);
  manual.size = dockpipe::Vector3::Constant(28.0);
  config.docking.manualBoxes["5CRB"] = manual;
  ASSERT_EQ(runStage(), 0);

  for (const auto& request : runner.requests) {
    if (argAfter(request, "--receptor").find("5CRB") != std::string::npos) {
      EXPECT_EQ(argAfter(request, "--center_x"), "11.9145");
      EXPECT_EQ(argAfter(request, "--center_y"), "38.904");
      EXPECT_EQ(argAfter(request, "--size_z"), "28");
    }
  }
}

TEST_F(DockingStageTests, SecondRunSkipsExistingPairsButStillScoresThem) {
  ASSERT_EQ(runStage(), 0);
  ASSERT_EQ(runStage(), 0);

  EXPECT_EQ(runner.callsFor("dock"), 4u);
  ASSERT_EQ(stage.results().size(), 4u);
  EXPECT_DOUBLE_EQ(stage.results()[3].score.value(), -7.1);
}

TEST_F(DockingStageTests, SecondRunLogsSkipPerArtifactAndKeepsBytes) {
  ASSERT_EQ(runStage(), 0);
  std::map<std::filesystem::path, std::string> firstRun;
  for (const auto& file : dockpipe::listFiles(config.layout.dockingDir, {".pdbqt", ".log"})) {
    firstRun[file] = dockpipe::readFile(file);
  }
  ASSERT_EQ(firstRun.size(), 8u);

  dockpipe::ScopedLogCapture capture("ArtifactStore");
  ASSERT_EQ(runStage(), 0);

  EXPECT_EQ(capture.countContaining("[SKIP]"), 8u);
  for (const auto& entry : firstRun) {
    EXPECT_EQ(dockpipe::readFile(entry.first), entry.second) << entry.first;
  }
}

TEST_F(DockingStageTests, ForceRebuildRedocksEveryPair) {
  ASSERT_EQ(runStage(), 0);
  config.forceRebuild = true;
  ASSERT_EQ(runStage(), 0);
  EXPECT_EQ(runner.callsFor("dock"), 8u);
}

TEST_F(DockingStageTests, FailedDockingLeavesNoArtifactAndAborts) {
  dockpipe::FakeProcessRunner::Reply_t failing;
  failing.exitStatus = 3;
  failing.lines = {"ERROR: could not open receptor"};
  runner.script("dock", failing);

  EXPECT_THROW(runStage(), dockpipe::ChildProcessFailure);
  EXPECT_EQ(runner.callsFor("dock"), 1u);
  EXPECT_FALSE(std::filesystem::exists(config.layout.dockingDir / "1IVS__ATENOLOL_out.pdbqt"));
  EXPECT_FALSE(std::filesystem::exists(config.layout.dockingDir / "1IVS__ATENOLOL.log"));
}

TEST_F(DockingStageTests, TruncatedPairLogIsNeverCommitted) {
  dockpipe::FakeProcessRunner::Reply_t verbose;
  verbose.lines.assign(20, "Performing search ........................................ done");
  verbose.lines.push_back("REMARK VINA RESULT:    -7.1      0.000      0.000");
  runner.script("dock", verbose);

  {
    ScopedFileSizeLimit limit(256);
    EXPECT_THROW(runStage(), std::runtime_error);
  }
  EXPECT_FALSE(std::filesystem::exists(config.layout.dockingDir / "1IVS__ATENOLOL.log"));
  EXPECT_FALSE(std::filesystem::exists(config.layout.dockingDir / "1IVS__ATENOLOL_out.pdbqt"));
}

TEST_F(DockingStageTests, ZeroReceptorsIsMissingInput) {
  std::filesystem::remove_all(config.layout.receptorDir);
  EXPECT_THROW(runStage(), dockpipe::MissingInputError);
  EXPECT_TRUE(runner.requests.empty());
}

TEST_F(DockingStageTests, ZeroLigandsIsMissingInput) {
  std::filesystem::remove_all(config.layout.ligandDir);
  EXPECT_THROW(runStage(), dockpipe::MissingInputError);
}

TEST_F(DockingStageTests, SummaryTableShowsNotAvailable) {
  const auto lines = dockpipe::formatAffinityTable({{"5CRB", "ATENOLOL", -7.1}, {"1IVS", "GLUCOSAMINE", std::nullopt}});
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0].substr(0, 7), "Protein");
  EXPECT_NE(lines[0].find("Affinity (kcal/mol)"), std::string::npos);
  EXPECT_EQ(lines[2].substr(lines[2].size() - 5), "-7.10");
  EXPECT_EQ(lines[3].substr(lines[3].size() - 3), "N/A");
}
