#include <sstream>

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "dockpipe/core/Errors.hpp"
#include "dockpipe/stages/ExtractStage.hpp"

namespace {

int runExtract(const dockpipe::PipelineConfig_t& config) {
  dockpipe::FakeProcessRunner runner;
  dockpipe::ArtifactStore store(config.layout);
  dockpipe::ToolInvoker tools(config, runner);
  dockpipe::StageContext_t context{config, store, tools};
  dockpipe::ExtractStage stage;
  return stage.run(context);
}

} // namespace

TEST(ExtractStageTests, WritesSortedAffinityTable) {
  dockpipe::ScopedTempDir temp;
  const auto config = dockpipe::configUnder(temp.path());
  const auto& dir = config.layout.dockingDir;
  dockpipe::writeFile(dir / "5CRB__ATENOLOL.log", dockpipe::readFile(dockpipe::testDataPath("vina_pair.log")));
  dockpipe::writeFile(dir / "1IVS__GLUCOSAMINE.log", "Writing output ... done.\n");
  dockpipe::writeFile(dir / "a__b__c.log", "REMARK VINA RESULT:  -5.0\n");
  dockpipe::writeFile(dir / "orphan.log", "REMARK VINA RESULT:  -4.5\n");
  dockpipe::writeFile(dir / "5CRB__ATENOLOL_out.pdbqt", "MODEL 1\n");

  ASSERT_EQ(runExtract(config), 0);
  EXPECT_EQ(dockpipe::readFile(config.layout.affinityTable),
            "Protein,Ligand,Binding Affinity (kcal/mol)\n"
            "1IVS,GLUCOSAMINE,\n"
            "5CRB,ATENOLOL,-7.1\n"
            "a__b__c,a__b__c,-5\n"
            "orphan,orphan,-4.5\n");
}

TEST(ExtractStageTests, RewritesTableOnEveryRun) {
  dockpipe::ScopedTempDir temp;
  const auto config = dockpipe::configUnder(temp.path());
  dockpipe::writeFile(config.layout.dockingDir / "4NTJ__CANGRELOR.log", "REMARK VINA RESULT:  -9.2\n");
  ASSERT_EQ(runExtract(config), 0);

  dockpipe::writeFile(config.layout.dockingDir / "4NTJ__PRASUGREL.log", "REMARK VINA RESULT:  -8.8\n");
  ASSERT_EQ(runExtract(config), 0);
  EXPECT_NE(dockpipe::readFile(config.layout.affinityTable).find("4NTJ,PRASUGREL,-8.8"), std::string::npos);
}

TEST(ExtractStageTests, MissingDockingDirectoryIsMissingInput) {
  dockpipe::ScopedTempDir temp;
  const auto config = dockpipe::configUnder(temp.path());
  EXPECT_THROW(runExtract(config), dockpipe::MissingInputError);
}

TEST(ExtractStageTests, NoLogsIsNotAnError) {
  dockpipe::ScopedTempDir temp;
  const auto config = dockpipe::configUnder(temp.path());
  std::filesystem::create_directories(config.layout.dockingDir);

  EXPECT_EQ(runExtract(config), 0);
  EXPECT_FALSE(std::filesystem::exists(config.layout.affinityTable));
}

TEST(ExtractStageTests, CsvFieldsWithCommasAreQuoted) {
  std::ostringstream out;
  dockpipe::writeAffinityCsv(out, {{"5CRB", "odd,name", -6.5}});
  EXPECT_EQ(out.str(), "Protein,Ligand,Binding Affinity (kcal/mol)\n5CRB,\"odd,name\",-6.5\n");
}
