#include <stdexcept>

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "dockpipe/artifacts/ArtifactStore.hpp"

TEST(ArtifactStoreTests, PairArtifactsShareTheJoinKey) {
  dockpipe::ArtifactStore store(dockpipe::ArtifactLayout_t{});

  EXPECT_EQ(store.locationFor({dockpipe::ArtifactKind_e::kDockingPose, "5CRB", "ATENOLOL"}),
            std::filesystem::path("results/docking/vina_outputs/5CRB__ATENOLOL_out.pdbqt"));
  EXPECT_EQ(store.locationFor({dockpipe::ArtifactKind_e::kDockingLog, "5CRB", "ATENOLOL"}),
            std::filesystem::path("results/docking/vina_outputs/5CRB__ATENOLOL.log"));
  EXPECT_EQ(store.locationFor({dockpipe::ArtifactKind_e::kComplexFlatImage, "5CRB", "ATENOLOL"}),
            std::filesystem::path("results/visualizations/2D_complex/5CRB__ATENOLOL_out__flat.png"));
  EXPECT_EQ(store.locationFor({dockpipe::ArtifactKind_e::kComplexImage, "5CRB", "ATENOLOL"}),
            std::filesystem::path("results/visualizations/3D/5CRB__ATENOLOL_out.png"));
}

TEST(ArtifactStoreTests, SingleArtifactsUseTheirDirectories) {
  dockpipe::ArtifactStore store(dockpipe::ArtifactLayout_t{});

  EXPECT_EQ(store.locationFor({dockpipe::ArtifactKind_e::kReceptor, "4G6J", {}}),
            std::filesystem::path("results/docking/receptors/4G6J.pdbqt"));
  EXPECT_EQ(store.locationFor({dockpipe::ArtifactKind_e::kLigand, "MEROPENEM", {}}),
            std::filesystem::path("results/docking/ligands/MEROPENEM.pdbqt"));
  EXPECT_EQ(store.locationFor({dockpipe::ArtifactKind_e::kLigandImage, "MEROPENEM", {}}),
            std::filesystem::path("results/visualizations/2D/MEROPENEM.png"));
  EXPECT_EQ(store.locationFor({dockpipe::ArtifactKind_e::kAffinityTable, {}, {}}),
            std::filesystem::path("results/binding_energies.csv"));
}

TEST(ArtifactStoreTests, SplitsPairStemsOnTheDelimiter) {
  const auto pair = dockpipe::splitPairStem("5CRB__ATENOLOL");
  ASSERT_TRUE(pair.has_value());
  EXPECT_EQ(pair->first, "5CRB");
  EXPECT_EQ(pair->second, "ATENOLOL");

  EXPECT_FALSE(dockpipe::splitPairStem("5CRB_ATENOLOL").has_value());
  EXPECT_FALSE(dockpipe::splitPairStem("A__B__C").has_value());
}

TEST(ArtifactStoreTests, RejectsIdentifiersThatBreakTheJoinKey) {
  EXPECT_THROW(dockpipe::pairStem("5CRB__X", "ATENOLOL"), std::invalid_argument);
  EXPECT_THROW(dockpipe::pairStem("", "ATENOLOL"), std::invalid_argument);
  EXPECT_EQ(dockpipe::pairStem("1IVS", "GLUCOSAMINE"), "1IVS__GLUCOSAMINE");
}

TEST(ArtifactStoreTests, EdgeUnderscoresCannotAliasAnotherPair) {
  // "A_" + "B" and "A" + "_B" would both be stored as A___B.
  EXPECT_THROW(dockpipe::pairStem("A_", "B"), std::invalid_argument);
  EXPECT_THROW(dockpipe::pairStem("A", "_B"), std::invalid_argument);
  EXPECT_FALSE(dockpipe::isPairIdentifier("_4G6J"));
  EXPECT_FALSE(dockpipe::isPairIdentifier("ATENOLOL_"));
  EXPECT_TRUE(dockpipe::isPairIdentifier("CD_163"));

  dockpipe::ArtifactStore store(dockpipe::ArtifactLayout_t{});
  EXPECT_THROW(store.locationFor({dockpipe::ArtifactKind_e::kDockingPose, "A_", "B"}), std::invalid_argument);
  EXPECT_THROW(store.locationFor({dockpipe::ArtifactKind_e::kDockingPose, "A", "_B"}), std::invalid_argument);
}

TEST(ArtifactStoreTests, ExistingArtifactIsSkippedUnlessForced) {
  dockpipe::ScopedTempDir temp;
  const auto config = dockpipe::configUnder(temp.path());
  dockpipe::ArtifactStore store(config.layout);
  const dockpipe::ArtifactKey_t key{dockpipe::ArtifactKind_e::kReceptor, "2AZ5", {}};

  EXPECT_TRUE(store.shouldBuild(key, false));
  dockpipe::writeFile(store.locationFor(key), "ATOM\n");
  EXPECT_FALSE(store.shouldBuild(key, false));
  EXPECT_TRUE(store.shouldBuild(key, true));
}

TEST(ArtifactStoreTests, SkipIsLoggedOnlyForPresentArtifacts) {
  dockpipe::ScopedTempDir temp;
  const auto config = dockpipe::configUnder(temp.path());
  dockpipe::ArtifactStore store(config.layout);
  const dockpipe::ArtifactKey_t present{dockpipe::ArtifactKind_e::kLigand, "ATENOLOL", {}};
  const dockpipe::ArtifactKey_t absent{dockpipe::ArtifactKind_e::kLigand, "MEROPENEM", {}};
  dockpipe::writeFile(store.locationFor(present), "ROOT\n");

  dockpipe::ScopedLogCapture capture("ArtifactStore");
  EXPECT_FALSE(store.shouldBuild(present, false));
  EXPECT_TRUE(store.shouldBuild(absent, false));
  EXPECT_TRUE(store.shouldBuild(present, true));

  EXPECT_EQ(capture.countContaining("[SKIP]"), 1u);
  EXPECT_EQ(capture.countContaining("ATENOLOL.pdbqt"), 1u);
}

TEST(ArtifactStoreTests, StagedOutputBecomesVisibleOnlyOnCommit) {
  dockpipe::ScopedTempDir temp;
  const auto config = dockpipe::configUnder(temp.path());
  dockpipe::ArtifactStore store(config.layout);
  const dockpipe::ArtifactKey_t key{dockpipe::ArtifactKind_e::kDockingLog, "4NTJ", "CANGRELOR"};

  EXPECT_FALSE(store.commit(key));

  const auto staging = store.stagingFor(key);
  EXPECT_NE(staging, store.locationFor(key));
  dockpipe::writeFile(staging, "partial");
  EXPECT_FALSE(store.exists(key));

  EXPECT_TRUE(store.commit(key));
  EXPECT_TRUE(store.exists(key));
  EXPECT_EQ(dockpipe::readFile(store.locationFor(key)), "partial");
  EXPECT_FALSE(std::filesystem::exists(staging));
}

TEST(ArtifactStoreTests, StagingDiscardsLeftoversOfAnInterruptedStep) {
  dockpipe::ScopedTempDir temp;
  const auto config = dockpipe::configUnder(temp.path());
  dockpipe::ArtifactStore store(config.layout);
  const dockpipe::ArtifactKey_t key{dockpipe::ArtifactKind_e::kLigand, "PRASUGREL", {}};

  dockpipe::writeFile(store.stagingFor(key), "left behind");
  const auto staging = store.stagingFor(key);
  EXPECT_FALSE(std::filesystem::exists(staging));
  EXPECT_FALSE(store.exists(key));
}
