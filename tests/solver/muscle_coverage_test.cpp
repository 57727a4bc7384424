// Tests for solver/muscle_coverage.h -- monotone coverage accumulation.

#include "solver/muscle_coverage.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace liftpack {
namespace {

TEST(MuscleCoverageTest, FirstUpdateInsertsWithLevel) {
  MuscleCoverage coverage;
  EXPECT_TRUE(coverage.empty());
  coverage.update(test_helpers::sampleCatalog()[0], 3);  // push-up

  ASSERT_EQ(coverage.size(), 3u);
  const MuscleCoverageEntry* chest = coverage.find("chest");
  ASSERT_NE(chest, nullptr);
  EXPECT_EQ(chest->activation_level, ActivationLevel::Primary);
  EXPECT_EQ(chest->total_sets, 3);
  EXPECT_EQ(chest->display_name, "chest");

  const MuscleCoverageEntry* triceps = coverage.find("triceps");
  ASSERT_NE(triceps, nullptr);
  EXPECT_EQ(triceps->activation_level, ActivationLevel::Secondary);
  EXPECT_EQ(coverage.find("lats"), nullptr);
}

TEST(MuscleCoverageTest, SetsAccumulateAndLevelUpgrades) {
  MuscleCoverage coverage;
  coverage.update(test_helpers::sampleCatalog()[0], 3);
  coverage.update(test_helpers::makeExercise("dip", MovementPattern::Push,
                                             {{"triceps", 75}, {"chest", 30}}),
                  4);

  EXPECT_EQ(coverage.find("triceps")->activation_level, ActivationLevel::Primary);
  EXPECT_EQ(coverage.find("triceps")->total_sets, 7);
  // Never downgraded by a secondary hit.
  EXPECT_EQ(coverage.find("chest")->activation_level, ActivationLevel::Primary);
  EXPECT_EQ(coverage.find("chest")->total_sets, 7);
}

TEST(MuscleCoverageTest, ZeroActivationNotRecorded) {
  MuscleCoverage coverage;
  coverage.update(test_helpers::makeExercise("x", MovementPattern::Core,
                                             {{"core", 80}, {"glutes", 0}}),
                  2);
  EXPECT_TRUE(coverage.contains("core"));
  EXPECT_FALSE(coverage.contains("glutes"));
}

TEST(MuscleCoverageTest, FlaggedPrimaryBelowThreshold) {
  Exercise face_pull =
      test_helpers::makeExercise("face_pull", MovementPattern::Pull, {{"rear_delts", 40}});
  face_pull.finalizePrimaryMuscles({"rear_delts"});
  MuscleCoverage coverage;
  coverage.update(face_pull, 3);
  EXPECT_EQ(coverage.find("rear_delts")->activation_level, ActivationLevel::Primary);
}

TEST(MuscleCoverageTest, DisplayNamesFallBackToId) {
  MuscleCoverage coverage;
  coverage.update(test_helpers::sampleCatalog()[0], 3);
  coverage.applyDisplayNames({{"chest", "Pectoralis Major"}});
  EXPECT_EQ(coverage.find("chest")->display_name, "Pectoralis Major");
  EXPECT_EQ(coverage.find("triceps")->display_name, "triceps");
}

TEST(MuscleCoverageTest, MonotoneAcrossManyUpdates) {
  auto catalog = test_helpers::sampleCatalog();
  MuscleCoverage coverage;
  for (const auto& exercise : catalog) {
    auto before = coverage.entries();
    coverage.update(exercise, 2);
    for (const auto& [muscle_id, entry] : before) {
      const MuscleCoverageEntry* after = coverage.find(muscle_id);
      ASSERT_NE(after, nullptr) << muscle_id;
      EXPECT_GE(after->total_sets, entry.total_sets);
      if (entry.activation_level == ActivationLevel::Primary) {
        EXPECT_EQ(after->activation_level, ActivationLevel::Primary);
      }
    }
  }
}

}  // namespace
}  // namespace liftpack
