// Tests for solver/exercise_prescriber.h -- prescribed exercise construction.

#include "solver/exercise_prescriber.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_helpers.h"

namespace liftpack {
namespace {

TEST(ExercisePrescriberTest, CopiesVolumeAndMuscles) {
  Exercise push_up = test_helpers::sampleCatalog()[0];
  PrescriptionRequest request;
  request.goals = {Goal::Hypertrophy};

  PrescribedExercise item =
      prescribeExercise(push_up, SetsReps{4, 10}, 1.0, request, RecoveryWindows());
  EXPECT_EQ(item.exercise_id, "push_up");
  EXPECT_EQ(item.sets, 4);
  EXPECT_EQ(item.reps, 10);
  EXPECT_EQ(item.repsLabel(), "10");
  EXPECT_EQ(item.rest_seconds, 60);
  EXPECT_EQ(item.estimated_seconds, 4 * 30 + 3 * 60);
  EXPECT_EQ(item.primary_muscles, std::vector<std::string>({"chest"}));
  EXPECT_EQ(item.secondary_muscles, std::vector<std::string>({"front_delts", "triceps"}));
  EXPECT_EQ(item.movement_pattern, MovementPattern::Push);
  EXPECT_EQ(item.notes, "Controlled tempo, finish each set close to failure");
}

TEST(ExercisePrescriberTest, TimedExerciseRendersHold) {
  Exercise plank = test_helpers::sampleCatalog()[9];
  PrescriptionRequest request;
  request.goals = {Goal::Strength};

  PrescribedExercise item =
      prescribeExercise(plank, SetsReps{3, 10}, 1.5, request, RecoveryWindows());
  EXPECT_TRUE(item.timed);
  EXPECT_EQ(item.repsLabel(), "30s");
  EXPECT_EQ(item.rest_seconds, 68);
  EXPECT_EQ(item.estimated_seconds, 90 + 2 * 68);
}

TEST(ExercisePrescriberTest, RecoveryCautionAppended) {
  Exercise plank = test_helpers::sampleCatalog()[9];
  PrescriptionRequest request;
  request.goals = {Goal::Mobility};
  RecoveryWindows recovery;
  recovery.last_48h = {"core"};

  EXPECT_EQ(coachingNote(plank, request, recovery),
            "Move slowly through the full range of motion. "
            "Recently trained muscles: reduce load if still sore");
}

TEST(ExercisePrescriberTest, NoGoalNoRecoveryNoNote) {
  Exercise plank = test_helpers::sampleCatalog()[9];
  EXPECT_TRUE(coachingNote(plank, PrescriptionRequest(), RecoveryWindows()).empty());

  RecoveryWindows recovery;
  recovery.last_24h = {"core"};
  EXPECT_EQ(coachingNote(plank, PrescriptionRequest(), recovery),
            "Recently trained muscles: reduce load if still sore");
}

}  // namespace
}  // namespace liftpack
