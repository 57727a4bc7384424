/// @file
/// @brief PrescribedExercise construction and coaching notes.

#include "solver/exercise_prescriber.h"

#include "solver/time_estimator.h"

namespace liftpack {

namespace {

constexpr const char* kRecoveryCaution = "Recently trained muscles: reduce load if still sore";

}  // namespace

std::string coachingNote(const Exercise& exercise, const PrescriptionRequest& request,
                         const RecoveryWindows& recovery) {
  std::string note;
  if (auto goal = request.primaryGoal()) {
    note = getGoalProfile(*goal).coaching_cue;
  }

  bool recovering = false;
  for (const auto& [muscle_id, activation] : exercise.activations) {
    if (activation > 0.0 && recovery.isRecovering(muscle_id)) {
      recovering = true;
      break;
    }
  }
  if (recovering) {
    if (!note.empty()) note += ". ";
    note += kRecoveryCaution;
  }
  return note;
}

PrescribedExercise prescribeExercise(const Exercise& exercise, const SetsReps& volume,
                                     double rest_multiplier,
                                     const PrescriptionRequest& request,
                                     const RecoveryWindows& recovery) {
  PrescribedExercise out;
  out.exercise_id = exercise.id;
  out.name = exercise.name;
  out.sets = volume.sets;
  out.reps = volume.reps;
  out.timed = exercise.is_timed;
  out.rest_seconds = scaledRestSeconds(exercise, rest_multiplier);
  out.estimated_seconds =
      estimateExerciseSeconds(exercise, volume.sets, volume.reps, rest_multiplier);
  out.primary_muscles = exercise.primary_muscles;
  out.secondary_muscles = exercise.secondaryMuscles();
  out.notes = coachingNote(exercise, request, recovery);
  out.movement_pattern = exercise.movement_pattern;
  return out;
}

}  // namespace liftpack
