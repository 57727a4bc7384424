// Turns a catalog exercise plus sets/reps into a PrescribedExercise.

#ifndef LIFTPACK_SOLVER_EXERCISE_PRESCRIBER_H
#define LIFTPACK_SOLVER_EXERCISE_PRESCRIBER_H

#include <string>

#include "catalog/exercise.h"
#include "recovery/recovery_windows.h"
#include "solver/goal_profile.h"
#include "solver/prescription_types.h"

namespace liftpack {

/// @brief Coaching note for an exercise.
///
/// The first goal's cue, followed by a recovery caution when the exercise
/// activates a muscle in either recovery window. Empty when neither applies.
std::string coachingNote(const Exercise& exercise, const PrescriptionRequest& request,
                         const RecoveryWindows& recovery);

/// @brief Build the output record for an exercise.
///
/// Rest is the exercise's rest scaled by @p rest_multiplier; the estimate
/// uses estimateExerciseSeconds() with the same inputs.
PrescribedExercise prescribeExercise(const Exercise& exercise, const SetsReps& volume,
                                     double rest_multiplier,
                                     const PrescriptionRequest& request,
                                     const RecoveryWindows& recovery);

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_EXERCISE_PRESCRIBER_H
