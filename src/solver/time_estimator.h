// Wall-clock time estimate for performing an exercise.

#ifndef LIFTPACK_SOLVER_TIME_ESTIMATOR_H
#define LIFTPACK_SOLVER_TIME_ESTIMATOR_H

#include "catalog/exercise.h"
#include "core/basic_types.h"

namespace liftpack {

/// Fixed duration of one repetition.
constexpr Seconds kSecondsPerRep = 3;

/// Setup time charged once for exercises with required equipment.
constexpr Seconds kEquipmentSetupSeconds = 30;

/// @brief Estimate the seconds needed to perform an exercise.
///
/// setup + sets * (reps * 3) + (sets - 1) * round(rest_seconds * rest_multiplier),
/// where setup is 30 when the exercise requires equipment and 0 otherwise.
/// Pure and integer-exact.
///
/// @param exercise The exercise (rest_seconds and required equipment are read).
/// @param sets Number of sets (>= 1).
/// @param reps Reps per set.
/// @param rest_multiplier Scaling applied to the exercise's rest period.
/// @return Estimated seconds.
Seconds estimateExerciseSeconds(const Exercise& exercise, int sets, int reps,
                                double rest_multiplier);

/// @brief Rest period after scaling, rounded to whole seconds.
Seconds scaledRestSeconds(const Exercise& exercise, double rest_multiplier);

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_TIME_ESTIMATOR_H
