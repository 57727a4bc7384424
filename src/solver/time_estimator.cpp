/// @file
/// @brief Exercise time estimation.

#include "solver/time_estimator.h"

#include <cmath>

namespace liftpack {

Seconds scaledRestSeconds(const Exercise& exercise, double rest_multiplier) {
  return static_cast<Seconds>(
      std::lround(static_cast<double>(exercise.rest_seconds) * rest_multiplier));
}

Seconds estimateExerciseSeconds(const Exercise& exercise, int sets, int reps,
                                double rest_multiplier) {
  Seconds setup = exercise.requiresEquipment() ? kEquipmentSetupSeconds : 0;
  Seconds work = sets * (reps * kSecondsPerRep);
  Seconds rest = (sets > 1) ? (sets - 1) * scaledRestSeconds(exercise, rest_multiplier) : 0;
  return setup + work + rest;
}

}  // namespace liftpack
