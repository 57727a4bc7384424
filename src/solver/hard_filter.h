// Hard eligibility filter: location, equipment, exclusions.

#ifndef LIFTPACK_SOLVER_HARD_FILTER_H
#define LIFTPACK_SOLVER_HARD_FILTER_H

#include <vector>

#include "catalog/exercise.h"
#include "solver/prescription_types.h"

namespace liftpack {

/// @brief Location and equipment eligibility only.
///
/// The location must be valid for the exercise. Outside the gym every
/// required equipment tag must be owned; the gym skips the equipment check.
bool passesLocationEquipment(const Exercise& exercise, const PrescriptionRequest& request);

/// @brief Full hard filter predicate for one exercise.
///
/// Passes iff location/equipment eligibility holds, the id is not excluded,
/// no excluded muscle is a primary muscle, and no excluded muscle is
/// activated above kExcludedMuscleActivationLimit.
bool passesHardFilter(const Exercise& exercise, const PrescriptionRequest& request);

/// @brief Reduce a catalog to the exercises eligible for a request.
/// @return Eligible exercises in input order.
std::vector<Exercise> filterExercises(const std::vector<Exercise>& exercises,
                                      const PrescriptionRequest& request);

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_HARD_FILTER_H
