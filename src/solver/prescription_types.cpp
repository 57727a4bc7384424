/// @file
/// @brief Request and prescribed-exercise helpers.

#include "solver/prescription_types.h"

#include <algorithm>

#include "solver/time_estimator.h"

namespace liftpack {

bool PrescriptionRequest::ownsEquipment(const std::string& tag) const {
  return std::find(equipment.begin(), equipment.end(), tag) != equipment.end();
}

std::optional<Goal> PrescriptionRequest::primaryGoal() const {
  if (goals.empty()) return std::nullopt;
  return goals.front();
}

std::string PrescribedExercise::repsLabel() const {
  if (timed) return std::to_string(reps * kSecondsPerRep) + "s";
  return std::to_string(reps);
}

}  // namespace liftpack
