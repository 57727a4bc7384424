/// @file
/// @brief Hard eligibility filter.

#include "solver/hard_filter.h"

#include <algorithm>

namespace liftpack {

bool passesLocationEquipment(const Exercise& exercise, const PrescriptionRequest& request) {
  if (!exercise.allowsLocation(request.location)) return false;
  if (request.location == Location::Gym) return true;
  for (const auto& tag : exercise.equipment_required) {
    if (!request.ownsEquipment(tag)) return false;
  }
  return true;
}

bool passesHardFilter(const Exercise& exercise, const PrescriptionRequest& request) {
  if (!passesLocationEquipment(exercise, request)) return false;

  const auto& excluded = request.excluded_exercises;
  if (std::find(excluded.begin(), excluded.end(), exercise.id) != excluded.end()) {
    return false;
  }

  for (const auto& muscle_id : request.excluded_muscles) {
    if (exercise.isPrimary(muscle_id)) return false;
    if (exercise.activationOf(muscle_id) > kExcludedMuscleActivationLimit) return false;
  }
  return true;
}

std::vector<Exercise> filterExercises(const std::vector<Exercise>& exercises,
                                      const PrescriptionRequest& request) {
  std::vector<Exercise> result;
  for (const auto& exercise : exercises) {
    if (passesHardFilter(exercise, request)) result.push_back(exercise);
  }
  return result;
}

}  // namespace liftpack
