/// @file
/// @brief Exercise entity helpers.

#include "catalog/exercise.h"

#include <algorithm>

namespace liftpack {

bool Exercise::allowsLocation(Location location) const {
  return std::find(locations.begin(), locations.end(), location) != locations.end();
}

double Exercise::activationOf(const std::string& muscle_id) const {
  auto iter = activations.find(muscle_id);
  if (iter == activations.end()) return 0.0;
  return iter->second;
}

bool Exercise::isPrimary(const std::string& muscle_id) const {
  return std::find(primary_muscles.begin(), primary_muscles.end(), muscle_id) !=
         primary_muscles.end();
}

bool Exercise::countsAsPrimary(const std::string& muscle_id) const {
  return isPrimary(muscle_id) || activationOf(muscle_id) >= kPrimaryActivationThreshold;
}

std::vector<std::string> Exercise::secondaryMuscles() const {
  std::vector<std::string> result;
  for (const auto& [muscle_id, activation] : activations) {
    if (activation > 0.0 && !isPrimary(muscle_id)) {
      result.push_back(muscle_id);
    }
  }
  return result;
}

bool Exercise::sharesPrimaryMuscleWith(const Exercise& other) const {
  for (const auto& muscle_id : primary_muscles) {
    if (other.isPrimary(muscle_id)) return true;
  }
  return false;
}

void Exercise::finalizePrimaryMuscles(const std::vector<std::string>& flagged) {
  primary_muscles.clear();
  for (const auto& muscle_id : flagged) {
    if (!isPrimary(muscle_id)) primary_muscles.push_back(muscle_id);
  }
  for (const auto& [muscle_id, activation] : activations) {
    if (activation >= kPrimaryActivationThreshold && !isPrimary(muscle_id)) {
      primary_muscles.push_back(muscle_id);
    }
  }
}

}  // namespace liftpack
