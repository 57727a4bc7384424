/// @file
/// @brief Substitution lookup.

#include "solver/substitution_finder.h"

#include "solver/hard_filter.h"

namespace liftpack {

std::vector<const Exercise*> findSubstitutions(const Exercise& exercise,
                                               const std::vector<Exercise>& catalog,
                                               const PrescriptionRequest& request,
                                               int limit) {
  std::vector<const Exercise*> result;
  if (limit <= 0) return result;

  for (const auto& candidate : catalog) {
    if (candidate.id == exercise.id) continue;
    if (!passesLocationEquipment(candidate, request)) continue;
    if (!exercise.sharesPrimaryMuscleWith(candidate)) continue;
    result.push_back(&candidate);
    if (static_cast<int>(result.size()) >= limit) break;
  }
  return result;
}

}  // namespace liftpack
