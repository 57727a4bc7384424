// Internal header shared by the packing backends.
// Not part of the public API. Include only from solver sources and tests.

#ifndef LIFTPACK_SOLVER_PACKING_INTERNAL_H
#define LIFTPACK_SOLVER_PACKING_INTERNAL_H

#include <cstddef>
#include <vector>

#include "catalog/exercise.h"
#include "recovery/recovery_windows.h"
#include "solver/goal_profile.h"
#include "solver/prescription_types.h"

namespace liftpack {

/// @brief Per-solve constants derived from the request.
struct PackingPlan {
  SetsReps volume;
  double rest_multiplier = kDefaultRestMultiplier;
  Seconds overhead = 0;
  Seconds initial_budget = 0;  ///< minutes * 60 - overhead.
};

/// @brief Derive the packing plan for a request.
PackingPlan planPacking(const PrescriptionRequest& request);

/// @brief A scored candidate; index refers to the eligible list.
struct ScoredCandidate {
  size_t index = 0;
  double score = 0.0;
};

/// @brief Stable sort by descending score (ties keep catalog order).
void sortCandidates(std::vector<ScoredCandidate>& candidates);

/// @brief Append a committed exercise and its substitutions to the result.
///
/// Updates coverage with the plan's sets. Does not touch the time budget.
void commitExercise(const Exercise& exercise, const std::vector<Exercise>& catalog,
                    const PrescriptionRequest& request, const RecoveryWindows& recovery,
                    const PackingPlan& plan, int substitution_limit, PackingResult& result);

/// @brief Log the advisory balance report once 3+ exercises are selected.
void logBalanceAdvisory(const char* tag, const PackingResult& result);

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_PACKING_INTERNAL_H
