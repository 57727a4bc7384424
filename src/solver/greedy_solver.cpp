/// @file
/// @brief Greedy packing loop.

#include "solver/greedy_solver.h"

#include <cstdio>

#include "solver/hard_filter.h"
#include "solver/packing_internal.h"
#include "solver/time_estimator.h"

namespace liftpack {

PackingResult GreedySolver::solve(const std::vector<Exercise>& catalog,
                                  const PrescriptionRequest& request,
                                  const RecoveryWindows& recovery) const {
  PackingResult result;

  // Filtering
  const std::vector<Exercise> eligible = filterExercises(catalog, request);
  if (eligible.empty()) {
    if (config_.verbose) {
      std::fprintf(stderr, "[GreedySolver] no eligible exercises (catalog=%zu)\n",
                   catalog.size());
    }
    return result;
  }

  const PackingPlan plan = planPacking(request);
  Seconds time_remaining = plan.initial_budget;
  Seconds committed_seconds = 0;
  std::vector<bool> selected(eligible.size(), false);
  std::vector<ScoredCandidate> candidates;
  candidates.reserve(eligible.size());

  // Iterating
  while (time_remaining > kMinRemainingSeconds) {
    candidates.clear();
    for (size_t idx = 0; idx < eligible.size(); ++idx) {
      if (selected[idx]) continue;
      double score =
          scoreExercise(eligible[idx], request, result.coverage, recovery, config_.weights);
      candidates.push_back({idx, score});
    }
    if (candidates.empty()) break;
    sortCandidates(candidates);

    const ScoredCandidate* chosen = nullptr;
    Seconds needed = 0;
    for (const auto& candidate : candidates) {
      needed = estimateExerciseSeconds(eligible[candidate.index], plan.volume.sets,
                                       plan.volume.reps, plan.rest_multiplier);
      if (needed <= time_remaining) {
        chosen = &candidate;
        break;
      }
    }
    if (!chosen) {
      if (config_.verbose) {
        std::fprintf(stderr, "[GreedySolver] no candidate fits %ds remaining\n", time_remaining);
      }
      break;
    }

    const Exercise& exercise = eligible[chosen->index];
    ScoreBreakdown terms;
    if (config_.verbose) {
      terms = scoreExerciseBreakdown(exercise, request, result.coverage, recovery,
                                     config_.weights);
    }
    selected[chosen->index] = true;
    commitExercise(exercise, catalog, request, recovery, plan, config_.substitution_limit,
                   result);
    time_remaining -= needed;
    committed_seconds += needed;

    if (config_.verbose) {
      std::fprintf(stderr,
                   "[GreedySolver] commit %s score=%.1f (goal=%.1f compound=%.1f recovery=%.1f "
                   "level=%.1f gap=%.1f) est=%ds remaining=%ds\n",
                   exercise.id.c_str(), chosen->score, terms.goal_alignment, terms.compound,
                   terms.recovery, terms.fitness_level, terms.coverage_gap, needed,
                   time_remaining);
      logBalanceAdvisory("GreedySolver", result);
    }
  }

  // Done
  result.actual_duration_seconds = committed_seconds + plan.overhead;
  if (result.exercises.empty()) result.actual_duration_seconds = 0;
  return result;
}

}  // namespace liftpack
