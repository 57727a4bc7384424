/// @file
/// @brief Backend factory and helpers shared by the packing backends.

#include "solver/solver_backend.h"

#include <algorithm>
#include <cstdio>

#include "solver/balance_diagnostic.h"
#include "solver/exercise_prescriber.h"
#include "solver/greedy_solver.h"
#include "solver/indexed_solver.h"
#include "solver/packing_internal.h"

namespace liftpack {

Seconds warmupCooldownOverhead(int time_available_minutes) {
  return time_available_minutes >= kLongSessionMinutes ? kLongSessionOverheadSeconds
                                                       : kShortSessionOverheadSeconds;
}

std::unique_ptr<ISolverBackend> createSolverBackend(const SolverConfig& config) {
  switch (config.backend) {
    case BackendKind::Greedy:
      return std::make_unique<GreedySolver>(config);
    case BackendKind::Indexed:
      return std::make_unique<IndexedSolver>(config);
  }
  return std::make_unique<GreedySolver>(config);
}

PackingPlan planPacking(const PrescriptionRequest& request) {
  PackingPlan plan;
  plan.volume = determineSetsReps(request.goals);
  plan.rest_multiplier = determineRestMultiplier(request.goals);
  plan.overhead = warmupCooldownOverhead(request.time_available_minutes);
  plan.initial_budget = request.time_available_minutes * kSecondsPerMinute - plan.overhead;
  return plan;
}

void sortCandidates(std::vector<ScoredCandidate>& candidates) {
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const ScoredCandidate& lhs, const ScoredCandidate& rhs) {
                     return lhs.score > rhs.score;
                   });
}

void commitExercise(const Exercise& exercise, const std::vector<Exercise>& catalog,
                    const PrescriptionRequest& request, const RecoveryWindows& recovery,
                    const PackingPlan& plan, int substitution_limit, PackingResult& result) {
  result.exercises.push_back(
      prescribeExercise(exercise, plan.volume, plan.rest_multiplier, request, recovery));
  result.coverage.update(exercise, plan.volume.sets);

  auto& subs = result.substitutions[exercise.id];
  for (const Exercise* alt : findSubstitutions(exercise, catalog, request, substitution_limit)) {
    subs.push_back(prescribeExercise(*alt, plan.volume, plan.rest_multiplier, request, recovery));
  }
}

void logBalanceAdvisory(const char* tag, const PackingResult& result) {
  if (result.exercises.size() < 3) return;
  BalanceReport report = checkBalance(result.exercises);
  for (const auto& issue : report.issues) {
    std::fprintf(stderr, "[%s] balance advisory after %zu exercises: %s\n", tag,
                 result.exercises.size(), issue.c_str());
  }
}

}  // namespace liftpack
