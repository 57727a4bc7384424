/// @file
/// @brief Bitmask-indexed packing loop.

#include "solver/indexed_solver.h"

#include <bitset>
#include <cstdio>

#include "solver/hard_filter.h"
#include "solver/packing_internal.h"
#include "solver/time_estimator.h"

namespace liftpack {

void MuscleMask::merge(const MuscleMask& other) {
  for (size_t idx = 0; idx < words_.size() && idx < other.words_.size(); ++idx) {
    words_[idx] |= other.words_[idx];
  }
}

int MuscleMask::countMissingFrom(const MuscleMask& other) const {
  int count = 0;
  for (size_t idx = 0; idx < words_.size(); ++idx) {
    uint64_t theirs = idx < other.words_.size() ? other.words_[idx] : 0;
    count += static_cast<int>(std::bitset<64>(words_[idx] & ~theirs).count());
  }
  return count;
}

namespace {

/// @brief Coverage-independent data for one eligible exercise.
struct IndexedExercise {
  MuscleMask activated;
  ScoreBreakdown static_terms;  ///< coverage_gap left at zero.
  Seconds estimated_seconds = 0;
};

/// @brief Coverage-gap term with the same summation order as the scorer.
double coverageGapTerm(int uncovered, double weight) {
  double gap = 0.0;
  for (int idx = 0; idx < uncovered; ++idx) gap += weight;
  return gap;
}

}  // namespace

PackingResult IndexedSolver::solve(const std::vector<Exercise>& catalog,
                                   const PrescriptionRequest& request,
                                   const RecoveryWindows& recovery) const {
  PackingResult result;

  const std::vector<Exercise> eligible = filterExercises(catalog, request);
  if (eligible.empty()) {
    if (config_.verbose) {
      std::fprintf(stderr, "[IndexedSolver] no eligible exercises (catalog=%zu)\n",
                   catalog.size());
    }
    return result;
  }

  const PackingPlan plan = planPacking(request);

  // Dense muscle indices in id order.
  std::map<std::string, size_t> muscle_index;
  for (const auto& exercise : eligible) {
    for (const auto& [muscle_id, activation] : exercise.activations) {
      if (activation > 0.0) muscle_index.emplace(muscle_id, 0);
    }
  }
  size_t next_bit = 0;
  for (auto& entry : muscle_index) entry.second = next_bit++;

  const MuscleCoverage empty_coverage;
  std::vector<IndexedExercise> indexed(eligible.size());
  for (size_t idx = 0; idx < eligible.size(); ++idx) {
    const Exercise& exercise = eligible[idx];
    IndexedExercise& entry = indexed[idx];
    entry.activated = MuscleMask(muscle_index.size());
    for (const auto& [muscle_id, activation] : exercise.activations) {
      if (activation > 0.0) entry.activated.set(muscle_index.at(muscle_id));
    }
    entry.static_terms =
        scoreExerciseBreakdown(exercise, request, empty_coverage, recovery, config_.weights);
    entry.static_terms.coverage_gap = 0.0;
    entry.estimated_seconds = estimateExerciseSeconds(exercise, plan.volume.sets,
                                                      plan.volume.reps, plan.rest_multiplier);
  }

  MuscleMask covered(muscle_index.size());
  Seconds time_remaining = plan.initial_budget;
  Seconds committed_seconds = 0;
  std::vector<bool> selected(eligible.size(), false);
  std::vector<ScoredCandidate> candidates;
  candidates.reserve(eligible.size());

  while (time_remaining > kMinRemainingSeconds) {
    candidates.clear();
    for (size_t idx = 0; idx < eligible.size(); ++idx) {
      if (selected[idx]) continue;
      ScoreBreakdown terms = indexed[idx].static_terms;
      terms.coverage_gap = coverageGapTerm(indexed[idx].activated.countMissingFrom(covered),
                                           config_.weights.muscle_coverage_gap);
      candidates.push_back({idx, terms.total()});
    }
    if (candidates.empty()) break;
    sortCandidates(candidates);

    const ScoredCandidate* chosen = nullptr;
    for (const auto& candidate : candidates) {
      if (indexed[candidate.index].estimated_seconds <= time_remaining) {
        chosen = &candidate;
        break;
      }
    }
    if (!chosen) {
      if (config_.verbose) {
        std::fprintf(stderr, "[IndexedSolver] no candidate fits %ds remaining\n",
                     time_remaining);
      }
      break;
    }

    const size_t pick = chosen->index;
    const Seconds needed = indexed[pick].estimated_seconds;
    selected[pick] = true;
    covered.merge(indexed[pick].activated);
    commitExercise(eligible[pick], catalog, request, recovery, plan,
                   config_.substitution_limit, result);
    time_remaining -= needed;
    committed_seconds += needed;

    if (config_.verbose) {
      std::fprintf(stderr, "[IndexedSolver] commit %s score=%.1f est=%ds remaining=%ds\n",
                   eligible[pick].id.c_str(), chosen->score, needed, time_remaining);
      logBalanceAdvisory("IndexedSolver", result);
    }
  }

  result.actual_duration_seconds =
      result.exercises.empty() ? 0 : committed_seconds + plan.overhead;
  return result;
}

}  // namespace liftpack
