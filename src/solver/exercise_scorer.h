/// @brief Additive desirability scoring for candidate exercises.
///
/// Five independently weighted terms: goal alignment, compound preference,
/// recovery penalty, fitness-level match and coverage gap.

#ifndef LIFTPACK_SOLVER_EXERCISE_SCORER_H
#define LIFTPACK_SOLVER_EXERCISE_SCORER_H

#include "catalog/exercise.h"
#include "recovery/recovery_windows.h"
#include "solver/muscle_coverage.h"
#include "solver/prescription_types.h"

namespace liftpack {

/// Points subtracted per difficulty tier above the fitness band.
constexpr double kOverDifficultyPenaltyPerTier = 5.0;

/// @brief Tunable weights. Recovery penalties are negative.
struct ScoringWeights {
  double goal_alignment = 10.0;
  double compound_preference = 5.0;
  double recovery_penalty_24h = -20.0;
  double recovery_penalty_48h = -10.0;
  double fitness_level_match = 5.0;
  double muscle_coverage_gap = 15.0;
};

/// @brief Per-term contributions to a score.
struct ScoreBreakdown {
  double goal_alignment = 0.0;
  double compound = 0.0;
  double recovery = 0.0;
  double fitness_level = 0.0;
  double coverage_gap = 0.0;

  /// @brief Sum of all terms.
  double total() const {
    return goal_alignment + compound + recovery + fitness_level + coverage_gap;
  }
};

/// @brief Score one exercise term by term.
///
/// - goal alignment: per goal, +goal_alignment if the pattern is preferred,
///   +goal_alignment/2 if the goal prefers compound and the exercise is;
/// - compound: +compound_preference if compound;
/// - recovery: per activated muscle, +recovery_penalty_24h if in the 24h
///   window, else +recovery_penalty_48h if in the 48h window;
/// - fitness level: +fitness_level_match inside the band, minus 5 per tier
///   above it (no term without a fitness level);
/// - coverage gap: +muscle_coverage_gap per activated muscle not yet covered.
ScoreBreakdown scoreExerciseBreakdown(const Exercise& exercise,
                                      const PrescriptionRequest& request,
                                      const MuscleCoverage& coverage,
                                      const RecoveryWindows& recovery,
                                      const ScoringWeights& weights);

/// @brief Total score (sum of scoreExerciseBreakdown terms).
double scoreExercise(const Exercise& exercise, const PrescriptionRequest& request,
                     const MuscleCoverage& coverage, const RecoveryWindows& recovery,
                     const ScoringWeights& weights);

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_EXERCISE_SCORER_H
