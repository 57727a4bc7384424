/// @file
/// @brief Exercise scoring.

#include "solver/exercise_scorer.h"

#include "solver/goal_profile.h"

namespace liftpack {

ScoreBreakdown scoreExerciseBreakdown(const Exercise& exercise,
                                      const PrescriptionRequest& request,
                                      const MuscleCoverage& coverage,
                                      const RecoveryWindows& recovery,
                                      const ScoringWeights& weights) {
  ScoreBreakdown score;

  for (Goal goal : request.goals) {
    const GoalProfile& profile = getGoalProfile(goal);
    if (profile.prefersPattern(exercise.movement_pattern)) {
      score.goal_alignment += weights.goal_alignment;
    }
    if (profile.prefers_compound && exercise.is_compound) {
      score.goal_alignment += weights.goal_alignment * 0.5;
    }
  }

  if (exercise.is_compound) {
    score.compound = weights.compound_preference;
  }

  for (const auto& [muscle_id, activation] : exercise.activations) {
    if (activation <= 0.0) continue;
    if (recovery.inLast24h(muscle_id)) {
      score.recovery += weights.recovery_penalty_24h;
    } else if (recovery.inLast48h(muscle_id)) {
      score.recovery += weights.recovery_penalty_48h;
    }
    if (!coverage.contains(muscle_id)) {
      score.coverage_gap += weights.muscle_coverage_gap;
    }
  }

  if (request.fitness_level) {
    DifficultyBand band = difficultyBandFor(*request.fitness_level);
    if (exercise.difficulty >= band.min && exercise.difficulty <= band.max) {
      score.fitness_level = weights.fitness_level_match;
    } else if (exercise.difficulty > band.max) {
      score.fitness_level =
          -kOverDifficultyPenaltyPerTier * static_cast<double>(exercise.difficulty - band.max);
    }
  }

  return score;
}

double scoreExercise(const Exercise& exercise, const PrescriptionRequest& request,
                     const MuscleCoverage& coverage, const RecoveryWindows& recovery,
                     const ScoringWeights& weights) {
  return scoreExerciseBreakdown(exercise, request, coverage, recovery, weights).total();
}

}  // namespace liftpack
