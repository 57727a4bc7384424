// Per-goal prescription profiles: preferred movement patterns, compound
// preference, sets/reps ranges, rest scaling and coaching cue.

#ifndef LIFTPACK_SOLVER_GOAL_PROFILE_H
#define LIFTPACK_SOLVER_GOAL_PROFILE_H

#include <vector>

#include "core/basic_types.h"

namespace liftpack {

/// Defaults used when a request names no goals.
constexpr int kDefaultSets = 3;
constexpr int kDefaultReps = 10;
constexpr double kDefaultRestMultiplier = 1.0;

/// @brief Fixed design values for one training goal.
struct GoalProfile {
  Goal goal = Goal::Hypertrophy;
  uint8_t preferred_patterns = 0;  ///< Bit i set = MovementPattern(i) preferred.
  bool prefers_compound = false;
  int sets_min = 3;
  int sets_max = 3;
  int reps_min = 10;
  int reps_max = 10;
  double rest_multiplier = 1.0;
  const char* coaching_cue = "";

  /// @brief True if the movement pattern is preferred by this goal.
  bool prefersPattern(MovementPattern pattern) const {
    return (preferred_patterns & (1u << static_cast<uint8_t>(pattern))) != 0;
  }
};

/// @brief Get the profile for a goal.
///
/// | goal        | patterns                 | compound | sets | reps  | rest |
/// |-------------|--------------------------|----------|------|-------|------|
/// | strength    | squat, hinge, push, pull | yes      | 4-6  | 3-5   | 1.5  |
/// | hypertrophy | push, pull, squat, hinge | yes      | 3-5  | 8-12  | 1.0  |
/// | endurance   | push, pull, squat, core  | no       | 2-3  | 15-25 | 0.5  |
/// | mobility    | core, hinge, squat       | no       | 2-3  | 8-12  | 0.75 |
/// | fat_loss    | squat, hinge, push, pull | yes      | 3-4  | 12-16 | 0.6  |
const GoalProfile& getGoalProfile(Goal goal);

/// @brief Sets and reps for a prescription.
struct SetsReps {
  int sets = kDefaultSets;
  int reps = kDefaultReps;
};

/// @brief Sets/reps from the first goal's ranges (integer midpoints), or 3x10.
SetsReps determineSetsReps(const std::vector<Goal>& goals);

/// @brief Rest multiplier of the first goal, or 1.0 with no goals.
double determineRestMultiplier(const std::vector<Goal>& goals);

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_GOAL_PROFILE_H
