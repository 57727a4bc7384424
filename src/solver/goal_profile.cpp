/// @file
/// @brief Goal profile table.

#include "solver/goal_profile.h"

namespace liftpack {

namespace {

constexpr uint8_t patternBit(MovementPattern pattern) {
  return static_cast<uint8_t>(1u << static_cast<uint8_t>(pattern));
}

constexpr uint8_t kStrengthPatterns =
    patternBit(MovementPattern::Squat) | patternBit(MovementPattern::Hinge) |
    patternBit(MovementPattern::Push) | patternBit(MovementPattern::Pull);

constexpr uint8_t kEndurancePatterns =
    patternBit(MovementPattern::Push) | patternBit(MovementPattern::Pull) |
    patternBit(MovementPattern::Squat) | patternBit(MovementPattern::Core);

constexpr uint8_t kMobilityPatterns =
    patternBit(MovementPattern::Core) | patternBit(MovementPattern::Hinge) |
    patternBit(MovementPattern::Squat);

// Indexed by Goal.
const GoalProfile kGoalProfiles[kGoalCount] = {
    {Goal::Strength, kStrengthPatterns, true, 4, 6, 3, 5, 1.5,
     "Heavy load, full recovery between sets"},
    {Goal::Hypertrophy, kStrengthPatterns, true, 3, 5, 8, 12, 1.0,
     "Controlled tempo, finish each set close to failure"},
    {Goal::Endurance, kEndurancePatterns, false, 2, 3, 15, 25, 0.5,
     "Keep rest short and hold form as fatigue builds"},
    {Goal::Mobility, kMobilityPatterns, false, 2, 3, 8, 12, 0.75,
     "Move slowly through the full range of motion"},
    {Goal::FatLoss, kStrengthPatterns, true, 3, 4, 12, 16, 0.6,
     "Keep the pace high between sets"},
};

}  // namespace

const GoalProfile& getGoalProfile(Goal goal) {
  return kGoalProfiles[static_cast<uint8_t>(goal)];
}

SetsReps determineSetsReps(const std::vector<Goal>& goals) {
  SetsReps result;
  if (goals.empty()) return result;
  const GoalProfile& profile = getGoalProfile(goals.front());
  result.sets = (profile.sets_min + profile.sets_max) / 2;
  result.reps = (profile.reps_min + profile.reps_max) / 2;
  return result;
}

double determineRestMultiplier(const std::vector<Goal>& goals) {
  if (goals.empty()) return kDefaultRestMultiplier;
  return getGoalProfile(goals.front()).rest_multiplier;
}

}  // namespace liftpack
