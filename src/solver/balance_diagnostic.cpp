/// @file
/// @brief Advisory balance diagnostic.

#include "solver/balance_diagnostic.h"

namespace liftpack {

namespace {

/// @brief True if @p major outweighs @p minor beyond @p max_ratio.
bool isSkewed(int major, int minor, double max_ratio) {
  if (minor == 0) return major >= 2;
  return static_cast<double>(major) / static_cast<double>(minor) > max_ratio;
}

}  // namespace

BalanceReport checkBalance(const std::vector<PrescribedExercise>& exercises) {
  BalanceReport report;
  for (const auto& exercise : exercises) {
    switch (exercise.movement_pattern) {
      case MovementPattern::Push:
        ++report.push_count;
        ++report.upper_count;
        break;
      case MovementPattern::Pull:
        ++report.pull_count;
        ++report.upper_count;
        break;
      case MovementPattern::Squat:
      case MovementPattern::Hinge:
        ++report.lower_count;
        break;
      case MovementPattern::Carry:
      case MovementPattern::Core:
      case MovementPattern::Isolation:
        break;
    }
  }

  if (isSkewed(report.push_count, report.pull_count, kMaxPushPullRatio)) {
    report.issues.push_back("push-dominant: add pulling work");
  } else if (isSkewed(report.pull_count, report.push_count, kMaxPushPullRatio)) {
    report.issues.push_back("pull-dominant: add pushing work");
  }

  if (isSkewed(report.upper_count, report.lower_count, kMaxUpperLowerRatio)) {
    report.issues.push_back("upper-body dominant: add squat or hinge work");
  } else if (isSkewed(report.lower_count, report.upper_count, kMaxUpperLowerRatio)) {
    report.issues.push_back("lower-body dominant: add push or pull work");
  }
  return report;
}

}  // namespace liftpack
