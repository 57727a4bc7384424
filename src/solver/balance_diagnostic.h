// Advisory push/pull and upper/lower balance check over a prescription.
// Never alters selection.

#ifndef LIFTPACK_SOLVER_BALANCE_DIAGNOSTIC_H
#define LIFTPACK_SOLVER_BALANCE_DIAGNOSTIC_H

#include <string>
#include <vector>

#include "solver/prescription_types.h"

namespace liftpack {

/// Push:pull (or pull:push) ratio above which an issue is raised.
constexpr double kMaxPushPullRatio = 1.5;

/// Upper:lower (or lower:upper) ratio above which an issue is raised.
constexpr double kMaxUpperLowerRatio = 2.0;

/// @brief Pattern counts and advisory issues.
struct BalanceReport {
  int push_count = 0;
  int pull_count = 0;
  int upper_count = 0;  ///< Push and pull.
  int lower_count = 0;  ///< Squat and hinge.
  std::vector<std::string> issues;

  bool balanced() const { return issues.empty(); }
};

/// @brief Count patterns and flag imbalances.
///
/// A side with zero exercises is flagged only when the other side has two or
/// more; otherwise the ratio thresholds above apply.
BalanceReport checkBalance(const std::vector<PrescribedExercise>& exercises);

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_BALANCE_DIAGNOSTIC_H
