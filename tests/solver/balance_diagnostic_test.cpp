// Tests for solver/balance_diagnostic.h -- advisory push/pull and upper/lower checks.

#include "solver/balance_diagnostic.h"

#include <gtest/gtest.h>

#include <vector>

namespace liftpack {
namespace {

std::vector<PrescribedExercise> withPatterns(const std::vector<MovementPattern>& patterns) {
  std::vector<PrescribedExercise> exercises;
  for (MovementPattern pattern : patterns) {
    PrescribedExercise item;
    item.movement_pattern = pattern;
    exercises.push_back(item);
  }
  return exercises;
}

TEST(BalanceDiagnosticTest, FullBodyIsBalanced) {
  BalanceReport report = checkBalance(withPatterns(
      {MovementPattern::Push, MovementPattern::Pull, MovementPattern::Squat,
       MovementPattern::Hinge, MovementPattern::Core}));
  EXPECT_TRUE(report.balanced());
  EXPECT_EQ(report.push_count, 1);
  EXPECT_EQ(report.pull_count, 1);
  EXPECT_EQ(report.upper_count, 2);
  EXPECT_EQ(report.lower_count, 2);
}

TEST(BalanceDiagnosticTest, PushDominant) {
  BalanceReport report = checkBalance(withPatterns(
      {MovementPattern::Push, MovementPattern::Push, MovementPattern::Push,
       MovementPattern::Pull, MovementPattern::Squat, MovementPattern::Hinge}));
  ASSERT_EQ(report.issues.size(), 1u);
  EXPECT_EQ(report.issues[0], "push-dominant: add pulling work");
}

TEST(BalanceDiagnosticTest, UpperOnlySession) {
  BalanceReport report = checkBalance(
      withPatterns({MovementPattern::Push, MovementPattern::Pull, MovementPattern::Pull}));
  // pull 2 vs push 1 is above 1.5; upper 3 vs lower 0.
  ASSERT_EQ(report.issues.size(), 2u);
  EXPECT_EQ(report.issues[0], "pull-dominant: add pushing work");
  EXPECT_EQ(report.issues[1], "upper-body dominant: add squat or hinge work");
}

TEST(BalanceDiagnosticTest, LowerDominant) {
  BalanceReport report = checkBalance(withPatterns(
      {MovementPattern::Squat, MovementPattern::Hinge, MovementPattern::Squat,
       MovementPattern::Push, MovementPattern::Pull}));
  EXPECT_TRUE(report.balanced());

  report = checkBalance(withPatterns({MovementPattern::Squat, MovementPattern::Hinge,
                                      MovementPattern::Squat, MovementPattern::Hinge,
                                      MovementPattern::Squat, MovementPattern::Push,
                                      MovementPattern::Pull}));
  ASSERT_EQ(report.issues.size(), 1u);
  EXPECT_EQ(report.issues[0], "lower-body dominant: add push or pull work");
}

TEST(BalanceDiagnosticTest, SingleUnpairedMovementNotFlagged) {
  BalanceReport report = checkBalance(withPatterns({MovementPattern::Push}));
  EXPECT_TRUE(report.balanced());
  EXPECT_TRUE(checkBalance({}).balanced());
}

}  // namespace
}  // namespace liftpack
