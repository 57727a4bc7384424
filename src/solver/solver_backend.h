// Pure abstract interface for packing backends.
// Concrete implementations: GreedySolver (reference), IndexedSolver.

#ifndef LIFTPACK_SOLVER_SOLVER_BACKEND_H
#define LIFTPACK_SOLVER_SOLVER_BACKEND_H

#include <memory>
#include <vector>

#include "catalog/exercise.h"
#include "recovery/recovery_windows.h"
#include "solver/exercise_scorer.h"
#include "solver/prescription_types.h"
#include "solver/substitution_finder.h"

namespace liftpack {

/// Packing stops once the remaining budget is at or below this.
constexpr Seconds kMinRemainingSeconds = 60;

/// Warmup/cooldown reserve for sessions of at least kLongSessionMinutes.
constexpr Seconds kLongSessionOverheadSeconds = 300;

/// Warmup/cooldown reserve for shorter sessions.
constexpr Seconds kShortSessionOverheadSeconds = 120;

constexpr int kLongSessionMinutes = 30;

/// @brief Solver configuration shared by all backends.
struct SolverConfig {
  ScoringWeights weights;
  int substitution_limit = kDefaultSubstitutionLimit;
  BackendKind backend = BackendKind::Greedy;
  bool verbose = false;  ///< Log commits and termination to stderr.
};

/// @brief Warmup/cooldown seconds reserved out of the budget.
Seconds warmupCooldownOverhead(int time_available_minutes);

/// @brief Abstract packing backend.
///
/// Every backend must produce output satisfying the same contract: no
/// duplicate exercises, committed estimates within the budget, monotone
/// coverage, and an empty result when nothing is eligible. Backends are
/// invoked synchronously and return complete results only.
class ISolverBackend {
 public:
  virtual ~ISolverBackend() = default;

  /// @brief Backend identifier for logs.
  virtual const char* name() const = 0;

  /// @brief Select and prescribe exercises for a request.
  /// @param catalog Full catalog (the backend applies the hard filter).
  /// @param request Pre-validated request.
  /// @param recovery Recovery windows resolved for the request.
  /// @return Packing result; coverage display names are muscle ids.
  virtual PackingResult solve(const std::vector<Exercise>& catalog,
                              const PrescriptionRequest& request,
                              const RecoveryWindows& recovery) const = 0;
};

/// @brief Create the backend named by config.backend.
std::unique_ptr<ISolverBackend> createSolverBackend(const SolverConfig& config);

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_SOLVER_BACKEND_H
