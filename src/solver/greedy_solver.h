// Reference greedy packer: Filtering -> Iterating -> Done.
//
// Each iteration rescores every unselected eligible exercise against the
// current coverage, takes the best-scoring candidate that fits the remaining
// budget, and stops when the budget drops to 60s or nothing fits.

#ifndef LIFTPACK_SOLVER_GREEDY_SOLVER_H
#define LIFTPACK_SOLVER_GREEDY_SOLVER_H

#include "solver/solver_backend.h"

namespace liftpack {

/// @brief Greedy bin-packing backend.
class GreedySolver : public ISolverBackend {
 public:
  explicit GreedySolver(const SolverConfig& config) : config_(config) {}

  const char* name() const override { return "greedy"; }

  PackingResult solve(const std::vector<Exercise>& catalog,
                      const PrescriptionRequest& request,
                      const RecoveryWindows& recovery) const override;

 private:
  SolverConfig config_;
};

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_GREEDY_SOLVER_H
