// Indexed packer: same selection as GreedySolver, with per-solve
// precomputation.
//
// Muscles are mapped to dense bit positions, every eligible exercise gets an
// activation bitmask, and the coverage-independent score terms and time
// estimates are computed once. Each iteration then only recomputes the
// coverage-gap term from a mask difference.

#ifndef LIFTPACK_SOLVER_INDEXED_SOLVER_H
#define LIFTPACK_SOLVER_INDEXED_SOLVER_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "solver/solver_backend.h"

namespace liftpack {

/// @brief Variable-width bitmask over dense muscle indices.
class MuscleMask {
 public:
  MuscleMask() = default;
  explicit MuscleMask(size_t bit_count) : words_((bit_count + 63) / 64, 0) {}

  void set(size_t bit) { words_[bit / 64] |= (uint64_t{1} << (bit % 64)); }
  bool test(size_t bit) const { return (words_[bit / 64] >> (bit % 64)) & 1u; }

  /// @brief OR another mask of the same width into this one.
  void merge(const MuscleMask& other);

  /// @brief Number of bits set here and clear in @p other.
  int countMissingFrom(const MuscleMask& other) const;

 private:
  std::vector<uint64_t> words_;
};

/// @brief Bitmask-indexed backend. Output is identical to GreedySolver.
class IndexedSolver : public ISolverBackend {
 public:
  explicit IndexedSolver(const SolverConfig& config) : config_(config) {}

  const char* name() const override { return "indexed"; }

  PackingResult solve(const std::vector<Exercise>& catalog,
                      const PrescriptionRequest& request,
                      const RecoveryWindows& recovery) const override;

 private:
  SolverConfig config_;
};

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_INDEXED_SOLVER_H
