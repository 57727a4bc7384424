// Per-muscle coverage accumulator threaded through one solve.

#ifndef LIFTPACK_SOLVER_MUSCLE_COVERAGE_H
#define LIFTPACK_SOLVER_MUSCLE_COVERAGE_H

#include <map>
#include <string>

#include "catalog/exercise.h"
#include "core/basic_types.h"

namespace liftpack {

/// @brief Coverage state of a single muscle.
struct MuscleCoverageEntry {
  std::string display_name;
  ActivationLevel activation_level = ActivationLevel::Secondary;
  int total_sets = 0;
};

/// @brief Accumulates which muscles the committed exercises have trained.
///
/// Invariants: entries are never removed, activation_level only moves
/// Secondary -> Primary, and total_sets never decreases.
class MuscleCoverage {
 public:
  /// @brief Record a committed exercise.
  ///
  /// For every muscle with positive activation: insert it if absent (Primary
  /// when the exercise counts it as primary, else Secondary) with
  /// total_sets = sets; otherwise add sets and upgrade to Primary under the
  /// same condition.
  void update(const Exercise& exercise, int sets);

  /// @brief True if the muscle has been recorded.
  bool contains(const std::string& muscle_id) const {
    return entries_.count(muscle_id) > 0;
  }

  /// @brief Entry for a muscle, or nullptr.
  const MuscleCoverageEntry* find(const std::string& muscle_id) const;

  /// @brief Fill display names from a lookup, falling back to the muscle id.
  void applyDisplayNames(const MuscleNameMap& names);

  const std::map<std::string, MuscleCoverageEntry>& entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

 private:
  std::map<std::string, MuscleCoverageEntry> entries_;
};

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_MUSCLE_COVERAGE_H
