/// @file
/// @brief Coverage tracker.

#include "solver/muscle_coverage.h"

namespace liftpack {

void MuscleCoverage::update(const Exercise& exercise, int sets) {
  for (const auto& [muscle_id, activation] : exercise.activations) {
    if (activation <= 0.0) continue;
    bool primary = exercise.countsAsPrimary(muscle_id);

    auto iter = entries_.find(muscle_id);
    if (iter == entries_.end()) {
      MuscleCoverageEntry entry;
      entry.display_name = muscle_id;
      entry.activation_level = primary ? ActivationLevel::Primary : ActivationLevel::Secondary;
      entry.total_sets = sets;
      entries_.emplace(muscle_id, std::move(entry));
      continue;
    }

    iter->second.total_sets += sets;
    if (primary) iter->second.activation_level = ActivationLevel::Primary;
  }
}

const MuscleCoverageEntry* MuscleCoverage::find(const std::string& muscle_id) const {
  auto iter = entries_.find(muscle_id);
  return iter == entries_.end() ? nullptr : &iter->second;
}

void MuscleCoverage::applyDisplayNames(const MuscleNameMap& names) {
  for (auto& [muscle_id, entry] : entries_) {
    auto name = names.find(muscle_id);
    entry.display_name = (name != names.end()) ? name->second : muscle_id;
  }
}

}  // namespace liftpack
