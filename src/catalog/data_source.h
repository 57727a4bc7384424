// Pure abstract interface for the exercise data layer.
// Concrete implementations: JsonDataSource (in-memory documents).

#ifndef LIFTPACK_CATALOG_DATA_SOURCE_H
#define LIFTPACK_CATALOG_DATA_SOURCE_H

#include <string>
#include <vector>

#include "catalog/exercise.h"
#include "recovery/recovery_windows.h"

namespace liftpack {

/// @brief Read-only collaborator that supplies catalog and history data.
///
/// Every call reports failure by returning false and filling @p error. The
/// solver forwards the message unmodified and never retries.
class IExerciseDataSource {
 public:
  virtual ~IExerciseDataSource() = default;

  /// @brief Load every exercise in catalog order.
  virtual bool getAllExercises(std::vector<Exercise>& out, std::string& error) = 0;

  /// @brief Load the muscle id to display name table.
  virtual bool getMuscleNames(MuscleNameMap& out, std::string& error) = 0;

  /// @brief Resolve recovery windows for the given workouts.
  virtual bool getRecentActivations(const std::vector<std::string>& workout_ids,
                                    RecoveryWindows& out, std::string& error) = 0;
};

}  // namespace liftpack

#endif  // LIFTPACK_CATALOG_DATA_SOURCE_H
