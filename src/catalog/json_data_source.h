// In-memory IExerciseDataSource backed by JSON catalog and history documents.

#ifndef LIFTPACK_CATALOG_JSON_DATA_SOURCE_H
#define LIFTPACK_CATALOG_JSON_DATA_SOURCE_H

#include <functional>
#include <string>
#include <vector>

#include "catalog/data_source.h"

namespace liftpack {

/// @brief Data source serving a loaded catalog and workout history.
///
/// The wall clock used for recovery bucketing is injectable so tests can pin
/// "now". Documents can be replaced at any time; callers holding a
/// CatalogCache must invalidate it afterwards.
class JsonDataSource : public IExerciseDataSource {
 public:
  using WallClock = std::function<Timestamp()>;

  /// @brief Construct with the system clock.
  JsonDataSource();

  /// @brief Construct with an injected clock returning Unix seconds.
  explicit JsonDataSource(WallClock clock);

  /// @brief Replace the catalog from a JSON document.
  /// @return False (catalog unchanged) on parse or validation error.
  bool loadCatalog(const std::string& json_text, std::string& error);

  /// @brief Replace the catalog from a JSON file.
  bool loadCatalogFile(const std::string& path, std::string& error);

  /// @brief Replace the workout history from a JSON document.
  bool loadHistory(const std::string& json_text, std::string& error);

  /// @brief Replace the workout history from a JSON file.
  bool loadHistoryFile(const std::string& path, std::string& error);

  /// @brief Replace the catalog directly.
  void setExercises(std::vector<Exercise> exercises, MuscleNameMap muscle_names);

  /// @brief Replace the workout history directly.
  void setHistory(std::vector<WorkoutRecord> workouts);

  bool hasCatalog() const { return has_catalog_; }

  bool getAllExercises(std::vector<Exercise>& out, std::string& error) override;
  bool getMuscleNames(MuscleNameMap& out, std::string& error) override;
  bool getRecentActivations(const std::vector<std::string>& workout_ids,
                            RecoveryWindows& out, std::string& error) override;

 private:
  WallClock clock_;
  std::vector<Exercise> exercises_;
  MuscleNameMap muscle_names_;
  std::vector<WorkoutRecord> workouts_;
  bool has_catalog_ = false;
};

}  // namespace liftpack

#endif  // LIFTPACK_CATALOG_JSON_DATA_SOURCE_H
