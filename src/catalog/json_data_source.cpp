/// @file
/// @brief In-memory JSON-backed data source.

#include "catalog/json_data_source.h"

#include <chrono>

#include "catalog/catalog_json.h"
#include "core/json_parser.h"

namespace liftpack {

namespace {

Timestamp systemNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

JsonDataSource::JsonDataSource() : clock_(systemNow) {}

JsonDataSource::JsonDataSource(WallClock clock) : clock_(std::move(clock)) {
  if (!clock_) clock_ = systemNow;
}

bool JsonDataSource::loadCatalog(const std::string& json_text, std::string& error) {
  std::vector<Exercise> exercises;
  MuscleNameMap names;
  if (!loadCatalogJson(json_text, exercises, names, error)) return false;
  setExercises(std::move(exercises), std::move(names));
  return true;
}

bool JsonDataSource::loadCatalogFile(const std::string& path, std::string& error) {
  std::string text;
  if (!readTextFile(path, text, error)) return false;
  return loadCatalog(text, error);
}

bool JsonDataSource::loadHistory(const std::string& json_text, std::string& error) {
  std::vector<WorkoutRecord> workouts;
  if (!loadWorkoutHistoryJson(json_text, workouts, error)) return false;
  setHistory(std::move(workouts));
  return true;
}

bool JsonDataSource::loadHistoryFile(const std::string& path, std::string& error) {
  std::string text;
  if (!readTextFile(path, text, error)) return false;
  return loadHistory(text, error);
}

void JsonDataSource::setExercises(std::vector<Exercise> exercises, MuscleNameMap muscle_names) {
  exercises_ = std::move(exercises);
  muscle_names_ = std::move(muscle_names);
  has_catalog_ = true;
}

void JsonDataSource::setHistory(std::vector<WorkoutRecord> workouts) {
  workouts_ = std::move(workouts);
}

bool JsonDataSource::getAllExercises(std::vector<Exercise>& out, std::string& error) {
  if (!has_catalog_) {
    error = "no exercise catalog loaded";
    return false;
  }
  out = exercises_;
  return true;
}

bool JsonDataSource::getMuscleNames(MuscleNameMap& out, std::string& /*error*/) {
  out = muscle_names_;
  return true;
}

bool JsonDataSource::getRecentActivations(const std::vector<std::string>& workout_ids,
                                          RecoveryWindows& out, std::string& /*error*/) {
  out = resolveRecoveryWindows(workouts_, workout_ids, clock_());
  return true;
}

}  // namespace liftpack
