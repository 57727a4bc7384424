// Request and result types exchanged between the prescriber and solver backends.

#ifndef LIFTPACK_SOLVER_PRESCRIPTION_TYPES_H
#define LIFTPACK_SOLVER_PRESCRIPTION_TYPES_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "solver/muscle_coverage.h"

namespace liftpack {

/// Accepted range for the time budget, enforced at the boundary.
constexpr int kMinTimeAvailableMinutes = 15;
constexpr int kMaxTimeAvailableMinutes = 120;

/// @brief A pre-validated prescription request.
struct PrescriptionRequest {
  int time_available_minutes = 30;
  Location location = Location::Gym;
  std::vector<std::string> equipment;            ///< Owned equipment tags.
  std::vector<Goal> goals;                       ///< Ordered; first goal dominates.
  std::optional<FitnessLevel> fitness_level;
  std::vector<std::string> excluded_exercises;
  std::vector<std::string> excluded_muscles;
  std::vector<std::string> recent_workout_ids;

  /// @brief True if the equipment tag is owned.
  bool ownsEquipment(const std::string& tag) const;

  /// @brief First goal, if any.
  std::optional<Goal> primaryGoal() const;
};

/// @brief A prescribed exercise. Immutable once created.
struct PrescribedExercise {
  std::string exercise_id;
  std::string name;
  int sets = 3;
  int reps = 10;
  bool timed = false;  ///< Reps rendered as a hold duration token.
  Seconds rest_seconds = 60;
  Seconds estimated_seconds = 0;
  std::vector<std::string> primary_muscles;
  std::vector<std::string> secondary_muscles;
  std::string notes;  ///< Empty when there is no coaching note.
  MovementPattern movement_pattern = MovementPattern::Isolation;

  /// @brief Reps as displayed: "10", or "30s" for timed exercises.
  std::string repsLabel() const;
};

/// @brief Output of one solve.
struct PackingResult {
  std::vector<PrescribedExercise> exercises;
  MuscleCoverage coverage;
  Seconds actual_duration_seconds = 0;
  std::map<std::string, std::vector<PrescribedExercise>> substitutions;
};

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_PRESCRIPTION_TYPES_H
