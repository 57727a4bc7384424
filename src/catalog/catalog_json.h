// JSON loading for exercise catalogs and workout history documents.
//
// Catalog document:
//   {
//     "muscles": {"chest": "Chest", ...},
//     "exercises": [
//       {"id": "push_up", "name": "Push-Up", "difficulty": 2,
//        "movement_pattern": "push", "is_compound": true,
//        "locations": ["home", "hotel"], "equipment_required": [],
//        "equipment_optional": [], "rest_seconds": 60,
//        "activations": {"chest": 70, "triceps": 40},
//        "primary_muscles": ["chest"], "is_timed": false,
//        "description": "..."}
//     ]
//   }
//
// History document:
//   {"workouts": [{"id": "w1", "completed_at": 1700000000,
//                  "activations": {"chest": 70}}]}

#ifndef LIFTPACK_CATALOG_CATALOG_JSON_H
#define LIFTPACK_CATALOG_CATALOG_JSON_H

#include <string>
#include <vector>

#include "catalog/exercise.h"
#include "core/json_parser.h"
#include "recovery/recovery_windows.h"

namespace liftpack {

/// Upper bound accepted for an exercise's rest_seconds.
constexpr Seconds kMaxRestSeconds = 3600;

/// @brief Build one Exercise from a catalog entry.
///
/// Required: "id", "movement_pattern", "locations". Difficulty must be 1-5
/// and rest_seconds 0-kMaxRestSeconds. Missing "name" falls back to the id;
/// missing "rest_seconds" to 60.
///
/// @return False with error naming the offending exercise on invalid input.
bool exerciseFromJson(const JsonValue& entry, Exercise& out, std::string& error);

/// @brief Parse a catalog document.
/// @param text JSON text.
/// @param[out] exercises Exercises in document order.
/// @param[out] muscle_names Muscle display names (empty if absent).
/// @param[out] error Failure description.
/// @return True on success. Duplicate exercise ids are rejected.
bool loadCatalogJson(const std::string& text, std::vector<Exercise>& exercises,
                     MuscleNameMap& muscle_names, std::string& error);

/// @brief Parse a workout history document.
bool loadWorkoutHistoryJson(const std::string& text, std::vector<WorkoutRecord>& workouts,
                            std::string& error);

}  // namespace liftpack

#endif  // LIFTPACK_CATALOG_CATALOG_JSON_H
