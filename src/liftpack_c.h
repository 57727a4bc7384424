// C API for FFI bindings.

#ifndef LIFTPACK_C_H
#define LIFTPACK_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a prescriber instance.
typedef void* LiftpackHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  LIFTPACK_OK = 0,
  LIFTPACK_ERROR_INVALID_PARAM = 1,
  LIFTPACK_ERROR_INVALID_JSON = 2,
  LIFTPACK_ERROR_INVALID_CATALOG = 3,
  LIFTPACK_ERROR_INVALID_HISTORY = 4,
  LIFTPACK_ERROR_INVALID_TIME = 5,
  LIFTPACK_ERROR_INVALID_LOCATION = 6,
  LIFTPACK_ERROR_INVALID_GOAL = 7,
  LIFTPACK_ERROR_INVALID_LEVEL = 8,
  LIFTPACK_ERROR_INVALID_REQUEST = 9,
  LIFTPACK_ERROR_DATA_SOURCE = 10,
} LiftpackError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief Result JSON output.
typedef struct {
  char* json;     ///< JSON string
  size_t length;  ///< String length
} LiftpackResultData;

/// @brief Summary of the last prescription.
typedef struct {
  uint16_t exercise_count;         ///< Number of prescribed exercises
  uint16_t muscle_count;           ///< Number of covered muscles
  uint32_t actual_duration_seconds;  ///< Session length including warmup/cooldown
} LiftpackInfo;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new prescriber instance with an empty catalog.
/// @return Handle (must be freed with liftpack_destroy)
LiftpackHandle liftpack_create(void);

/// @brief Destroy a prescriber instance.
/// @param handle Handle to destroy
void liftpack_destroy(LiftpackHandle handle);

// ============================================================================
// Data Loading
// ============================================================================

/// @brief Replace the exercise catalog.
///
/// Document: {"muscles": {id: name}, "exercises": [...]}. The catalog cache
/// is invalidated on success.
///
/// @param handle Liftpack handle
/// @param json Catalog JSON
/// @param length Length of the JSON string
/// @return LIFTPACK_OK on success
LiftpackError liftpack_load_catalog(LiftpackHandle handle, const char* json, size_t length);

/// @brief Replace the workout history used for recovery windows.
///
/// Document: {"workouts": [{"id", "completed_at", "activations"}]}.
///
/// @param handle Liftpack handle
/// @param json History JSON
/// @param length Length of the JSON string
/// @return LIFTPACK_OK on success
LiftpackError liftpack_load_history(LiftpackHandle handle, const char* json, size_t length);

/// @brief Pin the clock used for recovery windows (Unix seconds, 0 = system clock).
void liftpack_set_now(LiftpackHandle handle, int64_t unix_seconds);

/// @brief Select the solver backend by name ("greedy", "indexed").
/// @return LIFTPACK_ERROR_INVALID_PARAM on unknown name
LiftpackError liftpack_set_backend(LiftpackHandle handle, const char* name);

// ============================================================================
// Prescription
// ============================================================================

/// @brief Prescribe a workout from a JSON request.
///
/// JSON fields (defaults applied when missing):
///   time_available_minutes: number (15-120, default 30)
///   location: string ("gym", "home", "park", "hotel", "office", "travel")
///   equipment: array of strings
///   goals: array of strings ("strength", "hypertrophy", ...)
///   fitness_level: string ("beginner", "intermediate", "advanced")
///   excluded_exercises, excluded_muscles, recent_workout_ids: arrays of strings
///
/// @param handle Liftpack handle
/// @param json Request JSON
/// @param length Length of the JSON string
/// @return LIFTPACK_OK on success
LiftpackError liftpack_prescribe_from_json(LiftpackHandle handle, const char* json,
                                           size_t length);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Get the last result as JSON.
/// @param handle Liftpack handle
/// @return ResultData (must be freed with liftpack_free_result), or NULL
LiftpackResultData* liftpack_get_result(LiftpackHandle handle);

/// @brief Free result data.
/// @param data Pointer returned by liftpack_get_result
void liftpack_free_result(LiftpackResultData* data);

/// @brief Get a summary of the last result.
/// @param handle Liftpack handle
/// @return Pointer to static LiftpackInfo (valid until next call, do not free)
LiftpackInfo* liftpack_get_info(LiftpackHandle handle);

/// @brief Detail for the last failed call on this handle.
/// @return Message (owned by the handle, do not free); empty if none
const char* liftpack_last_error(LiftpackHandle handle);

// ============================================================================
// Location Enumeration
// ============================================================================

/// @brief Get number of locations. @return Count
uint8_t liftpack_location_count(void);

/// @brief Get location name. @param id Location ID @return Name (e.g. "gym")
const char* liftpack_location_name(uint8_t id);

// ============================================================================
// Goal Enumeration
// ============================================================================

/// @brief Get number of goals. @return Count
uint8_t liftpack_goal_count(void);

/// @brief Get goal name. @param id Goal ID @return Name (e.g. "fat_loss")
const char* liftpack_goal_name(uint8_t id);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* liftpack_error_string(LiftpackError error);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* liftpack_version(void);

#ifdef __cplusplus
}
#endif

#endif  // LIFTPACK_C_H
