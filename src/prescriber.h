// Prescription entry point: validates a request, loads the catalog through the
// cache, resolves recovery windows, and runs the configured solver backend.

#ifndef LIFTPACK_PRESCRIBER_H
#define LIFTPACK_PRESCRIBER_H

#include <map>
#include <string>
#include <vector>

#include "catalog/catalog_cache.h"
#include "catalog/data_source.h"
#include "core/json_parser.h"
#include "solver/prescription_types.h"
#include "solver/solver_backend.h"

namespace liftpack {

/// @brief Result from one prescription.
struct PrescriptionResult {
  std::vector<PrescribedExercise> exercises;
  MuscleCoverage coverage;  ///< Display names resolved from the catalog.
  Seconds actual_duration_seconds = 0;
  std::map<std::string, std::vector<PrescribedExercise>> substitutions;
  bool success = false;
  std::string error_message;
  std::string backend_name;
};

/// @brief Reasons a request is rejected at the boundary.
enum class RequestError : uint8_t {
  None,
  NotAnObject,
  TimeOutOfRange,
  UnknownLocation,
  UnknownGoal,
  UnknownFitnessLevel,
  InvalidField
};

/// @brief Convert RequestError to a human-readable message.
const char* requestErrorToString(RequestError error);

/// @brief Check a typed request: minutes within [15, 120] and enum values in range.
RequestError validateRequest(const PrescriptionRequest& request);

/// @brief Parse a request document.
///
/// Fields: time_available_minutes (or minutes), location, equipment, goals,
/// fitness_level, excluded_exercises, excluded_muscles, recent_workout_ids.
/// Missing fields keep their defaults. The parsed request is also validated.
///
/// @param root Parsed JSON root.
/// @param[out] out Request on success.
/// @param[out] detail Offending field or value on failure.
/// @return RequestError::None on success.
RequestError requestFromJson(const JsonValue& root, PrescriptionRequest& out,
                             std::string& detail);

/// @brief Produce a prescription.
///
/// Data source failures (catalog or recent activations) are reported through
/// error_message unmodified, with no partial result.
///
/// @param request Request to serve; validated before any data access.
/// @param cache Catalog cache over @p source.
/// @param source Data source used for recent activations.
/// @param config Solver configuration (backend, weights, verbosity).
/// @return PrescriptionResult with success flag.
PrescriptionResult prescribe(const PrescriptionRequest& request, CatalogCache& cache,
                             IExerciseDataSource& source, const SolverConfig& config);

/// @brief Serialize a successful result.
/// @param result Prescription result.
/// @param pretty Indent the output.
/// @return JSON document.
std::string buildResultJson(const PrescriptionResult& result, bool pretty = false);

}  // namespace liftpack

#endif  // LIFTPACK_PRESCRIBER_H
