// Implementation of C API for FFI bindings.

#include "liftpack_c.h"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>

#include "catalog/catalog_cache.h"
#include "catalog/json_data_source.h"
#include "core/basic_types.h"
#include "core/json_parser.h"
#include "core/version_info.h"
#include "prescriber.h"

namespace {

/// @brief Internal state held per LiftpackHandle.
struct LiftpackInstance {
  LiftpackInstance()
      : source([this] { return currentTime(); }), cache(source) {}

  liftpack::Timestamp currentTime() const {
    if (pinned_now != 0) return pinned_now;
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }

  int64_t pinned_now = 0;
  liftpack::JsonDataSource source;
  liftpack::CatalogCache cache;
  liftpack::SolverConfig config;
  liftpack::PrescriptionResult result;
  std::string result_json;
  std::string last_error;
  bool has_result = false;
};

/// @brief Map a request rejection to an error code.
LiftpackError requestErrorToCode(liftpack::RequestError error) {
  switch (error) {
    case liftpack::RequestError::None: return LIFTPACK_OK;
    case liftpack::RequestError::TimeOutOfRange: return LIFTPACK_ERROR_INVALID_TIME;
    case liftpack::RequestError::UnknownLocation: return LIFTPACK_ERROR_INVALID_LOCATION;
    case liftpack::RequestError::UnknownGoal: return LIFTPACK_ERROR_INVALID_GOAL;
    case liftpack::RequestError::UnknownFitnessLevel: return LIFTPACK_ERROR_INVALID_LEVEL;
    case liftpack::RequestError::NotAnObject:
    case liftpack::RequestError::InvalidField:
      return LIFTPACK_ERROR_INVALID_REQUEST;
  }
  return LIFTPACK_ERROR_INVALID_REQUEST;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

LiftpackHandle liftpack_create(void) {
  return new LiftpackInstance();
}

void liftpack_destroy(LiftpackHandle handle) {
  delete static_cast<LiftpackInstance*>(handle);
}

// ============================================================================
// Data Loading
// ============================================================================

LiftpackError liftpack_load_catalog(LiftpackHandle handle, const char* json, size_t length) {
  if (!handle || !json) {
    return LIFTPACK_ERROR_INVALID_PARAM;
  }
  auto* instance = static_cast<LiftpackInstance*>(handle);
  instance->last_error.clear();
  if (!instance->source.loadCatalog(std::string(json, length), instance->last_error)) {
    return LIFTPACK_ERROR_INVALID_CATALOG;
  }
  instance->cache.invalidate();
  return LIFTPACK_OK;
}

LiftpackError liftpack_load_history(LiftpackHandle handle, const char* json, size_t length) {
  if (!handle || !json) {
    return LIFTPACK_ERROR_INVALID_PARAM;
  }
  auto* instance = static_cast<LiftpackInstance*>(handle);
  instance->last_error.clear();
  if (!instance->source.loadHistory(std::string(json, length), instance->last_error)) {
    return LIFTPACK_ERROR_INVALID_HISTORY;
  }
  return LIFTPACK_OK;
}

void liftpack_set_now(LiftpackHandle handle, int64_t unix_seconds) {
  if (!handle) return;
  static_cast<LiftpackInstance*>(handle)->pinned_now = unix_seconds;
}

LiftpackError liftpack_set_backend(LiftpackHandle handle, const char* name) {
  if (!handle || !name) {
    return LIFTPACK_ERROR_INVALID_PARAM;
  }
  auto kind = liftpack::backendKindFromString(name);
  if (!kind) return LIFTPACK_ERROR_INVALID_PARAM;
  static_cast<LiftpackInstance*>(handle)->config.backend = *kind;
  return LIFTPACK_OK;
}

// ============================================================================
// Prescription
// ============================================================================

LiftpackError liftpack_prescribe_from_json(LiftpackHandle handle, const char* json,
                                           size_t length) {
  if (!handle || !json) {
    return LIFTPACK_ERROR_INVALID_PARAM;
  }

  auto* instance = static_cast<LiftpackInstance*>(handle);
  instance->has_result = false;
  instance->last_error.clear();

  // Parse and validate request
  liftpack::JsonValue root;
  if (!liftpack::parseJson(json, length, root, instance->last_error)) {
    return LIFTPACK_ERROR_INVALID_JSON;
  }
  liftpack::PrescriptionRequest request;
  std::string detail;
  liftpack::RequestError err = liftpack::requestFromJson(root, request, detail);
  if (err != liftpack::RequestError::None) {
    instance->last_error = liftpack::requestErrorToString(err);
    if (!detail.empty()) instance->last_error += ": " + detail;
    return requestErrorToCode(err);
  }

  // Prescribe
  instance->result =
      liftpack::prescribe(request, instance->cache, instance->source, instance->config);
  if (!instance->result.success) {
    instance->last_error = instance->result.error_message;
    return LIFTPACK_ERROR_DATA_SOURCE;
  }

  instance->result_json = liftpack::buildResultJson(instance->result);
  instance->has_result = true;
  return LIFTPACK_OK;
}

// ============================================================================
// Output Retrieval
// ============================================================================

LiftpackResultData* liftpack_get_result(LiftpackHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<LiftpackInstance*>(handle);
  if (!instance->has_result) return nullptr;

  auto* result = static_cast<LiftpackResultData*>(malloc(sizeof(LiftpackResultData)));
  if (!result) return nullptr;

  result->length = instance->result_json.size();
  result->json = static_cast<char*>(malloc(result->length + 1));
  if (!result->json) {
    free(result);
    return nullptr;
  }

  memcpy(result->json, instance->result_json.c_str(), result->length + 1);
  return result;
}

void liftpack_free_result(LiftpackResultData* data) {
  if (data) {
    free(data->json);
    free(data);
  }
}

// Static buffer for info queries
static LiftpackInfo s_info;

LiftpackInfo* liftpack_get_info(LiftpackHandle handle) {
  s_info = {};
  if (!handle) return &s_info;

  auto* instance = static_cast<LiftpackInstance*>(handle);
  if (!instance->has_result) return &s_info;

  s_info.exercise_count = static_cast<uint16_t>(instance->result.exercises.size());
  s_info.muscle_count = static_cast<uint16_t>(instance->result.coverage.size());
  s_info.actual_duration_seconds =
      static_cast<uint32_t>(instance->result.actual_duration_seconds);
  return &s_info;
}

const char* liftpack_last_error(LiftpackHandle handle) {
  if (!handle) return "";
  return static_cast<LiftpackInstance*>(handle)->last_error.c_str();
}

// ============================================================================
// Location Enumeration
// ============================================================================

uint8_t liftpack_location_count(void) {
  return static_cast<uint8_t>(liftpack::kLocationCount);
}

const char* liftpack_location_name(uint8_t id) {
  if (id >= liftpack::kLocationCount) return "";
  return liftpack::locationToString(static_cast<liftpack::Location>(id));
}

// ============================================================================
// Goal Enumeration
// ============================================================================

uint8_t liftpack_goal_count(void) {
  return static_cast<uint8_t>(liftpack::kGoalCount);
}

const char* liftpack_goal_name(uint8_t id) {
  if (id >= liftpack::kGoalCount) return "";
  return liftpack::goalToString(static_cast<liftpack::Goal>(id));
}

// ============================================================================
// Error Handling
// ============================================================================

const char* liftpack_error_string(LiftpackError error) {
  switch (error) {
    case LIFTPACK_OK: return "No error";
    case LIFTPACK_ERROR_INVALID_PARAM: return "Invalid parameter";
    case LIFTPACK_ERROR_INVALID_JSON: return "Malformed JSON";
    case LIFTPACK_ERROR_INVALID_CATALOG: return "Invalid exercise catalog";
    case LIFTPACK_ERROR_INVALID_HISTORY: return "Invalid workout history";
    case LIFTPACK_ERROR_INVALID_TIME: return "Time available must be 15-120 minutes";
    case LIFTPACK_ERROR_INVALID_LOCATION: return "Invalid location";
    case LIFTPACK_ERROR_INVALID_GOAL: return "Invalid goal";
    case LIFTPACK_ERROR_INVALID_LEVEL: return "Invalid fitness level";
    case LIFTPACK_ERROR_INVALID_REQUEST: return "Invalid request";
    case LIFTPACK_ERROR_DATA_SOURCE: return "Data source failure";
  }
  return "Unknown error";
}

// ============================================================================
// Utilities
// ============================================================================

const char* liftpack_version(void) {
  return LIFTPACK_VERSION;
}

}  // extern "C"
