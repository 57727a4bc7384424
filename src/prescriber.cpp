/// @file
/// @brief Prescription entry point, request parsing and result serialization.

#include "prescriber.h"

#include <cmath>
#include <cstdio>

#include "core/json_helpers.h"

namespace liftpack {

const char* requestErrorToString(RequestError error) {
  switch (error) {
    case RequestError::None: return "ok";
    case RequestError::NotAnObject: return "request must be a JSON object";
    case RequestError::TimeOutOfRange: return "time_available_minutes must be within 15-120";
    case RequestError::UnknownLocation: return "unknown location";
    case RequestError::UnknownGoal: return "unknown goal";
    case RequestError::UnknownFitnessLevel: return "unknown fitness level";
    case RequestError::InvalidField: return "invalid field";
  }
  return "unknown error";
}

RequestError validateRequest(const PrescriptionRequest& request) {
  if (request.time_available_minutes < kMinTimeAvailableMinutes ||
      request.time_available_minutes > kMaxTimeAvailableMinutes) {
    return RequestError::TimeOutOfRange;
  }
  if (static_cast<int>(request.location) >= kLocationCount) {
    return RequestError::UnknownLocation;
  }
  for (Goal goal : request.goals) {
    if (static_cast<int>(goal) >= kGoalCount) return RequestError::UnknownGoal;
  }
  if (request.fitness_level &&
      static_cast<int>(*request.fitness_level) > static_cast<int>(FitnessLevel::Advanced)) {
    return RequestError::UnknownFitnessLevel;
  }
  return RequestError::None;
}

namespace {

/// @brief Read an optional string-array member.
bool readStringList(const JsonValue& root, const char* key, std::vector<std::string>& out,
                    std::string& detail) {
  const JsonValue* member = root.find(key);
  if (!member || member->type == JsonValue::Null) return true;
  if (!member->isArray()) {
    detail = key;
    return false;
  }
  for (const auto& item : member->array_val) {
    if (!item.isString()) {
      detail = key;
      return false;
    }
    out.push_back(item.string_val);
  }
  return true;
}

}  // namespace

RequestError requestFromJson(const JsonValue& root, PrescriptionRequest& out,
                             std::string& detail) {
  if (!root.isObject()) return RequestError::NotAnObject;

  PrescriptionRequest request;

  const JsonValue* minutes = root.find("time_available_minutes");
  if (!minutes) minutes = root.find("minutes");
  if (minutes) {
    if (!minutes->isNumber() || std::floor(minutes->number_val) != minutes->number_val) {
      detail = "time_available_minutes";
      return RequestError::InvalidField;
    }
    // Clamp before the int conversion; validation rejects the range below.
    double clamped = std::fmax(-1.0, std::fmin(minutes->number_val, 100000.0));
    request.time_available_minutes = static_cast<int>(clamped);
  }

  if (const JsonValue* location = root.find("location")) {
    auto parsed = locationFromString(location->asString());
    if (!location->isString() || !parsed) {
      detail = location->asString();
      return RequestError::UnknownLocation;
    }
    request.location = *parsed;
  }

  std::vector<std::string> goal_names;
  if (!readStringList(root, "goals", goal_names, detail)) return RequestError::InvalidField;
  for (const auto& name : goal_names) {
    auto goal = goalFromString(name);
    if (!goal) {
      detail = name;
      return RequestError::UnknownGoal;
    }
    request.goals.push_back(*goal);
  }

  if (const JsonValue* level = root.find("fitness_level")) {
    if (level->type != JsonValue::Null) {
      auto parsed = fitnessLevelFromString(level->asString());
      if (!level->isString() || !parsed) {
        detail = level->asString();
        return RequestError::UnknownFitnessLevel;
      }
      request.fitness_level = *parsed;
    }
  }

  if (!readStringList(root, "equipment", request.equipment, detail) ||
      !readStringList(root, "excluded_exercises", request.excluded_exercises, detail) ||
      !readStringList(root, "excluded_muscles", request.excluded_muscles, detail) ||
      !readStringList(root, "recent_workout_ids", request.recent_workout_ids, detail)) {
    return RequestError::InvalidField;
  }

  RequestError err = validateRequest(request);
  if (err != RequestError::None) {
    detail = std::to_string(request.time_available_minutes);
    return err;
  }
  out = std::move(request);
  return RequestError::None;
}

PrescriptionResult prescribe(const PrescriptionRequest& request, CatalogCache& cache,
                             IExerciseDataSource& source, const SolverConfig& config) {
  PrescriptionResult result;

  RequestError err = validateRequest(request);
  if (err != RequestError::None) {
    result.error_message = requestErrorToString(err);
    return result;
  }

  std::shared_ptr<const CatalogSnapshot> snapshot;
  if (!cache.get(snapshot, result.error_message)) return result;

  RecoveryWindows recovery;
  if (!request.recent_workout_ids.empty()) {
    if (!source.getRecentActivations(request.recent_workout_ids, recovery,
                                     result.error_message)) {
      return result;
    }
  }

  auto backend = createSolverBackend(config);
  result.backend_name = backend->name();
  if (config.verbose) {
    std::fprintf(stderr,
                 "[Prescriber] backend=%s catalog=%zu recovering(24h)=%zu recovering(48h)=%zu\n",
                 backend->name(), snapshot->exercises.size(), recovery.last_24h.size(),
                 recovery.last_48h.size());
  }

  PackingResult packed = backend->solve(snapshot->exercises, request, recovery);
  packed.coverage.applyDisplayNames(snapshot->muscle_names);

  result.exercises = std::move(packed.exercises);
  result.coverage = std::move(packed.coverage);
  result.actual_duration_seconds = packed.actual_duration_seconds;
  result.substitutions = std::move(packed.substitutions);
  result.success = true;
  return result;
}

namespace {

void writePrescribedExercise(JsonWriter& writer, const PrescribedExercise& item) {
  writer.beginObject();
  writer.key("exercise_id");
  writer.value(item.exercise_id);
  writer.key("name");
  writer.value(item.name);
  writer.key("sets");
  writer.value(item.sets);
  writer.key("reps");
  writer.value(item.repsLabel());
  writer.key("rest_seconds");
  writer.value(static_cast<int>(item.rest_seconds));
  writer.key("estimated_seconds");
  writer.value(static_cast<int>(item.estimated_seconds));
  writer.key("movement_pattern");
  writer.value(movementPatternToString(item.movement_pattern));
  writer.key("primary_muscles");
  writer.stringArray(item.primary_muscles);
  writer.key("secondary_muscles");
  writer.stringArray(item.secondary_muscles);
  writer.key("notes");
  if (item.notes.empty()) {
    writer.valueNull();
  } else {
    writer.value(item.notes);
  }
  writer.endObject();
}

}  // namespace

std::string buildResultJson(const PrescriptionResult& result, bool pretty) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("backend");
  writer.value(result.backend_name);
  writer.key("actual_duration_seconds");
  writer.value(static_cast<int>(result.actual_duration_seconds));

  writer.key("exercises");
  writer.beginArray();
  for (const auto& item : result.exercises) writePrescribedExercise(writer, item);
  writer.endArray();

  writer.key("muscle_coverage");
  writer.beginObject();
  for (const auto& [muscle_id, entry] : result.coverage.entries()) {
    writer.key(muscle_id);
    writer.beginObject();
    writer.key("name");
    writer.value(entry.display_name);
    writer.key("activation_level");
    writer.value(activationLevelToString(entry.activation_level));
    writer.key("total_sets");
    writer.value(entry.total_sets);
    writer.endObject();
  }
  writer.endObject();

  writer.key("substitutions");
  writer.beginObject();
  for (const auto& [exercise_id, alternatives] : result.substitutions) {
    writer.key(exercise_id);
    writer.beginArray();
    for (const auto& alt : alternatives) writePrescribedExercise(writer, alt);
    writer.endArray();
  }
  writer.endObject();

  writer.endObject();
  return pretty ? writer.toPrettyString() : writer.toString();
}

}  // namespace liftpack
