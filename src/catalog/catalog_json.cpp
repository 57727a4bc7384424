/// @file
/// @brief Catalog and workout history JSON loading.

#include "catalog/catalog_json.h"

#include <set>

namespace liftpack {

namespace {

/// @brief Read a {"muscle": number} object into an ActivationMap.
bool activationsFromJson(const JsonValue* node, ActivationMap& out, const std::string& owner,
                         std::string& error) {
  out.clear();
  if (!node) return true;
  if (!node->isObject()) {
    error = owner + ": \"activations\" must be an object";
    return false;
  }
  for (const auto& [muscle_id, pct] : node->object_val) {
    if (!pct.isNumber()) {
      error = owner + ": activation for " + muscle_id + " is not a number";
      return false;
    }
    double val = pct.number_val;
    if (val < 0.0 || val > 100.0) {
      error = owner + ": activation for " + muscle_id + " outside 0-100";
      return false;
    }
    out[muscle_id] = val;
  }
  return true;
}

}  // namespace

bool exerciseFromJson(const JsonValue& entry, Exercise& out, std::string& error) {
  if (!entry.isObject()) {
    error = "exercise entry is not an object";
    return false;
  }

  out = Exercise();
  const JsonValue* id = entry.find("id");
  if (!id || !id->isString() || id->string_val.empty()) {
    error = "exercise entry without \"id\"";
    return false;
  }
  out.id = id->string_val;
  const std::string owner = "exercise " + out.id;

  const JsonValue* name = entry.find("name");
  out.name = name ? name->asString(out.id) : out.id;

  const JsonValue* difficulty = entry.find("difficulty");
  if (difficulty) {
    if (!difficulty->isNumber() || difficulty->number_val < 1.0 ||
        difficulty->number_val > 5.0) {
      error = owner + ": difficulty must be 1-5";
      return false;
    }
    out.difficulty = difficulty->asInt();
  }

  const JsonValue* pattern = entry.find("movement_pattern");
  auto parsed_pattern = pattern ? movementPatternFromString(pattern->asString()) : std::nullopt;
  if (!parsed_pattern) {
    error = owner + ": missing or unknown movement_pattern";
    return false;
  }
  out.movement_pattern = *parsed_pattern;

  if (const JsonValue* compound = entry.find("is_compound")) {
    out.is_compound = compound->asBool(false);
  }

  const JsonValue* locations = entry.find("locations");
  if (!locations || !locations->isArray()) {
    error = owner + ": \"locations\" must be an array";
    return false;
  }
  for (const auto& loc_name : locations->asStringList()) {
    auto loc = locationFromString(loc_name);
    if (!loc) {
      error = owner + ": unknown location " + loc_name;
      return false;
    }
    out.locations.push_back(*loc);
  }

  if (const JsonValue* required = entry.find("equipment_required")) {
    out.equipment_required = required->asStringList();
  }
  if (const JsonValue* optional = entry.find("equipment_optional")) {
    out.equipment_optional = optional->asStringList();
  }

  if (const JsonValue* rest = entry.find("rest_seconds")) {
    if (!rest->isNumber() || rest->number_val < 0.0 ||
        rest->number_val > static_cast<double>(kMaxRestSeconds)) {
      error = owner + ": rest_seconds must be 0-" + std::to_string(kMaxRestSeconds);
      return false;
    }
    out.rest_seconds = static_cast<Seconds>(rest->asInt());
  }

  if (!activationsFromJson(entry.find("activations"), out.activations, owner, error)) {
    return false;
  }

  std::vector<std::string> flagged;
  if (const JsonValue* primaries = entry.find("primary_muscles")) {
    flagged = primaries->asStringList();
  }
  out.finalizePrimaryMuscles(flagged);

  if (const JsonValue* timed = entry.find("is_timed")) {
    out.is_timed = timed->asBool(false);
  }
  if (const JsonValue* desc = entry.find("description")) {
    out.description = desc->asString();
  }
  return true;
}

bool loadCatalogJson(const std::string& text, std::vector<Exercise>& exercises,
                     MuscleNameMap& muscle_names, std::string& error) {
  exercises.clear();
  muscle_names.clear();

  JsonValue root;
  if (!parseJson(text, root, error)) {
    error = "catalog: " + error;
    return false;
  }
  if (!root.isObject()) {
    error = "catalog: root must be an object";
    return false;
  }

  if (const JsonValue* muscles = root.find("muscles")) {
    if (!muscles->isObject()) {
      error = "catalog: \"muscles\" must be an object";
      return false;
    }
    for (const auto& [muscle_id, display] : muscles->object_val) {
      muscle_names[muscle_id] = display.asString(muscle_id);
    }
  }

  const JsonValue* entries = root.find("exercises");
  if (!entries || !entries->isArray()) {
    error = "catalog: \"exercises\" must be an array";
    return false;
  }

  std::set<std::string> seen;
  exercises.reserve(entries->array_val.size());
  for (const auto& entry : entries->array_val) {
    Exercise exercise;
    if (!exerciseFromJson(entry, exercise, error)) {
      error = "catalog: " + error;
      return false;
    }
    if (!seen.insert(exercise.id).second) {
      error = "catalog: duplicate exercise id " + exercise.id;
      return false;
    }
    exercises.push_back(std::move(exercise));
  }
  return true;
}

bool loadWorkoutHistoryJson(const std::string& text, std::vector<WorkoutRecord>& workouts,
                            std::string& error) {
  workouts.clear();

  JsonValue root;
  if (!parseJson(text, root, error)) {
    error = "history: " + error;
    return false;
  }
  const JsonValue* entries = root.find("workouts");
  if (!entries || !entries->isArray()) {
    error = "history: \"workouts\" must be an array";
    return false;
  }

  for (const auto& entry : entries->array_val) {
    WorkoutRecord record;
    const JsonValue* id = entry.find("id");
    if (!id || !id->isString()) {
      error = "history: workout entry without \"id\"";
      return false;
    }
    record.id = id->string_val;

    const JsonValue* completed = entry.find("completed_at");
    if (!completed || !completed->isNumber()) {
      error = "history: workout " + record.id + " without \"completed_at\"";
      return false;
    }
    record.completed_at = completed->asInt64();

    if (!activationsFromJson(entry.find("activations"), record.activations,
                             "workout " + record.id, error)) {
      error = "history: " + error;
      return false;
    }
    workouts.push_back(std::move(record));
  }
  return true;
}

}  // namespace liftpack
