// Exercise catalog entity: muscle activations, eligibility and default timing.

#ifndef LIFTPACK_CATALOG_EXERCISE_H
#define LIFTPACK_CATALOG_EXERCISE_H

#include <map>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace liftpack {

/// Activation percentage at or above which a muscle counts as primary.
constexpr double kPrimaryActivationThreshold = 60.0;

/// Activation percentage above which an excluded muscle disqualifies an exercise.
constexpr double kExcludedMuscleActivationLimit = 40.0;

/// @brief Muscle id to activation percentage (0-100). Ordered by muscle id.
using ActivationMap = std::map<std::string, double>;

/// @brief Muscle id to display name.
using MuscleNameMap = std::map<std::string, std::string>;

/// @brief A catalog exercise. Immutable for the duration of a solve.
struct Exercise {
  std::string id;
  std::string name;
  int difficulty = 1;  ///< Tier 1-5.
  MovementPattern movement_pattern = MovementPattern::Isolation;
  bool is_compound = false;
  std::vector<Location> locations;
  std::vector<std::string> equipment_required;
  std::vector<std::string> equipment_optional;
  Seconds rest_seconds = 60;
  ActivationMap activations;
  std::vector<std::string> primary_muscles;  ///< Derived; see finalizePrimaryMuscles().
  bool is_timed = false;  ///< Reps are rendered as a hold duration.
  std::string description;

  /// @brief True if the exercise may be performed at the given location.
  bool allowsLocation(Location location) const;

  /// @brief True if any equipment tag is required.
  bool requiresEquipment() const { return !equipment_required.empty(); }

  /// @brief Activation percentage for a muscle (0 if absent).
  double activationOf(const std::string& muscle_id) const;

  /// @brief True if the muscle is in the primary list.
  bool isPrimary(const std::string& muscle_id) const;

  /// @brief True if the muscle is primary or activated at the primary threshold.
  ///
  /// This is the condition the coverage tracker uses to record a muscle as
  /// primary.
  bool countsAsPrimary(const std::string& muscle_id) const;

  /// @brief Muscles with positive activation that are not primary, in id order.
  std::vector<std::string> secondaryMuscles() const;

  /// @brief True if the two exercises share at least one primary muscle.
  bool sharesPrimaryMuscleWith(const Exercise& other) const;

  /// @brief Merge explicitly flagged primaries with threshold-derived ones.
  ///
  /// @param flagged Muscles explicitly marked primary by the catalog
  ///        (may be empty). Flagged muscles keep their order, then every
  ///        muscle at or above kPrimaryActivationThreshold is appended in id
  ///        order. Duplicates are skipped.
  void finalizePrimaryMuscles(const std::vector<std::string>& flagged);
};

}  // namespace liftpack

#endif  // LIFTPACK_CATALOG_EXERCISE_H
