// Basic types for workout prescription: enums shared across catalog, recovery
// and solver modules, plus their string conversions.

#ifndef LIFTPACK_CORE_BASIC_TYPES_H
#define LIFTPACK_CORE_BASIC_TYPES_H

#include <cstdint>
#include <optional>
#include <string>

namespace liftpack {

/// Wall-clock duration in whole seconds.
using Seconds = int32_t;

/// Unix timestamp in seconds.
using Timestamp = int64_t;

constexpr Seconds kSecondsPerMinute = 60;
constexpr Seconds kSecondsPerHour = 60 * 60;

// ---------------------------------------------------------------------------
// Enums: Exercise classification
// ---------------------------------------------------------------------------

/// Movement pattern used for goal alignment and balance diagnostics.
enum class MovementPattern : uint8_t {
  Push,
  Pull,
  Squat,
  Hinge,
  Carry,
  Core,
  Isolation
};

constexpr int kMovementPatternCount = 7;

/// @brief Convert MovementPattern to its catalog string (e.g. "push").
const char* movementPatternToString(MovementPattern pattern);

/// @brief Parse MovementPattern from a catalog string.
/// @return nullopt on unrecognized input.
std::optional<MovementPattern> movementPatternFromString(const std::string& str);

/// Training location. Gym is treated as a full-equipment context.
enum class Location : uint8_t {
  Gym,
  Home,
  Park,
  Hotel,
  Office,
  Travel
};

constexpr int kLocationCount = 6;

/// @brief Convert Location to string (e.g. "gym").
const char* locationToString(Location location);

/// @brief Parse Location from string.
/// @return nullopt on unrecognized input.
std::optional<Location> locationFromString(const std::string& str);

// ---------------------------------------------------------------------------
// Enums: Request parameters
// ---------------------------------------------------------------------------

/// Training goal. Ordering in a request matters: the first goal drives
/// sets/reps and rest.
enum class Goal : uint8_t {
  Strength,
  Hypertrophy,
  Endurance,
  Mobility,
  FatLoss
};

constexpr int kGoalCount = 5;

/// @brief Convert Goal to string (e.g. "fat_loss").
const char* goalToString(Goal goal);

/// @brief Parse Goal from string.
/// @return nullopt on unrecognized input.
std::optional<Goal> goalFromString(const std::string& str);

/// Self-reported fitness level.
enum class FitnessLevel : uint8_t {
  Beginner,
  Intermediate,
  Advanced
};

/// @brief Convert FitnessLevel to string.
const char* fitnessLevelToString(FitnessLevel level);

/// @brief Parse FitnessLevel from string.
/// @return nullopt on unrecognized input.
std::optional<FitnessLevel> fitnessLevelFromString(const std::string& str);

/// @brief Inclusive difficulty band appropriate for a fitness level.
struct DifficultyBand {
  int min = 1;
  int max = 5;
};

/// @brief Get the difficulty band for a fitness level.
///
/// Beginner [1,2], Intermediate [2,3], Advanced [3,5].
DifficultyBand difficultyBandFor(FitnessLevel level);

// ---------------------------------------------------------------------------
// Enums: Coverage
// ---------------------------------------------------------------------------

/// Activation level recorded in the coverage map. Only Secondary -> Primary
/// transitions are allowed.
enum class ActivationLevel : uint8_t {
  Secondary,
  Primary
};

/// @brief Convert ActivationLevel to string.
const char* activationLevelToString(ActivationLevel level);

/// Solver backend selection.
enum class BackendKind : uint8_t {
  Greedy,   ///< Reference greedy packer.
  Indexed   ///< Bitmask-indexed packer producing identical output.
};

/// @brief Convert BackendKind to string.
const char* backendKindToString(BackendKind kind);

/// @brief Parse BackendKind from string ("greedy", "indexed").
/// @return nullopt on unrecognized input.
std::optional<BackendKind> backendKindFromString(const std::string& str);

}  // namespace liftpack

#endif  // LIFTPACK_CORE_BASIC_TYPES_H
