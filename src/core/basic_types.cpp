// Implementation of enum-to-string and string-to-enum conversions.

#include "core/basic_types.h"

namespace liftpack {

const char* movementPatternToString(MovementPattern pattern) {
  switch (pattern) {
    case MovementPattern::Push:      return "push";
    case MovementPattern::Pull:      return "pull";
    case MovementPattern::Squat:     return "squat";
    case MovementPattern::Hinge:     return "hinge";
    case MovementPattern::Carry:     return "carry";
    case MovementPattern::Core:      return "core";
    case MovementPattern::Isolation: return "isolation";
  }
  return "unknown";
}

std::optional<MovementPattern> movementPatternFromString(const std::string& str) {
  if (str == "push")      return MovementPattern::Push;
  if (str == "pull")      return MovementPattern::Pull;
  if (str == "squat")     return MovementPattern::Squat;
  if (str == "hinge")     return MovementPattern::Hinge;
  if (str == "carry")     return MovementPattern::Carry;
  if (str == "core")      return MovementPattern::Core;
  if (str == "isolation") return MovementPattern::Isolation;
  return std::nullopt;
}

const char* locationToString(Location location) {
  switch (location) {
    case Location::Gym:    return "gym";
    case Location::Home:   return "home";
    case Location::Park:   return "park";
    case Location::Hotel:  return "hotel";
    case Location::Office: return "office";
    case Location::Travel: return "travel";
  }
  return "unknown";
}

std::optional<Location> locationFromString(const std::string& str) {
  if (str == "gym")    return Location::Gym;
  if (str == "home")   return Location::Home;
  if (str == "park")   return Location::Park;
  if (str == "hotel")  return Location::Hotel;
  if (str == "office") return Location::Office;
  if (str == "travel") return Location::Travel;
  return std::nullopt;
}

const char* goalToString(Goal goal) {
  switch (goal) {
    case Goal::Strength:    return "strength";
    case Goal::Hypertrophy: return "hypertrophy";
    case Goal::Endurance:   return "endurance";
    case Goal::Mobility:    return "mobility";
    case Goal::FatLoss:     return "fat_loss";
  }
  return "unknown";
}

std::optional<Goal> goalFromString(const std::string& str) {
  if (str == "strength")    return Goal::Strength;
  if (str == "hypertrophy") return Goal::Hypertrophy;
  if (str == "endurance")   return Goal::Endurance;
  if (str == "mobility")    return Goal::Mobility;
  if (str == "fat_loss")    return Goal::FatLoss;
  return std::nullopt;
}

const char* fitnessLevelToString(FitnessLevel level) {
  switch (level) {
    case FitnessLevel::Beginner:     return "beginner";
    case FitnessLevel::Intermediate: return "intermediate";
    case FitnessLevel::Advanced:     return "advanced";
  }
  return "unknown";
}

std::optional<FitnessLevel> fitnessLevelFromString(const std::string& str) {
  if (str == "beginner")     return FitnessLevel::Beginner;
  if (str == "intermediate") return FitnessLevel::Intermediate;
  if (str == "advanced")     return FitnessLevel::Advanced;
  return std::nullopt;
}

DifficultyBand difficultyBandFor(FitnessLevel level) {
  switch (level) {
    case FitnessLevel::Beginner:     return {1, 2};
    case FitnessLevel::Intermediate: return {2, 3};
    case FitnessLevel::Advanced:     return {3, 5};
  }
  return {1, 5};
}

const char* activationLevelToString(ActivationLevel level) {
  switch (level) {
    case ActivationLevel::Secondary: return "secondary";
    case ActivationLevel::Primary:   return "primary";
  }
  return "unknown";
}

const char* backendKindToString(BackendKind kind) {
  switch (kind) {
    case BackendKind::Greedy:  return "greedy";
    case BackendKind::Indexed: return "indexed";
  }
  return "unknown";
}

std::optional<BackendKind> backendKindFromString(const std::string& str) {
  if (str == "greedy")  return BackendKind::Greedy;
  if (str == "indexed") return BackendKind::Indexed;
  return std::nullopt;
}

}  // namespace liftpack
