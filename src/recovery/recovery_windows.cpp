/// @file
/// @brief Recovery window bucketing.

#include "recovery/recovery_windows.h"

#include <algorithm>

namespace liftpack {

RecoveryWindows resolveRecoveryWindows(const std::vector<WorkoutRecord>& records,
                                       const std::vector<std::string>& workout_ids,
                                       Timestamp now) {
  RecoveryWindows windows;
  if (workout_ids.empty()) return windows;

  for (const auto& record : records) {
    if (std::find(workout_ids.begin(), workout_ids.end(), record.id) == workout_ids.end()) {
      continue;
    }
    Timestamp age = now - record.completed_at;
    if (age < 0 || age >= kRecoveryWindow48h) continue;

    std::set<std::string>& bucket =
        (age < kRecoveryWindow24h) ? windows.last_24h : windows.last_48h;
    for (const auto& [muscle_id, activation] : record.activations) {
      if (activation > 0.0) bucket.insert(muscle_id);
    }
  }

  // 24h wins over 24-48h.
  for (const auto& muscle_id : windows.last_24h) {
    windows.last_48h.erase(muscle_id);
  }
  return windows;
}

}  // namespace liftpack
