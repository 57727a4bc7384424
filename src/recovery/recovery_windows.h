// Recovery windows: which muscles were stimulated in the last 24h and 24-48h.

#ifndef LIFTPACK_RECOVERY_RECOVERY_WINDOWS_H
#define LIFTPACK_RECOVERY_RECOVERY_WINDOWS_H

#include <set>
#include <string>
#include <vector>

#include "catalog/exercise.h"
#include "core/basic_types.h"

namespace liftpack {

/// Upper bound (exclusive) of the most recent recovery bucket.
constexpr Seconds kRecoveryWindow24h = 24 * kSecondsPerHour;

/// Upper bound (exclusive) of the older recovery bucket.
constexpr Seconds kRecoveryWindow48h = 48 * kSecondsPerHour;

/// @brief Two disjoint muscle-id sets derived once per solve.
///
/// A muscle in last_24h is never also in last_48h; last_48h means
/// "stimulated between 24h and 48h ago".
struct RecoveryWindows {
  std::set<std::string> last_24h;
  std::set<std::string> last_48h;

  bool empty() const { return last_24h.empty() && last_48h.empty(); }

  bool inLast24h(const std::string& muscle_id) const {
    return last_24h.count(muscle_id) > 0;
  }

  bool inLast48h(const std::string& muscle_id) const {
    return last_48h.count(muscle_id) > 0;
  }

  /// @brief True if the muscle is in either window.
  bool isRecovering(const std::string& muscle_id) const {
    return inLast24h(muscle_id) || inLast48h(muscle_id);
  }
};

/// @brief A completed workout as recorded by the history store.
struct WorkoutRecord {
  std::string id;
  Timestamp completed_at = 0;  ///< Unix seconds.
  ActivationMap activations;   ///< Per-muscle activation recorded for the workout.
};

/// @brief Bucket the muscles of the requested workouts by age.
///
/// Workouts whose id is not in @p workout_ids are ignored, as are workouts
/// 48h or older, workouts timestamped in the future, and muscles with zero
/// activation. A muscle seen in both buckets is kept in last_24h only.
///
/// @param records Known workout history.
/// @param workout_ids Workouts to consider (empty yields empty windows).
/// @param now Current time in Unix seconds.
/// @return Disjoint recovery windows.
RecoveryWindows resolveRecoveryWindows(const std::vector<WorkoutRecord>& records,
                                       const std::vector<std::string>& workout_ids,
                                       Timestamp now);

}  // namespace liftpack

#endif  // LIFTPACK_RECOVERY_RECOVERY_WINDOWS_H
