// Read-through TTL cache over the exercise catalog.

#ifndef LIFTPACK_CATALOG_CATALOG_CACHE_H
#define LIFTPACK_CATALOG_CATALOG_CACHE_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "catalog/data_source.h"
#include "catalog/exercise.h"

namespace liftpack {

/// @brief Immutable catalog snapshot shared by all readers.
struct CatalogSnapshot {
  std::vector<Exercise> exercises;
  MuscleNameMap muscle_names;
  std::chrono::steady_clock::time_point loaded_at;
};

/// @brief Catalog cache with a fixed time-to-live and manual invalidation.
///
/// get() serves the current snapshot while it is younger than the TTL and
/// reloads from the data source otherwise. Reloads run outside the lock, so
/// concurrent callers that all miss may each reload; the last one to finish
/// wins. Readers keep their snapshot alive through the shared_ptr even if it
/// is replaced. Failed loads are never cached.
class CatalogCache {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  static constexpr std::chrono::seconds kDefaultTtl{5 * 60};

  /// @brief Construct over a data source using the steady clock.
  /// @param source Data source; must outlive the cache.
  explicit CatalogCache(IExerciseDataSource& source,
                        std::chrono::milliseconds ttl = kDefaultTtl);

  /// @brief Construct with an injected clock (for deterministic staleness).
  CatalogCache(IExerciseDataSource& source, std::chrono::milliseconds ttl, Clock clock);

  CatalogCache(const CatalogCache&) = delete;
  CatalogCache& operator=(const CatalogCache&) = delete;

  /// @brief Get the current snapshot, reloading if absent or expired.
  /// @param[out] out Snapshot on success.
  /// @param[out] error Data source error, forwarded unmodified.
  /// @return False if a reload was needed and failed.
  bool get(std::shared_ptr<const CatalogSnapshot>& out, std::string& error);

  /// @brief Drop the current snapshot so the next get() reloads.
  void invalidate();

  /// @brief True if a snapshot is held and still within the TTL.
  bool isFresh() const;

  /// @brief Number of successful reloads since construction.
  uint32_t reloadCount() const;

  std::chrono::milliseconds ttl() const { return ttl_; }

 private:
  bool isFreshLocked(std::chrono::steady_clock::time_point now) const;

  IExerciseDataSource& source_;
  std::chrono::milliseconds ttl_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::shared_ptr<const CatalogSnapshot> snapshot_;
  uint32_t reload_count_ = 0;
};

}  // namespace liftpack

#endif  // LIFTPACK_CATALOG_CATALOG_CACHE_H
