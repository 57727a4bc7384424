/// @file
/// @brief Catalog TTL cache.

#include "catalog/catalog_cache.h"

namespace liftpack {

CatalogCache::CatalogCache(IExerciseDataSource& source, std::chrono::milliseconds ttl)
    : CatalogCache(source, ttl, [] { return std::chrono::steady_clock::now(); }) {}

CatalogCache::CatalogCache(IExerciseDataSource& source, std::chrono::milliseconds ttl,
                           Clock clock)
    : source_(source), ttl_(ttl), clock_(std::move(clock)) {}

bool CatalogCache::isFreshLocked(std::chrono::steady_clock::time_point now) const {
  return snapshot_ && (now - snapshot_->loaded_at) < ttl_;
}

bool CatalogCache::get(std::shared_ptr<const CatalogSnapshot>& out, std::string& error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isFreshLocked(clock_())) {
      out = snapshot_;
      return true;
    }
  }

  // Miss: load without holding the lock. Duplicate loads are tolerated.
  auto fresh = std::make_shared<CatalogSnapshot>();
  if (!source_.getAllExercises(fresh->exercises, error)) return false;
  if (!source_.getMuscleNames(fresh->muscle_names, error)) return false;
  fresh->loaded_at = clock_();

  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_ = fresh;
  ++reload_count_;
  out = snapshot_;
  return true;
}

void CatalogCache::invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_.reset();
}

bool CatalogCache::isFresh() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return isFreshLocked(clock_());
}

uint32_t CatalogCache::reloadCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reload_count_;
}

}  // namespace liftpack
