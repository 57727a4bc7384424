// Substitution lookup for committed exercises.

#ifndef LIFTPACK_SOLVER_SUBSTITUTION_FINDER_H
#define LIFTPACK_SOLVER_SUBSTITUTION_FINDER_H

#include <vector>

#include "catalog/exercise.h"
#include "solver/prescription_types.h"

namespace liftpack {

constexpr int kDefaultSubstitutionLimit = 3;

/// @brief Find alternatives for an exercise.
///
/// Candidates differ in id, pass the location/equipment eligibility of the
/// hard filter, and share at least one primary muscle with @p exercise.
/// Returned in catalog order without further ranking.
///
/// @param exercise The committed exercise.
/// @param catalog Catalog to search.
/// @param request Request whose location/equipment apply.
/// @param limit Maximum number of results (<= 0 yields none).
/// @return Pointers into @p catalog; valid while the catalog is alive.
std::vector<const Exercise*> findSubstitutions(const Exercise& exercise,
                                               const std::vector<Exercise>& catalog,
                                               const PrescriptionRequest& request,
                                               int limit = kDefaultSubstitutionLimit);

}  // namespace liftpack

#endif  // LIFTPACK_SOLVER_SUBSTITUTION_FINDER_H
