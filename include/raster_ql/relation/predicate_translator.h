#pragma once

#include <raster_ql/relation/filter_predicate.h>
#include <raster_ql/storage/layer_query.h>
#include <optional>
#include <vector>

namespace raster_ql {

/**
 * @brief Translate a filter predicate into a native query constraint
 *
 * Rules, in order:
 *   1. extent intersects Point    -> ContainsPoint(point)
 *   2. extent intersects geometry -> IntersectsExtent(envelope of geometry)
 *   3. anything else              -> nullopt
 *
 * nullopt means the predicate has no effect on the scan: it is neither an
 * error nor a constraint, and the engine keeps evaluating it on its side.
 */
std::optional<QueryConstraint> TranslatePredicate(const FilterPredicate& predicate);

// True when TranslatePredicate produces a constraint
bool IsRecognizedPredicate(const FilterPredicate& predicate);

// Query narrowed by the predicate, or the query unchanged
LayerQuery ApplyFilter(const LayerQuery& query, const FilterPredicate& predicate);

// Folds the filters left to right; each recognized filter narrows the query
LayerQuery ApplyFilters(const LayerQuery& query, const std::vector<FilterPredicate>& filters);

} // namespace raster_ql
