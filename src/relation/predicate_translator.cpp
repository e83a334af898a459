#include <raster_ql/relation/predicate_translator.h>
#include <raster_ql/relation/schema_builder.h>
#include <raster_ql/util/logging.h>

namespace raster_ql {

std::optional<QueryConstraint> TranslatePredicate(const FilterPredicate& predicate) {
    if (predicate.column_name != kExtentColumn ||
        predicate.relation_name != kIntersectsRelation) {
        return std::nullopt;
    }

    if (const auto* point = std::get_if<Point>(&predicate.geometry)) {
        return QueryConstraint(ContainsPoint{point->x(), point->y()});
    }
    return QueryConstraint(IntersectsExtent{Envelope(predicate.geometry)});
}

bool IsRecognizedPredicate(const FilterPredicate& predicate) {
    return TranslatePredicate(predicate).has_value();
}

LayerQuery ApplyFilter(const LayerQuery& query, const FilterPredicate& predicate) {
    auto constraint = TranslatePredicate(predicate);
    if (!constraint) {
        RASTER_QL_LOG_FILTER("Ignoring " << predicate.ToString());
        return query;
    }
    RASTER_QL_LOG_FILTER(predicate.ToString() << " -> " << ConstraintToString(*constraint));
    return query.Where(*constraint);
}

LayerQuery ApplyFilters(const LayerQuery& query, const std::vector<FilterPredicate>& filters) {
    LayerQuery result = query;
    for (const auto& filter : filters) {
        result = ApplyFilter(result, filter);
    }
    return result;
}

} // namespace raster_ql
