#include <raster_ql/relation/filter_predicate.h>
#include <raster_ql/relation/schema_builder.h>

namespace raster_ql {

std::string FilterPredicate::ToString() const {
    return column_name + " " + relation_name + " " + GeometryToWkt(geometry);
}

FilterPredicate ExtentIntersects(Geometry geometry) {
    return FilterPredicate{kExtentColumn, kIntersectsRelation, std::move(geometry)};
}

arrow::Result<FilterPredicate> ExtentIntersectsWkt(const std::string& wkt) {
    ARROW_ASSIGN_OR_RAISE(auto geometry, GeometryFromWkt(wkt));
    return ExtentIntersects(std::move(geometry));
}

} // namespace raster_ql
