#pragma once

#include <raster_ql/types/geometry.h>
#include <arrow/result.h>
#include <string>

namespace raster_ql {

inline constexpr const char* kIntersectsRelation = "intersects";

/**
 * @brief Abstract filter on a relation column
 *
 * Supplied by the query engine as (column, spatial relation, geometry).
 * Only ("extent", "intersects", geometry) has native support; see
 * predicate_translator.h for how other combinations are treated.
 */
struct FilterPredicate {
    std::string column_name;
    std::string relation_name;
    Geometry geometry;

    std::string ToString() const;
};

// ("extent", "intersects", geometry)
FilterPredicate ExtentIntersects(Geometry geometry);

// ("extent", "intersects", geometry parsed from WKT)
arrow::Result<FilterPredicate> ExtentIntersectsWkt(const std::string& wkt);

} // namespace raster_ql
