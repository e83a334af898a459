#pragma once

#include <raster_ql/types/layout.h>
#include <arrow/result.h>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <string>
#include <variant>

namespace raster_ql {

namespace bg = boost::geometry;

using Point = bg::model::d2::point_xy<double>;
using LineString = bg::model::linestring<Point>;
using Polygon = bg::model::polygon<Point>;
using MultiPoint = bg::model::multi_point<Point>;
using MultiLineString = bg::model::multi_linestring<LineString>;
using MultiPolygon = bg::model::multi_polygon<Polygon>;

// Filter geometry in layer coordinates
using Geometry = std::variant<Point, MultiPoint, LineString, MultiLineString,
                              Polygon, MultiPolygon>;

const char* GeometryTypeName(const Geometry& geometry);

// Bounding envelope; an empty geometry yields an inverted (empty) extent and a
// geometry with a non-finite coordinate an all-NaN extent
Extent Envelope(const Geometry& geometry);

/**
 * @brief Parse a WKT string into a Geometry
 * @param wkt e.g. "POINT(0.5 0.5)" or "POLYGON((0 0,0 1,1 1,1 0,0 0))"
 * @return Geometry, or Invalid for unsupported types and malformed text
 */
arrow::Result<Geometry> GeometryFromWkt(const std::string& wkt);

std::string GeometryToWkt(const Geometry& geometry);

} // namespace raster_ql
