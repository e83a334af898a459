#include <raster_ql/types/geometry.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>

namespace raster_ql {

namespace {

using Box = bg::model::box<Point>;

template <typename G>
arrow::Result<Geometry> ReadWkt(const std::string& wkt) {
    G geometry;
    try {
        bg::read_wkt(wkt, geometry);
    } catch (const bg::read_wkt_exception& e) {
        return arrow::Status::Invalid("Malformed WKT '", wkt, "': ", e.what());
    }
    return Geometry(std::move(geometry));
}

} // namespace

const char* GeometryTypeName(const Geometry& geometry) {
    switch (geometry.index()) {
        case 0: return "Point";
        case 1: return "MultiPoint";
        case 2: return "LineString";
        case 3: return "MultiLineString";
        case 4: return "Polygon";
        case 5: return "MultiPolygon";
    }
    return "Unknown";
}

Extent Envelope(const Geometry& geometry) {
    return std::visit([](const auto& g) {
        bool finite = true;
        bg::for_each_point(g, [&finite](const Point& p) {
            finite = finite && std::isfinite(p.x()) && std::isfinite(p.y());
        });
        if (!finite) {
            double nan = std::numeric_limits<double>::quiet_NaN();
            return Extent{nan, nan, nan, nan};
        }

        Box box;
        bg::assign_inverse(box);
        if (!bg::is_empty(g)) {
            bg::envelope(g, box);
        }
        return Extent{box.min_corner().x(), box.min_corner().y(),
                      box.max_corner().x(), box.max_corner().y()};
    }, geometry);
}

arrow::Result<Geometry> GeometryFromWkt(const std::string& wkt) {
    // Type keyword up to the first '(' or whitespace, case-insensitive
    auto begin = std::find_if_not(wkt.begin(), wkt.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if(begin, wkt.end(),
                            [](unsigned char c) { return c == '(' || std::isspace(c); });
    std::string keyword(begin, end);
    std::transform(keyword.begin(), keyword.end(), keyword.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (keyword == "POINT") return ReadWkt<Point>(wkt);
    if (keyword == "MULTIPOINT") return ReadWkt<MultiPoint>(wkt);
    if (keyword == "LINESTRING") return ReadWkt<LineString>(wkt);
    if (keyword == "MULTILINESTRING") return ReadWkt<MultiLineString>(wkt);
    if (keyword == "POLYGON") return ReadWkt<Polygon>(wkt);
    if (keyword == "MULTIPOLYGON") return ReadWkt<MultiPolygon>(wkt);

    return arrow::Status::Invalid("Unsupported WKT geometry type: '", keyword, "'");
}

std::string GeometryToWkt(const Geometry& geometry) {
    return std::visit([](const auto& g) {
        std::ostringstream oss;
        oss << bg::wkt(g);
        return oss.str();
    }, geometry);
}

} // namespace raster_ql
