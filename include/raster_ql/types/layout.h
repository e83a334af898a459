#pragma once

#include <raster_ql/types/keys.h>
#include <cmath>
#include <cstdint>
#include <string>

namespace raster_ql {

// Axis-aligned bounding box in layer coordinates
struct Extent {
    double xmin = 0.0;
    double ymin = 0.0;
    double xmax = 0.0;
    double ymax = 0.0;

    double Width() const { return xmax - xmin; }
    double Height() const { return ymax - ymin; }

    bool IsFinite() const {
        return std::isfinite(xmin) && std::isfinite(ymin) &&
               std::isfinite(xmax) && std::isfinite(ymax);
    }

    // Boundaries count as intersecting
    bool Intersects(const Extent& other) const {
        return xmin <= other.xmax && other.xmin <= xmax &&
               ymin <= other.ymax && other.ymin <= ymax;
    }

    bool Contains(double x, double y) const {
        return x >= xmin && x <= xmax && y >= ymin && y <= ymax;
    }

    bool operator==(const Extent& other) const = default;
    std::string ToString() const;
};

struct TileLayout {
    int32_t layout_cols = 1;
    int32_t layout_rows = 1;
    int32_t tile_cols = 256;
    int32_t tile_rows = 256;

    bool operator==(const TileLayout& other) const = default;
};

/**
 * @brief Maps between grid keys and layer coordinates
 *
 * The layout extent is divided into layout_cols x layout_rows equally sized
 * cells. Column indices grow with x, row indices grow downwards from ymax.
 * A cell includes its min edges and excludes its max edges, so a coordinate
 * on a shared edge belongs to the right/lower neighbour.
 */
class MapKeyTransform {
public:
    MapKeyTransform(const Extent& extent, int32_t layout_cols, int32_t layout_rows);

    Extent KeyToExtent(const SpatialKey& key) const;
    Extent KeyToExtent(const SpaceTimeKey& key) const;
    Extent KeyToExtent(const LayerKey& key) const;

    // Non-finite coordinates map to INT32_MIN, outside every layout. So does
    // every point of a degenerate transform.
    SpatialKey PointToKey(double x, double y) const;

    // Every cell whose extent overlaps the given extent. A degenerate
    // (zero width or height) extent maps like a point on that axis; a
    // non-finite or inverted extent yields empty bounds.
    GridBounds ExtentToGridBounds(const Extent& extent) const;

    // Zero-sized cells or a non-finite layout extent; no point maps into the grid
    bool IsDegenerate() const;

    double tile_width() const { return tile_width_; }
    double tile_height() const { return tile_height_; }
    const Extent& extent() const { return extent_; }

private:
    Extent extent_;
    int32_t layout_cols_;
    int32_t layout_rows_;
    double tile_width_;
    double tile_height_;
};

struct LayoutDefinition {
    Extent extent;
    TileLayout tile_layout;

    MapKeyTransform MapTransform() const {
        return MapKeyTransform(extent, tile_layout.layout_cols, tile_layout.layout_rows);
    }

    bool operator==(const LayoutDefinition& other) const = default;
};

} // namespace raster_ql
