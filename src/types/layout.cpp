#include <raster_ql/types/layout.h>
#include <cmath>
#include <limits>
#include <sstream>

namespace raster_ql {

namespace {

// Tolerance for grid coordinates that land on a cell edge
constexpr double kGridEpsilon = 1e-9;

// NaN maps to the same out-of-grid index as -inf
int32_t ClampToInt32(double value) {
    if (std::isnan(value) || value <= static_cast<double>(std::numeric_limits<int32_t>::min())) {
        return std::numeric_limits<int32_t>::min();
    }
    if (value >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return std::numeric_limits<int32_t>::max();
    }
    return static_cast<int32_t>(value);
}

// Last cell index covering a max edge: an edge on a grid line belongs to
// the previous cell unless the interval is degenerate.
int32_t MaxCellIndex(double grid_coord, bool degenerate) {
    if (!std::isfinite(grid_coord)) {
        return ClampToInt32(grid_coord);
    }
    double rounded = std::round(grid_coord);
    if (!degenerate && std::abs(grid_coord - rounded) < kGridEpsilon) {
        return ClampToInt32(rounded - 1.0);
    }
    return ClampToInt32(std::floor(grid_coord));
}

} // namespace

std::string Extent::ToString() const {
    std::ostringstream oss;
    oss << "Extent(" << xmin << ", " << ymin << ", " << xmax << ", " << ymax << ")";
    return oss.str();
}

MapKeyTransform::MapKeyTransform(const Extent& extent, int32_t layout_cols, int32_t layout_rows)
    : extent_(extent),
      layout_cols_(layout_cols),
      layout_rows_(layout_rows),
      tile_width_(layout_cols > 0 ? extent.Width() / layout_cols : 0.0),
      tile_height_(layout_rows > 0 ? extent.Height() / layout_rows : 0.0) {}

bool MapKeyTransform::IsDegenerate() const {
    return !(tile_width_ > 0.0) || !(tile_height_ > 0.0) || !extent_.IsFinite();
}

Extent MapKeyTransform::KeyToExtent(const SpatialKey& key) const {
    double xmin = extent_.xmin + key.col * tile_width_;
    double ymax = extent_.ymax - key.row * tile_height_;
    return Extent{xmin, ymax - tile_height_, xmin + tile_width_, ymax};
}

Extent MapKeyTransform::KeyToExtent(const SpaceTimeKey& key) const {
    return KeyToExtent(key.SpatialComponent());
}

Extent MapKeyTransform::KeyToExtent(const LayerKey& key) const {
    return KeyToExtent(SpatialComponent(key));
}

SpatialKey MapKeyTransform::PointToKey(double x, double y) const {
    if (IsDegenerate() || !std::isfinite(x) || !std::isfinite(y)) {
        constexpr int32_t kOutside = std::numeric_limits<int32_t>::min();
        return SpatialKey{kOutside, kOutside};
    }
    double col = std::floor((x - extent_.xmin) / tile_width_ + kGridEpsilon);
    double row = std::floor((extent_.ymax - y) / tile_height_ + kGridEpsilon);
    return SpatialKey{ClampToInt32(col), ClampToInt32(row)};
}

GridBounds MapKeyTransform::ExtentToGridBounds(const Extent& extent) const {
    if (IsDegenerate() || !extent.IsFinite() ||
        extent.xmin > extent.xmax || extent.ymin > extent.ymax) {
        return GridBounds{};
    }

    SpatialKey upper_left = PointToKey(extent.xmin, extent.ymax);

    double col_max = (extent.xmax - extent_.xmin) / tile_width_;
    double row_max = (extent_.ymax - extent.ymin) / tile_height_;

    return GridBounds{
        upper_left.col,
        upper_left.row,
        MaxCellIndex(col_max, extent.xmax == extent.xmin),
        MaxCellIndex(row_max, extent.ymax == extent.ymin)
    };
}

} // namespace raster_ql
