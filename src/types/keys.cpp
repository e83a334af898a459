#include <raster_ql/types/keys.h>
#include <algorithm>
#include <sstream>

namespace raster_ql {

std::string SpatialKey::ToString() const {
    std::ostringstream oss;
    oss << "SpatialKey(" << col << ", " << row << ")";
    return oss.str();
}

std::string TemporalKey::ToString() const {
    std::ostringstream oss;
    oss << "TemporalKey(" << instant << ")";
    return oss.str();
}

std::string SpaceTimeKey::ToString() const {
    std::ostringstream oss;
    oss << "SpaceTimeKey(" << col << ", " << row << ", " << instant << ")";
    return oss.str();
}

SpatialKey SpatialComponent(const LayerKey& key) {
    if (const auto* stk = std::get_if<SpaceTimeKey>(&key)) {
        return stk->SpatialComponent();
    }
    return std::get<SpatialKey>(key);
}

std::optional<TemporalKey> TemporalComponent(const LayerKey& key) {
    if (const auto* stk = std::get_if<SpaceTimeKey>(&key)) {
        return stk->TemporalComponent();
    }
    return std::nullopt;
}

std::string KeyToString(const LayerKey& key) {
    return std::visit([](const auto& k) { return k.ToString(); }, key);
}

GridBounds GridBounds::Intersect(const GridBounds& other) const {
    return GridBounds{
        std::max(col_min, other.col_min),
        std::max(row_min, other.row_min),
        std::min(col_max, other.col_max),
        std::min(row_max, other.row_max)
    };
}

int64_t GridBounds::Size() const {
    if (IsEmpty()) {
        return 0;
    }
    return (static_cast<int64_t>(col_max) - col_min + 1) *
           (static_cast<int64_t>(row_max) - row_min + 1);
}

std::string GridBounds::ToString() const {
    std::ostringstream oss;
    oss << "GridBounds(cols " << col_min << ".." << col_max
        << ", rows " << row_min << ".." << row_max << ")";
    return oss.str();
}

} // namespace raster_ql
