#include <raster_ql/storage/layer_query.h>
#include <raster_ql/storage/layer_reader.h>
#include <cmath>
#include <sstream>

namespace raster_ql {

std::string ConstraintToString(const QueryConstraint& constraint) {
    std::ostringstream oss;
    if (const auto* contains = std::get_if<ContainsPoint>(&constraint)) {
        oss << "Contains(Point(" << contains->x << ", " << contains->y << "))";
    } else {
        oss << "Intersects(" << std::get<IntersectsExtent>(constraint).extent.ToString() << ")";
    }
    return oss.str();
}

GridBounds ConstraintToGridBounds(const QueryConstraint& constraint,
                                  const MapKeyTransform& transform) {
    if (const auto* contains = std::get_if<ContainsPoint>(&constraint)) {
        if (transform.IsDegenerate() ||
            !std::isfinite(contains->x) || !std::isfinite(contains->y)) {
            return GridBounds{};
        }
        SpatialKey key = transform.PointToKey(contains->x, contains->y);
        return GridBounds{key.col, key.row, key.col, key.row};
    }
    return transform.ExtentToGridBounds(std::get<IntersectsExtent>(constraint).extent);
}

LayerQuery::LayerQuery(std::shared_ptr<const LayerReader> reader,
                       LayerId layer_id,
                       KeyVariant key_variant,
                       ValueVariant value_variant)
    : reader_(std::move(reader)),
      layer_id_(std::move(layer_id)),
      key_variant_(key_variant),
      value_variant_(value_variant) {}

LayerQuery LayerQuery::Where(QueryConstraint constraint) const {
    LayerQuery narrowed = *this;
    narrowed.constraints_.push_back(std::move(constraint));
    return narrowed;
}

std::optional<GridBounds> LayerQuery::ToGridBounds(const MapKeyTransform& transform) const {
    std::optional<GridBounds> bounds;
    for (const auto& constraint : constraints_) {
        GridBounds next = ConstraintToGridBounds(constraint, transform);
        bounds = bounds.has_value() ? bounds->Intersect(next) : next;
    }
    return bounds;
}

arrow::Result<std::unique_ptr<TileRecordIterator>> LayerQuery::Execute() const {
    if (!reader_) {
        return arrow::Status::Invalid("LayerQuery has no reader");
    }
    return reader_->Read(*this);
}

std::string LayerQuery::ToString() const {
    std::ostringstream oss;
    oss << "LayerQuery(" << layer_id_.ToString() << ", "
        << KeyVariantName(key_variant_) << ", " << ValueVariantName(value_variant_);
    for (const auto& constraint : constraints_) {
        oss << ", " << ConstraintToString(constraint);
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// LayerReader
// ============================================================================

LayerQuery LayerReader::Query(const LayerId& id, KeyVariant key_variant,
                              ValueVariant value_variant) const {
    return LayerQuery(shared_from_this(), id, key_variant, value_variant);
}

bool KeyInBounds(const LayerKey& key, const std::optional<GridBounds>& bounds) {
    return !bounds.has_value() || bounds->Contains(SpatialComponent(key));
}

} // namespace raster_ql
