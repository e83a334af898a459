#pragma once

#include <raster_ql/types/layer.h>
#include <arrow/result.h>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace raster_ql {

class LayerReader;
class TileRecordIterator;

// Keep only the tile whose extent contains the point
struct ContainsPoint {
    double x = 0.0;
    double y = 0.0;
};

// Keep tiles whose extent overlaps the extent
struct IntersectsExtent {
    Extent extent;
};

// Native constraint understood by layer readers
using QueryConstraint = std::variant<ContainsPoint, IntersectsExtent>;

std::string ConstraintToString(const QueryConstraint& constraint);

// Grid cells admitted by a single constraint
GridBounds ConstraintToGridBounds(const QueryConstraint& constraint,
                                  const MapKeyTransform& transform);

/**
 * @brief Key-range query against one layer
 *
 * Queries are values: Where() returns a new query with the constraint
 * appended and leaves this one untouched. Constraints are conjunctive, so
 * each one can only shrink the set of matching keys.
 *
 * Example:
 *   auto query = reader->Query(id, KeyVariant::kSpatial, ValueVariant::kTile)
 *                    .Where(ContainsPoint{0.5, 0.5});
 *   ARROW_ASSIGN_OR_RAISE(auto records, query.Execute());
 */
class LayerQuery {
public:
    LayerQuery(std::shared_ptr<const LayerReader> reader,
               LayerId layer_id,
               KeyVariant key_variant,
               ValueVariant value_variant);

    LayerQuery Where(QueryConstraint constraint) const;

    /**
     * @brief Grid cells admitted by all constraints
     * @return nullopt when the query is unconstrained
     */
    std::optional<GridBounds> ToGridBounds(const MapKeyTransform& transform) const;

    // Lazily iterates the matching (key, tile) records
    arrow::Result<std::unique_ptr<TileRecordIterator>> Execute() const;

    const LayerId& layer_id() const { return layer_id_; }
    KeyVariant key_variant() const { return key_variant_; }
    ValueVariant value_variant() const { return value_variant_; }
    const std::vector<QueryConstraint>& constraints() const { return constraints_; }

    std::string ToString() const;

private:
    std::shared_ptr<const LayerReader> reader_;
    LayerId layer_id_;
    KeyVariant key_variant_;
    ValueVariant value_variant_;
    std::vector<QueryConstraint> constraints_;
};

} // namespace raster_ql
