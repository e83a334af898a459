#pragma once

#include <raster_ql/types/layer.h>
#include <arrow/api.h>
#include <arrow/result.h>
#include <string>
#include <vector>

namespace raster_ql {

inline constexpr const char* kSpatialKeyColumn = "spatial_key";
inline constexpr const char* kTemporalKeyColumn = "temporal_key";
inline constexpr const char* kExtentColumn = "extent";
inline constexpr const char* kTileColumn = "tile";

enum class LayerColumn {
    kSpatialKey,
    kTemporalKey,
    kExtent,
    kTile,
};

const char* LayerColumnName(LayerColumn column);

// Columns of a layer in schema order
std::vector<LayerColumn> LayerColumns(KeyVariant key_variant);

// struct<col: int32, row: int32>
std::shared_ptr<arrow::DataType> spatial_key_type();

// struct<instant: int64>
std::shared_ptr<arrow::DataType> temporal_key_type();

// struct<xmin, ymin, xmax, ymax: float64>
std::shared_ptr<arrow::DataType> extent_type();

/**
 * @brief Output schema of a layer relation
 *
 *   kSpatial:   [spatial_key, extent, tile]
 *   kSpaceTime: [spatial_key, temporal_key, extent, tile]
 *
 * Key and extent columns are non-nullable, tile is nullable. Key columns are
 * tagged with their role; a non-empty context (the serialized layer metadata)
 * is attached to spatial_key.
 */
arrow::Result<std::shared_ptr<arrow::Schema>> BuildLayerSchema(
    KeyVariant key_variant,
    ValueVariant value_variant,
    const std::string& context = "");

} // namespace raster_ql
