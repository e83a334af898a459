#include <raster_ql/relation/schema_builder.h>
#include <raster_ql/relation/metadata.h>
#include <raster_ql/types/tile.h>

namespace raster_ql {

const char* LayerColumnName(LayerColumn column) {
    switch (column) {
        case LayerColumn::kSpatialKey: return kSpatialKeyColumn;
        case LayerColumn::kTemporalKey: return kTemporalKeyColumn;
        case LayerColumn::kExtent: return kExtentColumn;
        case LayerColumn::kTile: return kTileColumn;
    }
    return "unknown";
}

std::vector<LayerColumn> LayerColumns(KeyVariant key_variant) {
    switch (key_variant) {
        case KeyVariant::kSpaceTime:
            return {LayerColumn::kSpatialKey, LayerColumn::kTemporalKey,
                    LayerColumn::kExtent, LayerColumn::kTile};
        case KeyVariant::kSpatial:
            break;
    }
    return {LayerColumn::kSpatialKey, LayerColumn::kExtent, LayerColumn::kTile};
}

std::shared_ptr<arrow::DataType> spatial_key_type() {
    static const auto type = arrow::struct_({
        arrow::field("col", arrow::int32(), false),
        arrow::field("row", arrow::int32(), false)
    });
    return type;
}

std::shared_ptr<arrow::DataType> temporal_key_type() {
    static const auto type = arrow::struct_({
        arrow::field("instant", arrow::int64(), false)
    });
    return type;
}

std::shared_ptr<arrow::DataType> extent_type() {
    static const auto type = arrow::struct_({
        arrow::field("xmin", arrow::float64(), false),
        arrow::field("ymin", arrow::float64(), false),
        arrow::field("xmax", arrow::float64(), false),
        arrow::field("ymax", arrow::float64(), false)
    });
    return type;
}

arrow::Result<std::shared_ptr<arrow::Schema>> BuildLayerSchema(
    KeyVariant key_variant,
    ValueVariant value_variant,
    const std::string& context) {

    std::shared_ptr<arrow::DataType> value_type;
    switch (value_variant) {
        case ValueVariant::kTile:
            value_type = tile_type();
            break;
    }
    if (!value_type) {
        return arrow::Status::Invalid("No column type for value variant");
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    for (LayerColumn column : LayerColumns(key_variant)) {
        switch (column) {
            case LayerColumn::kSpatialKey: {
                auto field = arrow::field(kSpatialKeyColumn, spatial_key_type(), false);
                ARROW_ASSIGN_OR_RAISE(field, metadata::AttachRole(field, metadata::ROLE_SPATIAL_KEY));
                if (!context.empty()) {
                    ARROW_ASSIGN_OR_RAISE(field, metadata::AttachContext(field, context));
                }
                fields.push_back(field);
                break;
            }
            case LayerColumn::kTemporalKey: {
                auto field = arrow::field(kTemporalKeyColumn, temporal_key_type(), false);
                ARROW_ASSIGN_OR_RAISE(field, metadata::AttachRole(field, metadata::ROLE_TEMPORAL_KEY));
                fields.push_back(field);
                break;
            }
            case LayerColumn::kExtent:
                fields.push_back(arrow::field(kExtentColumn, extent_type(), false));
                break;
            case LayerColumn::kTile:
                fields.push_back(arrow::field(kTileColumn, value_type, true));
                break;
        }
    }
    return arrow::schema(fields);
}

} // namespace raster_ql
