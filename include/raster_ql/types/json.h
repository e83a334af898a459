#pragma once

#include <raster_ql/types/layer.h>
#include <nlohmann/json.hpp>

namespace raster_ql {

// nlohmann::json conversions for the attribute documents of a catalog.
// Field names follow the GeoTrellis attribute layout (camelCase), so
// catalogs written by other tools can be read as-is.
//
// from_json throws on malformed input; the attribute stores translate
// exceptions into arrow::Status at their boundary.

void to_json(nlohmann::json& j, const LayerId& id);
void from_json(const nlohmann::json& j, LayerId& id);

void to_json(nlohmann::json& j, const LayerHeader& header);
void from_json(const nlohmann::json& j, LayerHeader& header);

void to_json(nlohmann::json& j, const SpatialKey& key);
void from_json(const nlohmann::json& j, SpatialKey& key);

void to_json(nlohmann::json& j, const SpaceTimeKey& key);
void from_json(const nlohmann::json& j, SpaceTimeKey& key);

void to_json(nlohmann::json& j, const Extent& extent);
void from_json(const nlohmann::json& j, Extent& extent);

void to_json(nlohmann::json& j, const TileLayout& layout);
void from_json(const nlohmann::json& j, TileLayout& layout);

void to_json(nlohmann::json& j, const LayoutDefinition& layout);
void from_json(const nlohmann::json& j, LayoutDefinition& layout);

void to_json(nlohmann::json& j, const CellType& cell_type);
void from_json(const nlohmann::json& j, CellType& cell_type);

template <typename K>
void to_json(nlohmann::json& j, const KeyBounds<K>& bounds) {
    j = nlohmann::json{{"minKey", bounds.min_key}, {"maxKey", bounds.max_key}};
}

template <typename K>
void from_json(const nlohmann::json& j, KeyBounds<K>& bounds) {
    j.at("minKey").get_to(bounds.min_key);
    j.at("maxKey").get_to(bounds.max_key);
}

template <typename K>
void to_json(nlohmann::json& j, const TileLayerMetadata<K>& metadata) {
    j = nlohmann::json{
        {"cellType", metadata.cell_type},
        {"layoutDefinition", metadata.layout},
        {"extent", metadata.extent},
        {"crs", metadata.crs},
        {"bounds", metadata.bounds}
    };
}

template <typename K>
void from_json(const nlohmann::json& j, TileLayerMetadata<K>& metadata) {
    j.at("cellType").get_to(metadata.cell_type);
    j.at("layoutDefinition").get_to(metadata.layout);
    j.at("extent").get_to(metadata.extent);
    metadata.crs = j.value("crs", std::string());
    j.at("bounds").get_to(metadata.bounds);
}

nlohmann::json LayerMetadataToJson(const LayerMetadata& metadata);

} // namespace raster_ql
