#include <raster_ql/types/json.h>
#include <stdexcept>

namespace raster_ql {

void to_json(nlohmann::json& j, const LayerId& id) {
    j = nlohmann::json{{"name", id.name}, {"zoom", id.zoom}};
}

void from_json(const nlohmann::json& j, LayerId& id) {
    j.at("name").get_to(id.name);
    j.at("zoom").get_to(id.zoom);
}

void to_json(nlohmann::json& j, const LayerHeader& header) {
    j = nlohmann::json{
        {"keyClass", header.key_class},
        {"valueClass", header.value_class},
        {"format", header.format}
    };
}

void from_json(const nlohmann::json& j, LayerHeader& header) {
    j.at("keyClass").get_to(header.key_class);
    j.at("valueClass").get_to(header.value_class);
    header.format = j.value("format", std::string());
}

void to_json(nlohmann::json& j, const SpatialKey& key) {
    j = nlohmann::json{{"col", key.col}, {"row", key.row}};
}

void from_json(const nlohmann::json& j, SpatialKey& key) {
    j.at("col").get_to(key.col);
    j.at("row").get_to(key.row);
}

void to_json(nlohmann::json& j, const SpaceTimeKey& key) {
    j = nlohmann::json{{"col", key.col}, {"row", key.row}, {"instant", key.instant}};
}

void from_json(const nlohmann::json& j, SpaceTimeKey& key) {
    j.at("col").get_to(key.col);
    j.at("row").get_to(key.row);
    j.at("instant").get_to(key.instant);
}

void to_json(nlohmann::json& j, const Extent& extent) {
    j = nlohmann::json{
        {"xmin", extent.xmin}, {"ymin", extent.ymin},
        {"xmax", extent.xmax}, {"ymax", extent.ymax}
    };
}

void from_json(const nlohmann::json& j, Extent& extent) {
    j.at("xmin").get_to(extent.xmin);
    j.at("ymin").get_to(extent.ymin);
    j.at("xmax").get_to(extent.xmax);
    j.at("ymax").get_to(extent.ymax);
}

void to_json(nlohmann::json& j, const TileLayout& layout) {
    j = nlohmann::json{
        {"layoutCols", layout.layout_cols}, {"layoutRows", layout.layout_rows},
        {"tileCols", layout.tile_cols}, {"tileRows", layout.tile_rows}
    };
}

void from_json(const nlohmann::json& j, TileLayout& layout) {
    j.at("layoutCols").get_to(layout.layout_cols);
    j.at("layoutRows").get_to(layout.layout_rows);
    j.at("tileCols").get_to(layout.tile_cols);
    j.at("tileRows").get_to(layout.tile_rows);
}

void to_json(nlohmann::json& j, const LayoutDefinition& layout) {
    j = nlohmann::json{{"extent", layout.extent}, {"tileLayout", layout.tile_layout}};
}

void from_json(const nlohmann::json& j, LayoutDefinition& layout) {
    j.at("extent").get_to(layout.extent);
    j.at("tileLayout").get_to(layout.tile_layout);
    if (layout.tile_layout.layout_cols <= 0 || layout.tile_layout.layout_rows <= 0) {
        throw std::invalid_argument("tileLayout must have positive layoutCols and layoutRows");
    }
    if (!layout.extent.IsFinite() || !(layout.extent.Width() > 0) || !(layout.extent.Height() > 0)) {
        throw std::invalid_argument("layoutDefinition extent must be finite with positive width and height");
    }
}

void to_json(nlohmann::json& j, const CellType& cell_type) {
    j = CellTypeName(cell_type);
}

void from_json(const nlohmann::json& j, CellType& cell_type) {
    auto result = CellTypeFromName(j.get<std::string>());
    if (!result.ok()) {
        throw std::invalid_argument(result.status().message());
    }
    cell_type = *result;
}

nlohmann::json LayerMetadataToJson(const LayerMetadata& metadata) {
    return std::visit([](const auto& m) { return nlohmann::json(m); }, metadata);
}

} // namespace raster_ql
