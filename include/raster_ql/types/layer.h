#pragma once

#include <raster_ql/types/keys.h>
#include <raster_ql/types/layout.h>
#include <raster_ql/types/tile.h>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace raster_ql {

// Name and zoom level of a layer in a catalog
struct LayerId {
    std::string name;
    int32_t zoom = 0;

    bool operator==(const LayerId& other) const = default;
    std::string ToString() const;

    template <typename H>
    friend H AbslHashValue(H h, const LayerId& id) {
        return H::combine(std::move(h), id.name, id.zoom);
    }
};

// Declared representation of a layer, read once from the attribute store
struct LayerHeader {
    std::string key_class;
    std::string value_class;
    std::string format;

    bool operator==(const LayerHeader& other) const = default;
};

enum class KeyVariant {
    kSpatial,
    kSpaceTime,
};

enum class ValueVariant {
    kTile,
};

const char* KeyVariantName(KeyVariant variant);
const char* ValueVariantName(ValueVariant variant);

template <typename K>
struct TileLayerMetadata {
    CellType cell_type = CellType::kFloat64;
    LayoutDefinition layout;
    Extent extent;
    std::string crs;
    KeyBounds<K> bounds;

    MapKeyTransform MapTransform() const { return layout.MapTransform(); }

    bool operator==(const TileLayerMetadata& other) const = default;
};

using SpatialLayerMetadata = TileLayerMetadata<SpatialKey>;
using SpaceTimeLayerMetadata = TileLayerMetadata<SpaceTimeKey>;

// Layout metadata of a layer, shaped by its key variant
using LayerMetadata = std::variant<SpatialLayerMetadata, SpaceTimeLayerMetadata>;

KeyVariant GetKeyVariant(const LayerMetadata& metadata);
const LayoutDefinition& GetLayout(const LayerMetadata& metadata);
MapKeyTransform GetMapTransform(const LayerMetadata& metadata);

} // namespace raster_ql
