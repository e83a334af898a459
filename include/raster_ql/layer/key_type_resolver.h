#pragma once

#include <raster_ql/types/layer.h>
#include <arrow/result.h>
#include <string>

namespace raster_ql {

// Canonical class names written into headers by the catalogs
inline constexpr const char* kSpatialKeyClass = "geotrellis.spark.SpatialKey";
inline constexpr const char* kSpaceTimeKeyClass = "geotrellis.spark.SpaceTimeKey";
inline constexpr const char* kTileClass = "geotrellis.raster.Tile";

struct ResolvedLayerType {
    KeyVariant key_variant = KeyVariant::kSpatial;
    ValueVariant value_variant = ValueVariant::kTile;

    bool operator==(const ResolvedLayerType& other) const = default;
};

/**
 * @brief Resolve a declared key class name to a key variant
 *
 * Matching uses the simple class name (text after the last '.'), so
 * "SpaceTimeKey" and "geotrellis.spark.SpaceTimeKey" are equivalent.
 *
 * @return kSpaceTime, kSpatial, or an UnsupportedKeyType error
 */
arrow::Result<KeyVariant> ResolveKeyVariant(const std::string& key_class);

// kTile or an UnsupportedValueType error
arrow::Result<ValueVariant> ResolveValueVariant(const std::string& value_class);

// Key type is checked before the value type
arrow::Result<ResolvedLayerType> ResolveLayerType(const LayerHeader& header);

// Header a catalog writes for a layer of the given variant
LayerHeader MakeLayerHeader(KeyVariant key_variant, const std::string& format);

} // namespace raster_ql
