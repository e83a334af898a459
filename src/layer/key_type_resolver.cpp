#include <raster_ql/layer/key_type_resolver.h>
#include <raster_ql/util/logging.h>
#include <raster_ql/util/status.h>

namespace raster_ql {

namespace {

std::string SimpleClassName(const std::string& class_name) {
    auto pos = class_name.rfind('.');
    if (pos == std::string::npos) {
        return class_name;
    }
    return class_name.substr(pos + 1);
}

} // namespace

arrow::Result<KeyVariant> ResolveKeyVariant(const std::string& key_class) {
    std::string simple = SimpleClassName(key_class);
    if (simple == "SpaceTimeKey") {
        return KeyVariant::kSpaceTime;
    }
    if (simple == "SpatialKey") {
        return KeyVariant::kSpatial;
    }
    return UnsupportedKeyType(key_class.empty() ? "<empty>" : key_class);
}

arrow::Result<ValueVariant> ResolveValueVariant(const std::string& value_class) {
    if (SimpleClassName(value_class) == "Tile") {
        return ValueVariant::kTile;
    }
    return UnsupportedValueType(value_class.empty() ? "<empty>" : value_class);
}

arrow::Result<ResolvedLayerType> ResolveLayerType(const LayerHeader& header) {
    ResolvedLayerType resolved;
    ARROW_ASSIGN_OR_RAISE(resolved.key_variant, ResolveKeyVariant(header.key_class));
    ARROW_ASSIGN_OR_RAISE(resolved.value_variant, ResolveValueVariant(header.value_class));

    RASTER_QL_LOG_RESOLVE(header.key_class << " / " << header.value_class << " -> "
                          << KeyVariantName(resolved.key_variant) << " / "
                          << ValueVariantName(resolved.value_variant));
    return resolved;
}

LayerHeader MakeLayerHeader(KeyVariant key_variant, const std::string& format) {
    LayerHeader header;
    header.key_class = key_variant == KeyVariant::kSpaceTime ? kSpaceTimeKeyClass
                                                             : kSpatialKeyClass;
    header.value_class = kTileClass;
    header.format = format;
    return header;
}

} // namespace raster_ql
