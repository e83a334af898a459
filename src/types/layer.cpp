#include <raster_ql/types/layer.h>

namespace raster_ql {

std::string LayerId::ToString() const {
    return "LayerId(" + name + ", " + std::to_string(zoom) + ")";
}

const char* KeyVariantName(KeyVariant variant) {
    switch (variant) {
        case KeyVariant::kSpatial: return "spatial";
        case KeyVariant::kSpaceTime: return "space-time";
    }
    return "unknown";
}

const char* ValueVariantName(ValueVariant variant) {
    switch (variant) {
        case ValueVariant::kTile: return "tile";
    }
    return "unknown";
}

KeyVariant GetKeyVariant(const LayerMetadata& metadata) {
    return std::holds_alternative<SpaceTimeLayerMetadata>(metadata)
        ? KeyVariant::kSpaceTime
        : KeyVariant::kSpatial;
}

const LayoutDefinition& GetLayout(const LayerMetadata& metadata) {
    return std::visit([](const auto& m) -> const LayoutDefinition& { return m.layout; },
                      metadata);
}

MapKeyTransform GetMapTransform(const LayerMetadata& metadata) {
    return GetLayout(metadata).MapTransform();
}

} // namespace raster_ql
