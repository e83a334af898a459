#include <raster_ql/storage/attribute_store.h>
#include <raster_ql/types/json.h>
#include <raster_ql/util/logging.h>
#include <exception>

namespace raster_ql {

arrow::Result<LayerMetadata> ParseLayerMetadata(const nlohmann::json& json,
                                                KeyVariant key_variant) {
    try {
        switch (key_variant) {
            case KeyVariant::kSpatial:
                return LayerMetadata(json.get<SpatialLayerMetadata>());
            case KeyVariant::kSpaceTime:
                return LayerMetadata(json.get<SpaceTimeLayerMetadata>());
        }
    } catch (const std::exception& e) {
        return arrow::Status::Invalid("Malformed ", KeyVariantName(key_variant),
                                      " layer metadata: ", e.what());
    }
    return arrow::Status::Invalid("Unknown key variant");
}

arrow::Result<LayerMetadata> ReadLayerMetadata(const AttributeStore& store,
                                               const LayerId& id,
                                               KeyVariant key_variant) {
    RASTER_QL_LOG_STORE("Reading " << KeyVariantName(key_variant)
                        << " metadata of " << id.ToString());
    ARROW_ASSIGN_OR_RAISE(auto json, store.ReadMetadataJson(id));
    return ParseLayerMetadata(json, key_variant);
}

arrow::Status LayerNotFound(const LayerId& id) {
    return arrow::Status::KeyError("Layer not found: ", id.ToString());
}

} // namespace raster_ql
