#pragma once

#include <raster_ql/types/layer.h>
#include <arrow/result.h>
#include <nlohmann/json.hpp>
#include <vector>

namespace raster_ql {

/**
 * @brief Read-only access to layer attributes
 *
 * Every layer has two attributes: its header (declared key and value class
 * names) and its layout metadata as a JSON document. Implementations return
 * a KeyError status when the layer does not exist.
 */
class AttributeStore {
public:
    virtual ~AttributeStore() = default;

    virtual arrow::Result<LayerHeader> ReadHeader(const LayerId& id) const = 0;

    virtual arrow::Result<nlohmann::json> ReadMetadataJson(const LayerId& id) const = 0;

    virtual arrow::Result<bool> LayerExists(const LayerId& id) const = 0;

    virtual arrow::Result<std::vector<LayerId>> ListLayers() const = 0;
};

// Decode a metadata document into the shape of the given key variant
arrow::Result<LayerMetadata> ParseLayerMetadata(const nlohmann::json& json,
                                                KeyVariant key_variant);

// ReadMetadataJson + ParseLayerMetadata
arrow::Result<LayerMetadata> ReadLayerMetadata(const AttributeStore& store,
                                               const LayerId& id,
                                               KeyVariant key_variant);

// Status for a layer missing from a store
arrow::Status LayerNotFound(const LayerId& id);

} // namespace raster_ql
