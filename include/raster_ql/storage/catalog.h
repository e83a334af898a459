#pragma once

#include <raster_ql/storage/attribute_store.h>
#include <raster_ql/storage/layer_reader.h>
#include <arrow/result.h>
#include <memory>
#include <string>

namespace raster_ql {

// Store location: attribute access and tile reads for one catalog
struct LayerCatalog {
    std::string uri;
    std::shared_ptr<AttributeStore> attribute_store;
    std::shared_ptr<LayerReader> layer_reader;
};

/**
 * @brief Open the catalog at a URI
 *
 * Supported: "file:///path/to/catalog" and bare filesystem paths.
 */
arrow::Result<std::shared_ptr<LayerCatalog>> OpenCatalog(const std::string& uri);

} // namespace raster_ql
