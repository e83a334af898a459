#pragma once

#include <raster_ql/storage/catalog.h>
#include <raster_ql/types/layer.h>
#include <arrow/status.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace raster_ql {

/**
 * @brief Catalog that keeps layers in process memory
 *
 * Layers are immutable once added; iterators hold a snapshot of the records,
 * so adding or replacing layers never disturbs a running scan. Read counters
 * let callers observe how often the attribute store and reader are touched.
 *
 * Example:
 *   auto memory = InMemoryCatalog::Make();
 *   ARROW_RETURN_NOT_OK(memory->WriteLayer({"L1", 0}, metadata, records));
 *   LayerRelation relation(memory->catalog(), {"L1", 0});
 */
class InMemoryCatalog {
public:
    static std::shared_ptr<InMemoryCatalog> Make(const std::string& uri = "memory://");

    // Adds a layer with a raw header and metadata document (replaces any existing layer)
    arrow::Status AddLayer(const LayerId& id, const LayerHeader& header,
                           const nlohmann::json& metadata,
                           std::vector<TileRecord> records);

    // Adds a layer whose header is derived from the metadata's key variant
    arrow::Status WriteLayer(const LayerId& id, const LayerMetadata& metadata,
                             std::vector<TileRecord> records);

    std::shared_ptr<LayerCatalog> catalog() const { return catalog_; }

    int64_t header_reads() const;
    int64_t metadata_reads() const;
    int64_t layer_reads() const;

    struct State;

private:
    InMemoryCatalog(std::shared_ptr<State> state, std::shared_ptr<LayerCatalog> catalog);

    std::shared_ptr<State> state_;
    std::shared_ptr<LayerCatalog> catalog_;
};

} // namespace raster_ql
