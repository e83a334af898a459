#pragma once

#include <raster_ql/storage/layer_query.h>
#include <raster_ql/types/keys.h>
#include <raster_ql/types/tile.h>
#include <arrow/result.h>
#include <memory>
#include <optional>

namespace raster_ql {

struct TileRecord {
    LayerKey key;
    std::shared_ptr<Tile> tile;
};

/**
 * @brief Pull-based, single-pass sequence of layer records
 *
 * Next() returns nullopt once the sequence is exhausted. Storage errors
 * raised while iterating are returned as-is.
 */
class TileRecordIterator {
public:
    virtual ~TileRecordIterator() = default;

    virtual arrow::Result<std::optional<TileRecord>> Next() = 0;
};

/**
 * @brief Executes layer queries against a tile store
 *
 * Readers must be owned by a std::shared_ptr so queries can keep them alive.
 */
class LayerReader : public std::enable_shared_from_this<LayerReader> {
public:
    virtual ~LayerReader() = default;

    // Unconstrained query over a layer; nothing is read until Execute()
    LayerQuery Query(const LayerId& id, KeyVariant key_variant,
                     ValueVariant value_variant) const;

    virtual arrow::Result<std::unique_ptr<TileRecordIterator>> Read(
        const LayerQuery& query) const = 0;
};

// True when the key's spatial component lies inside bounds (or bounds is unset)
bool KeyInBounds(const LayerKey& key, const std::optional<GridBounds>& bounds);

} // namespace raster_ql
