#pragma once

#include <raster_ql/storage/attribute_store.h>
#include <raster_ql/storage/layer_reader.h>
#include <arrow/api.h>
#include <arrow/result.h>
#include <memory>
#include <string>
#include <vector>

namespace raster_ql {

/**
 * @brief Attribute store over a catalog directory
 *
 * Each layer has one attribute document at
 *   <root>/attributes/<name>__<zoom>__metadata.json
 * holding the pair [{"name", "zoom"}, {"header": ..., "metadata": ...}].
 */
class FileAttributeStore : public AttributeStore {
public:
    explicit FileAttributeStore(std::string root);

    arrow::Result<LayerHeader> ReadHeader(const LayerId& id) const override;
    arrow::Result<nlohmann::json> ReadMetadataJson(const LayerId& id) const override;
    arrow::Result<bool> LayerExists(const LayerId& id) const override;
    arrow::Result<std::vector<LayerId>> ListLayers() const override;

    arrow::Status Write(const LayerId& id, const LayerHeader& header,
                        const nlohmann::json& metadata) const;

    std::string AttributePath(const LayerId& id) const;
    const std::string& root() const { return root_; }

private:
    arrow::Result<nlohmann::json> ReadAttributes(const LayerId& id) const;

    std::string root_;
};

/**
 * @brief Reads tiles stored as an Arrow IPC file per layer
 *
 * Tiles live at <root>/<name>/<zoom>/tiles.arrow with columns
 * col:int32, row:int32, [instant:int64,] tile:struct (tile storage). The file
 * is read one record batch at a time as the iterator advances; tiles are
 * decoded only for keys that pass the query bounds.
 */
class FileLayerReader : public LayerReader {
public:
    FileLayerReader(std::string root, std::shared_ptr<AttributeStore> attributes);

    arrow::Result<std::unique_ptr<TileRecordIterator>> Read(
        const LayerQuery& query) const override;

    static std::string TilePath(const std::string& root, const LayerId& id);

private:
    std::string root_;
    std::shared_ptr<AttributeStore> attributes_;
};

// Writes layers in the format read by FileAttributeStore and FileLayerReader
class FileLayerWriter {
public:
    explicit FileLayerWriter(std::string root, int64_t batch_size = 1024);

    arrow::Status Write(const LayerId& id, const LayerMetadata& metadata,
                        const std::vector<TileRecord>& records) const;

    // Schema of the tiles file for a key variant
    static std::shared_ptr<arrow::Schema> TileFileSchema(KeyVariant key_variant);

private:
    arrow::Result<std::shared_ptr<arrow::RecordBatch>> MakeBatch(
        KeyVariant key_variant, const std::vector<TileRecord>& records,
        size_t begin, size_t end) const;

    std::string root_;
    int64_t batch_size_;
};

} // namespace raster_ql
