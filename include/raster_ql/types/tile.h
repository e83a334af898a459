#pragma once

#include <arrow/api.h>
#include <arrow/extension_type.h>
#include <arrow/result.h>
#include <cstdint>
#include <memory>
#include <string>

namespace raster_ql {

enum class CellType {
    kUInt8,
    kInt16,
    kInt32,
    kFloat32,
    kFloat64,
};

const char* CellTypeName(CellType cell_type);
arrow::Result<CellType> CellTypeFromName(const std::string& name);
int32_t CellTypeByteWidth(CellType cell_type);

/**
 * @brief Opaque raster tile
 *
 * A row-major grid of cols x rows cells of a single cell type. The relation
 * never inspects cell values; tiles are passed through scans unchanged.
 */
class Tile {
public:
    Tile(int32_t cols, int32_t rows, CellType cell_type,
         std::shared_ptr<arrow::Buffer> cells);

    // Validates that the buffer holds exactly cols * rows cells
    static arrow::Result<std::shared_ptr<Tile>> Make(
        int32_t cols, int32_t rows, CellType cell_type,
        std::shared_ptr<arrow::Buffer> cells);

    // Tile with every cell set to value (converted to the cell type)
    static arrow::Result<std::shared_ptr<Tile>> Filled(
        int32_t cols, int32_t rows, CellType cell_type, double value);

    int32_t cols() const { return cols_; }
    int32_t rows() const { return rows_; }
    CellType cell_type() const { return cell_type_; }
    const std::shared_ptr<arrow::Buffer>& cells() const { return cells_; }

    arrow::Result<double> GetDouble(int32_t col, int32_t row) const;

    bool Equals(const Tile& other) const;
    std::string ToString() const;

private:
    int32_t cols_;
    int32_t rows_;
    CellType cell_type_;
    std::shared_ptr<arrow::Buffer> cells_;
};

/**
 * @brief Arrow extension type for tile columns
 *
 * Storage is struct<cols: int32, rows: int32, cell_type: utf8, cells: binary>.
 * Consumers that do not know the extension still see the storage struct.
 */
class TileType : public arrow::ExtensionType {
public:
    static constexpr const char* kExtensionName = "raster_ql.tile";

    TileType();

    std::string extension_name() const override { return kExtensionName; }

    bool ExtensionEquals(const arrow::ExtensionType& other) const override;

    std::shared_ptr<arrow::Array> MakeArray(
        std::shared_ptr<arrow::ArrayData> data) const override;

    arrow::Result<std::shared_ptr<arrow::DataType>> Deserialize(
        std::shared_ptr<arrow::DataType> storage_type,
        const std::string& serialized) const override;

    std::string Serialize() const override { return kExtensionName; }

    static std::shared_ptr<arrow::DataType> MakeStorageType();
};

std::shared_ptr<arrow::DataType> tile_type();

class TileArray : public arrow::ExtensionArray {
public:
    using arrow::ExtensionArray::ExtensionArray;

    // nullptr for null slots
    arrow::Result<std::shared_ptr<Tile>> GetTile(int64_t i) const;
};

// Decodes slot i of a tile storage struct; nullptr for null slots
arrow::Result<std::shared_ptr<Tile>> TileFromStorage(
    const arrow::StructArray& storage, int64_t i);

/**
 * @brief Builds tile storage structs, optionally wrapped as TileArray
 */
class TileBuilder {
public:
    explicit TileBuilder(arrow::MemoryPool* pool = arrow::default_memory_pool());

    arrow::Status Append(const std::shared_ptr<Tile>& tile);
    arrow::Status AppendNull();

    // Plain storage struct (used by the file catalog)
    arrow::Result<std::shared_ptr<arrow::Array>> FinishStorage();

    // Storage wrapped in the tile extension type
    arrow::Result<std::shared_ptr<arrow::Array>> Finish();

private:
    std::shared_ptr<arrow::Int32Builder> cols_builder_;
    std::shared_ptr<arrow::Int32Builder> rows_builder_;
    std::shared_ptr<arrow::StringBuilder> cell_type_builder_;
    std::shared_ptr<arrow::BinaryBuilder> cells_builder_;
    std::unique_ptr<arrow::StructBuilder> builder_;
};

} // namespace raster_ql
