#include <raster_ql/types/tile.h>
#include <cstring>
#include <sstream>

namespace raster_ql {

const char* CellTypeName(CellType cell_type) {
    switch (cell_type) {
        case CellType::kUInt8: return "uint8";
        case CellType::kInt16: return "int16";
        case CellType::kInt32: return "int32";
        case CellType::kFloat32: return "float32";
        case CellType::kFloat64: return "float64";
    }
    return "unknown";
}

arrow::Result<CellType> CellTypeFromName(const std::string& name) {
    if (name == "uint8") return CellType::kUInt8;
    if (name == "int16") return CellType::kInt16;
    if (name == "int32") return CellType::kInt32;
    if (name == "float32") return CellType::kFloat32;
    if (name == "float64") return CellType::kFloat64;
    return arrow::Status::Invalid("Unknown cell type: ", name);
}

int32_t CellTypeByteWidth(CellType cell_type) {
    switch (cell_type) {
        case CellType::kUInt8: return 1;
        case CellType::kInt16: return 2;
        case CellType::kInt32: return 4;
        case CellType::kFloat32: return 4;
        case CellType::kFloat64: return 8;
    }
    return 0;
}

namespace {

template <typename T>
void FillCells(uint8_t* out, int64_t count, double value) {
    const T typed = static_cast<T>(value);
    for (int64_t i = 0; i < count; ++i) {
        std::memcpy(out + i * sizeof(T), &typed, sizeof(T));
    }
}

template <typename T>
double ReadCell(const uint8_t* data, int64_t index) {
    T typed;
    std::memcpy(&typed, data + index * sizeof(T), sizeof(T));
    return static_cast<double>(typed);
}

} // namespace

// ============================================================================
// Tile
// ============================================================================

Tile::Tile(int32_t cols, int32_t rows, CellType cell_type,
           std::shared_ptr<arrow::Buffer> cells)
    : cols_(cols), rows_(rows), cell_type_(cell_type), cells_(std::move(cells)) {}

arrow::Result<std::shared_ptr<Tile>> Tile::Make(
    int32_t cols, int32_t rows, CellType cell_type,
    std::shared_ptr<arrow::Buffer> cells) {

    if (cols < 0 || rows < 0) {
        return arrow::Status::Invalid("Tile dimensions must be non-negative, got ",
                                      cols, "x", rows);
    }
    if (!cells) {
        return arrow::Status::Invalid("Tile cells cannot be null");
    }
    int64_t expected = static_cast<int64_t>(cols) * rows * CellTypeByteWidth(cell_type);
    if (cells->size() != expected) {
        return arrow::Status::Invalid("Tile of ", cols, "x", rows, " ",
                                      CellTypeName(cell_type), " needs ", expected,
                                      " bytes, got ", cells->size());
    }
    return std::make_shared<Tile>(cols, rows, cell_type, std::move(cells));
}

arrow::Result<std::shared_ptr<Tile>> Tile::Filled(
    int32_t cols, int32_t rows, CellType cell_type, double value) {

    if (cols < 0 || rows < 0) {
        return arrow::Status::Invalid("Tile dimensions must be non-negative, got ",
                                      cols, "x", rows);
    }
    int64_t count = static_cast<int64_t>(cols) * rows;
    ARROW_ASSIGN_OR_RAISE(std::shared_ptr<arrow::Buffer> buffer,
                          arrow::AllocateBuffer(count * CellTypeByteWidth(cell_type)));
    uint8_t* out = buffer->mutable_data();

    switch (cell_type) {
        case CellType::kUInt8: FillCells<uint8_t>(out, count, value); break;
        case CellType::kInt16: FillCells<int16_t>(out, count, value); break;
        case CellType::kInt32: FillCells<int32_t>(out, count, value); break;
        case CellType::kFloat32: FillCells<float>(out, count, value); break;
        case CellType::kFloat64: FillCells<double>(out, count, value); break;
    }

    return Make(cols, rows, cell_type, std::move(buffer));
}

arrow::Result<double> Tile::GetDouble(int32_t col, int32_t row) const {
    if (col < 0 || col >= cols_ || row < 0 || row >= rows_) {
        return arrow::Status::IndexError("Cell (", col, ", ", row,
                                         ") outside tile of ", cols_, "x", rows_);
    }
    int64_t index = static_cast<int64_t>(row) * cols_ + col;
    const uint8_t* data = cells_->data();

    switch (cell_type_) {
        case CellType::kUInt8: return ReadCell<uint8_t>(data, index);
        case CellType::kInt16: return ReadCell<int16_t>(data, index);
        case CellType::kInt32: return ReadCell<int32_t>(data, index);
        case CellType::kFloat32: return ReadCell<float>(data, index);
        case CellType::kFloat64: return ReadCell<double>(data, index);
    }
    return arrow::Status::Invalid("Unknown cell type");
}

bool Tile::Equals(const Tile& other) const {
    return cols_ == other.cols_ && rows_ == other.rows_ &&
           cell_type_ == other.cell_type_ && cells_->Equals(*other.cells_);
}

std::string Tile::ToString() const {
    std::ostringstream oss;
    oss << "Tile(" << cols_ << "x" << rows_ << ", " << CellTypeName(cell_type_) << ")";
    return oss.str();
}

// ============================================================================
// TileType
// ============================================================================

TileType::TileType() : arrow::ExtensionType(MakeStorageType()) {}

std::shared_ptr<arrow::DataType> TileType::MakeStorageType() {
    return arrow::struct_({
        arrow::field("cols", arrow::int32(), false),
        arrow::field("rows", arrow::int32(), false),
        arrow::field("cell_type", arrow::utf8(), false),
        arrow::field("cells", arrow::binary(), false)
    });
}

bool TileType::ExtensionEquals(const arrow::ExtensionType& other) const {
    return other.extension_name() == kExtensionName;
}

std::shared_ptr<arrow::Array> TileType::MakeArray(
    std::shared_ptr<arrow::ArrayData> data) const {
    return std::make_shared<TileArray>(std::move(data));
}

arrow::Result<std::shared_ptr<arrow::DataType>> TileType::Deserialize(
    std::shared_ptr<arrow::DataType> storage_type,
    const std::string& serialized) const {

    if (serialized != kExtensionName) {
        return arrow::Status::Invalid("Type identifier does not match: ", serialized);
    }
    if (!storage_type->Equals(*MakeStorageType())) {
        return arrow::Status::Invalid("Tile storage type does not match: ",
                                      storage_type->ToString());
    }
    return std::make_shared<TileType>();
}

std::shared_ptr<arrow::DataType> tile_type() {
    static const std::shared_ptr<arrow::DataType> type = std::make_shared<TileType>();
    return type;
}

// ============================================================================
// Tile arrays
// ============================================================================

arrow::Result<std::shared_ptr<Tile>> TileFromStorage(
    const arrow::StructArray& storage, int64_t i) {

    if (storage.num_fields() != 4) {
        return arrow::Status::TypeError("Tile storage must have 4 fields, got ",
                                        storage.num_fields());
    }
    if (storage.IsNull(i)) {
        return nullptr;
    }

    auto cols = std::static_pointer_cast<arrow::Int32Array>(storage.field(0));
    auto rows = std::static_pointer_cast<arrow::Int32Array>(storage.field(1));
    auto cell_type = std::static_pointer_cast<arrow::StringArray>(storage.field(2));
    auto cells = std::static_pointer_cast<arrow::BinaryArray>(storage.field(3));

    ARROW_ASSIGN_OR_RAISE(auto type, CellTypeFromName(cell_type->GetString(i)));
    auto cell_bytes = arrow::Buffer::FromString(std::string(cells->GetView(i)));

    return Tile::Make(cols->Value(i), rows->Value(i), type, std::move(cell_bytes));
}

arrow::Result<std::shared_ptr<Tile>> TileArray::GetTile(int64_t i) const {
    if (IsNull(i)) {
        return nullptr;
    }
    return TileFromStorage(static_cast<const arrow::StructArray&>(*storage()), i);
}

TileBuilder::TileBuilder(arrow::MemoryPool* pool)
    : cols_builder_(std::make_shared<arrow::Int32Builder>(pool)),
      rows_builder_(std::make_shared<arrow::Int32Builder>(pool)),
      cell_type_builder_(std::make_shared<arrow::StringBuilder>(pool)),
      cells_builder_(std::make_shared<arrow::BinaryBuilder>(pool)) {

    std::vector<std::shared_ptr<arrow::ArrayBuilder>> children = {
        cols_builder_, rows_builder_, cell_type_builder_, cells_builder_
    };
    builder_ = std::make_unique<arrow::StructBuilder>(
        TileType::MakeStorageType(), pool, std::move(children));
}

arrow::Status TileBuilder::Append(const std::shared_ptr<Tile>& tile) {
    if (!tile) {
        return AppendNull();
    }
    ARROW_RETURN_NOT_OK(builder_->Append());
    ARROW_RETURN_NOT_OK(cols_builder_->Append(tile->cols()));
    ARROW_RETURN_NOT_OK(rows_builder_->Append(tile->rows()));
    ARROW_RETURN_NOT_OK(cell_type_builder_->Append(CellTypeName(tile->cell_type())));
    const auto& cells = tile->cells();
    return cells_builder_->Append(cells->data(), static_cast<int32_t>(cells->size()));
}

arrow::Status TileBuilder::AppendNull() {
    return builder_->AppendNull();
}

arrow::Result<std::shared_ptr<arrow::Array>> TileBuilder::FinishStorage() {
    std::shared_ptr<arrow::Array> storage;
    ARROW_RETURN_NOT_OK(builder_->Finish(&storage));
    return storage;
}

arrow::Result<std::shared_ptr<arrow::Array>> TileBuilder::Finish() {
    ARROW_ASSIGN_OR_RAISE(auto storage, FinishStorage());
    return std::make_shared<TileArray>(tile_type(), storage);
}

} // namespace raster_ql
