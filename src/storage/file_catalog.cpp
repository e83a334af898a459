#include <raster_ql/storage/file_catalog.h>
#include <raster_ql/layer/key_type_resolver.h>
#include <raster_ql/types/json.h>
#include <raster_ql/util/logging.h>
#include <arrow/io/file.h>
#include <arrow/ipc/api.h>
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <optional>

namespace fs = std::filesystem;

namespace raster_ql {

namespace {

constexpr const char* kAttributesDir = "attributes";
constexpr const char* kMetadataSuffix = "__metadata.json";

arrow::Status CreateDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return arrow::Status::IOError("Failed to create directory ", path.string(),
                                      ": ", ec.message());
    }
    return arrow::Status::OK();
}

// Parses "<name>__<zoom>__metadata.json"
std::optional<LayerId> ParseAttributeFileName(const std::string& file_name) {
    std::string suffix(kMetadataSuffix);
    if (file_name.size() <= suffix.size() ||
        file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    std::string stem = file_name.substr(0, file_name.size() - suffix.size());
    auto sep = stem.rfind("__");
    if (sep == std::string::npos || sep == 0) {
        return std::nullopt;
    }

    LayerId id;
    id.name = stem.substr(0, sep);
    const char* begin = stem.data() + sep + 2;
    const char* end = stem.data() + stem.size();
    auto [ptr, ec] = std::from_chars(begin, end, id.zoom);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return id;
}

class FileTileIterator : public TileRecordIterator {
public:
    FileTileIterator(std::shared_ptr<arrow::ipc::RecordBatchFileReader> reader,
                     std::optional<GridBounds> bounds,
                     KeyVariant key_variant)
        : reader_(std::move(reader)),
          bounds_(bounds),
          key_variant_(key_variant) {}

    arrow::Result<std::optional<TileRecord>> Next() override {
        while (true) {
            if (!batch_ || row_ >= batch_->num_rows()) {
                if (next_batch_ >= reader_->num_record_batches()) {
                    return std::optional<TileRecord>();
                }
                ARROW_ASSIGN_OR_RAISE(batch_, reader_->ReadRecordBatch(next_batch_++));
                ARROW_RETURN_NOT_OK(BindColumns());
                row_ = 0;
                continue;
            }

            int64_t row = row_++;
            LayerKey key = DecodeKey(row);
            if (!KeyInBounds(key, bounds_)) {
                continue;
            }
            ARROW_ASSIGN_OR_RAISE(auto tile, TileFromStorage(*tiles_, row));
            return std::optional<TileRecord>(TileRecord{key, std::move(tile)});
        }
    }

private:
    arrow::Status BindColumns() {
        cols_ = std::dynamic_pointer_cast<arrow::Int32Array>(batch_->GetColumnByName("col"));
        rows_ = std::dynamic_pointer_cast<arrow::Int32Array>(batch_->GetColumnByName("row"));
        tiles_ = std::dynamic_pointer_cast<arrow::StructArray>(batch_->GetColumnByName("tile"));
        if (!cols_ || !rows_ || !tiles_) {
            return arrow::Status::Invalid("Tile file is missing col/row/tile columns: ",
                                          batch_->schema()->ToString());
        }
        if (key_variant_ == KeyVariant::kSpaceTime) {
            instants_ = std::dynamic_pointer_cast<arrow::Int64Array>(
                batch_->GetColumnByName("instant"));
            if (!instants_) {
                return arrow::Status::Invalid("Space-time tile file has no instant column");
            }
        }
        return arrow::Status::OK();
    }

    LayerKey DecodeKey(int64_t row) const {
        if (key_variant_ == KeyVariant::kSpaceTime) {
            return SpaceTimeKey{cols_->Value(row), rows_->Value(row), instants_->Value(row)};
        }
        return SpatialKey{cols_->Value(row), rows_->Value(row)};
    }

    std::shared_ptr<arrow::ipc::RecordBatchFileReader> reader_;
    std::optional<GridBounds> bounds_;
    KeyVariant key_variant_;

    int next_batch_ = 0;
    int64_t row_ = 0;
    std::shared_ptr<arrow::RecordBatch> batch_;
    std::shared_ptr<arrow::Int32Array> cols_;
    std::shared_ptr<arrow::Int32Array> rows_;
    std::shared_ptr<arrow::Int64Array> instants_;
    std::shared_ptr<arrow::StructArray> tiles_;
};

} // namespace

// ============================================================================
// FileAttributeStore
// ============================================================================

FileAttributeStore::FileAttributeStore(std::string root) : root_(std::move(root)) {}

std::string FileAttributeStore::AttributePath(const LayerId& id) const {
    return (fs::path(root_) / kAttributesDir /
            (id.name + "__" + std::to_string(id.zoom) + kMetadataSuffix)).string();
}

arrow::Result<nlohmann::json> FileAttributeStore::ReadAttributes(const LayerId& id) const {
    std::string path = AttributePath(id);
    std::ifstream in(path);
    if (!in.is_open()) {
        return LayerNotFound(id);
    }

    RASTER_QL_LOG_STORE("Reading attributes " << path);
    try {
        auto document = nlohmann::json::parse(in);
        if (!document.is_array() || document.size() != 2 || !document[1].is_object()) {
            return arrow::Status::Invalid("Attribute file ", path,
                                          " is not an [id, attributes] pair");
        }
        return document[1];
    } catch (const nlohmann::json::exception& e) {
        return arrow::Status::Invalid("Failed to parse attribute file ", path, ": ", e.what());
    }
}

arrow::Result<LayerHeader> FileAttributeStore::ReadHeader(const LayerId& id) const {
    ARROW_ASSIGN_OR_RAISE(auto attributes, ReadAttributes(id));
    try {
        return attributes.at("header").get<LayerHeader>();
    } catch (const nlohmann::json::exception& e) {
        return arrow::Status::Invalid("Malformed header of ", id.ToString(), ": ", e.what());
    }
}

arrow::Result<nlohmann::json> FileAttributeStore::ReadMetadataJson(const LayerId& id) const {
    ARROW_ASSIGN_OR_RAISE(auto attributes, ReadAttributes(id));
    auto it = attributes.find("metadata");
    if (it == attributes.end()) {
        return arrow::Status::Invalid("Attributes of ", id.ToString(), " have no metadata");
    }
    return *it;
}

arrow::Result<bool> FileAttributeStore::LayerExists(const LayerId& id) const {
    std::error_code ec;
    bool exists = fs::exists(AttributePath(id), ec);
    if (ec) {
        return arrow::Status::IOError("Failed to stat ", AttributePath(id), ": ", ec.message());
    }
    return exists;
}

arrow::Result<std::vector<LayerId>> FileAttributeStore::ListLayers() const {
    std::vector<LayerId> ids;
    fs::path dir = fs::path(root_) / kAttributesDir;

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return ids;
    }
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (auto id = ParseAttributeFileName(it->path().filename().string())) {
            ids.push_back(*id);
        }
    }
    if (ec) {
        return arrow::Status::IOError("Failed to list ", dir.string(), ": ", ec.message());
    }

    std::sort(ids.begin(), ids.end(), [](const LayerId& a, const LayerId& b) {
        return a.name != b.name ? a.name < b.name : a.zoom < b.zoom;
    });
    return ids;
}

arrow::Status FileAttributeStore::Write(const LayerId& id, const LayerHeader& header,
                                        const nlohmann::json& metadata) const {
    ARROW_RETURN_NOT_OK(CreateDirectories(fs::path(root_) / kAttributesDir));

    nlohmann::json document = nlohmann::json::array({
        nlohmann::json(id),
        nlohmann::json{{"header", header}, {"metadata", metadata}}
    });

    std::string path = AttributePath(id);
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return arrow::Status::IOError("Failed to open ", path, " for writing");
    }
    out << document.dump(2);
    out.close();
    if (!out) {
        return arrow::Status::IOError("Failed to write ", path);
    }
    return arrow::Status::OK();
}

// ============================================================================
// FileLayerReader
// ============================================================================

FileLayerReader::FileLayerReader(std::string root, std::shared_ptr<AttributeStore> attributes)
    : root_(std::move(root)), attributes_(std::move(attributes)) {}

std::string FileLayerReader::TilePath(const std::string& root, const LayerId& id) {
    return (fs::path(root) / id.name / std::to_string(id.zoom) / "tiles.arrow").string();
}

arrow::Result<std::unique_ptr<TileRecordIterator>> FileLayerReader::Read(
    const LayerQuery& query) const {

    ARROW_ASSIGN_OR_RAISE(auto metadata,
        ReadLayerMetadata(*attributes_, query.layer_id(), query.key_variant()));
    std::optional<GridBounds> bounds = query.ToGridBounds(GetMapTransform(metadata));

    std::string path = TilePath(root_, query.layer_id());
    RASTER_QL_LOG_STORE("Opening " << path << " for " << query.ToString()
                        << (bounds ? " within " + bounds->ToString() : std::string()));

    ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(path));
    ARROW_ASSIGN_OR_RAISE(auto reader, arrow::ipc::RecordBatchFileReader::Open(file));

    return std::make_unique<FileTileIterator>(std::move(reader), bounds, query.key_variant());
}

// ============================================================================
// FileLayerWriter
// ============================================================================

FileLayerWriter::FileLayerWriter(std::string root, int64_t batch_size)
    : root_(std::move(root)), batch_size_(std::max<int64_t>(batch_size, 1)) {}

std::shared_ptr<arrow::Schema> FileLayerWriter::TileFileSchema(KeyVariant key_variant) {
    std::vector<std::shared_ptr<arrow::Field>> fields = {
        arrow::field("col", arrow::int32(), false),
        arrow::field("row", arrow::int32(), false)
    };
    if (key_variant == KeyVariant::kSpaceTime) {
        fields.push_back(arrow::field("instant", arrow::int64(), false));
    }
    fields.push_back(arrow::field("tile", TileType::MakeStorageType(), true));
    return arrow::schema(fields);
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> FileLayerWriter::MakeBatch(
    KeyVariant key_variant, const std::vector<TileRecord>& records,
    size_t begin, size_t end) const {

    arrow::Int32Builder cols;
    arrow::Int32Builder rows;
    arrow::Int64Builder instants;
    TileBuilder tiles;

    for (size_t i = begin; i < end; ++i) {
        const TileRecord& record = records[i];
        bool space_time = std::holds_alternative<SpaceTimeKey>(record.key);
        if (space_time != (key_variant == KeyVariant::kSpaceTime)) {
            return arrow::Status::Invalid("Record key ", KeyToString(record.key),
                                          " does not match ", KeyVariantName(key_variant),
                                          " layer");
        }
        SpatialKey spatial = SpatialComponent(record.key);
        ARROW_RETURN_NOT_OK(cols.Append(spatial.col));
        ARROW_RETURN_NOT_OK(rows.Append(spatial.row));
        if (space_time) {
            ARROW_RETURN_NOT_OK(instants.Append(std::get<SpaceTimeKey>(record.key).instant));
        }
        ARROW_RETURN_NOT_OK(tiles.Append(record.tile));
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(cols.Finish(&array));
    arrays.push_back(array);
    ARROW_RETURN_NOT_OK(rows.Finish(&array));
    arrays.push_back(array);
    if (key_variant == KeyVariant::kSpaceTime) {
        ARROW_RETURN_NOT_OK(instants.Finish(&array));
        arrays.push_back(array);
    }
    ARROW_ASSIGN_OR_RAISE(array, tiles.FinishStorage());
    arrays.push_back(array);

    return arrow::RecordBatch::Make(TileFileSchema(key_variant),
                                    static_cast<int64_t>(end - begin), arrays);
}

arrow::Status FileLayerWriter::Write(const LayerId& id, const LayerMetadata& metadata,
                                     const std::vector<TileRecord>& records) const {
    KeyVariant key_variant = GetKeyVariant(metadata);

    FileAttributeStore attributes(root_);
    ARROW_RETURN_NOT_OK(attributes.Write(id, MakeLayerHeader(key_variant, "file"),
                                         LayerMetadataToJson(metadata)));

    fs::path tile_path(FileLayerReader::TilePath(root_, id));
    ARROW_RETURN_NOT_OK(CreateDirectories(tile_path.parent_path()));

    auto schema = TileFileSchema(key_variant);
    ARROW_ASSIGN_OR_RAISE(auto sink, arrow::io::FileOutputStream::Open(tile_path.string()));
    ARROW_ASSIGN_OR_RAISE(auto writer, arrow::ipc::MakeFileWriter(sink, schema));

    for (size_t begin = 0; begin < records.size(); begin += batch_size_) {
        size_t end = std::min(records.size(), begin + static_cast<size_t>(batch_size_));
        ARROW_ASSIGN_OR_RAISE(auto batch, MakeBatch(key_variant, records, begin, end));
        ARROW_RETURN_NOT_OK(writer->WriteRecordBatch(*batch));
    }

    ARROW_RETURN_NOT_OK(writer->Close());
    ARROW_RETURN_NOT_OK(sink->Close());

    RASTER_QL_LOG_STORE("Wrote " << records.size() << " tiles of " << id.ToString()
                        << " to " << tile_path.string());
    return arrow::Status::OK();
}

} // namespace raster_ql
