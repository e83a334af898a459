#include <raster_ql/execution/layer_scan_operator.h>
#include <raster_ql/util/logging.h>
#include <raster_ql/util/status.h>
#include <chrono>
#include <sstream>

namespace raster_ql {

namespace {

arrow::Result<LayerColumn> ColumnFromName(const std::string& name) {
    for (LayerColumn column : {LayerColumn::kSpatialKey, LayerColumn::kTemporalKey,
                               LayerColumn::kExtent, LayerColumn::kTile}) {
        if (name == LayerColumnName(column)) {
            return column;
        }
    }
    return arrow::Status::Invalid("Not a layer column: ", name);
}

template <typename K>
size_t BoundsCardinality(const KeyBounds<K>& bounds) {
    SpatialKey min_key = SpatialComponent(LayerKey(bounds.min_key));
    SpatialKey max_key = SpatialComponent(LayerKey(bounds.max_key));
    GridBounds grid{min_key.col, min_key.row, max_key.col, max_key.row};
    return static_cast<size_t>(grid.Size());
}

arrow::Result<std::shared_ptr<arrow::Array>> FinishStruct(
    const std::shared_ptr<arrow::DataType>& type,
    std::vector<arrow::ArrayBuilder*> children) {

    arrow::ArrayVector arrays;
    for (auto* child : children) {
        std::shared_ptr<arrow::Array> array;
        ARROW_RETURN_NOT_OK(child->Finish(&array));
        arrays.push_back(array);
    }
    ARROW_ASSIGN_OR_RAISE(auto array, arrow::StructArray::Make(arrays, type->fields()));
    return std::static_pointer_cast<arrow::Array>(array);
}

} // namespace

LayerScanOperator::LayerScanOperator(
    LayerQuery query,
    std::shared_ptr<arrow::Schema> output_schema,
    std::vector<LayerColumn> columns,
    MapKeyTransform transform,
    size_t cardinality,
    int64_t batch_size)
    : query_(std::move(query)),
      output_schema_(std::move(output_schema)),
      columns_(std::move(columns)),
      transform_(transform),
      cardinality_(cardinality),
      batch_size_(batch_size) {}

arrow::Result<std::shared_ptr<LayerScanOperator>> LayerScanOperator::Make(
    LayerQuery query,
    std::shared_ptr<arrow::Schema> layer_schema,
    const LayerMetadata& metadata,
    const std::vector<std::string>& required_columns,
    int64_t batch_size) {

    if (batch_size <= 0) {
        return arrow::Status::Invalid("batch_size must be positive, got ", batch_size);
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<LayerColumn> columns;
    for (const auto& name : required_columns) {
        int index = layer_schema->GetFieldIndex(name);
        if (index < 0) {
            return UnknownColumn(name, layer_schema->field_names());
        }
        ARROW_ASSIGN_OR_RAISE(auto column, ColumnFromName(name));
        fields.push_back(layer_schema->field(index));
        columns.push_back(column);
    }

    size_t cardinality = std::visit(
        [](const auto& m) { return BoundsCardinality(m.bounds); }, metadata);

    return std::shared_ptr<LayerScanOperator>(new LayerScanOperator(
        std::move(query), arrow::schema(fields), std::move(columns),
        GetMapTransform(metadata), cardinality, batch_size));
}

arrow::Result<std::shared_ptr<arrow::Schema>> LayerScanOperator::GetOutputSchema() const {
    return output_schema_;
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> LayerScanOperator::GetNextBatch() {
    if (exhausted_) {
        return nullptr;
    }

    auto start = std::chrono::high_resolution_clock::now();

    // On first call, execute the query
    if (!records_) {
        RASTER_QL_LOG_SCAN("Executing " << query_.ToString());
        ARROW_ASSIGN_OR_RAISE(records_, query_.Execute());
    }

    std::vector<TileRecord> records;
    while (static_cast<int64_t>(records.size()) < batch_size_) {
        ARROW_ASSIGN_OR_RAISE(auto record, records_->Next());
        if (!record) {
            exhausted_ = true;
            break;
        }
        records.push_back(std::move(*record));
    }
    stats_.records_read += records.size();

    if (records.empty()) {
        return nullptr;
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.reserve(columns_.size());
    for (LayerColumn column : columns_) {
        ARROW_ASSIGN_OR_RAISE(auto array, BuildColumn(column, records));
        arrays.push_back(std::move(array));
    }

    auto batch = arrow::RecordBatch::Make(output_schema_,
                                          static_cast<int64_t>(records.size()),
                                          std::move(arrays));

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    stats_.execution_time_ms += duration.count() / 1000.0;
    stats_.rows_processed += batch->num_rows();
    stats_.batches_processed++;

    return batch;
}

arrow::Result<std::shared_ptr<arrow::Array>> LayerScanOperator::BuildColumn(
    LayerColumn column, const std::vector<TileRecord>& records) const {

    switch (column) {
        case LayerColumn::kSpatialKey: {
            arrow::Int32Builder cols;
            arrow::Int32Builder rows;
            for (const auto& record : records) {
                SpatialKey key = SpatialComponent(record.key);
                ARROW_RETURN_NOT_OK(cols.Append(key.col));
                ARROW_RETURN_NOT_OK(rows.Append(key.row));
            }
            return FinishStruct(spatial_key_type(), {&cols, &rows});
        }
        case LayerColumn::kTemporalKey: {
            arrow::Int64Builder instants;
            for (const auto& record : records) {
                auto temporal = TemporalComponent(record.key);
                if (!temporal) {
                    return arrow::Status::Invalid("Record ", KeyToString(record.key),
                                                  " has no temporal component");
                }
                ARROW_RETURN_NOT_OK(instants.Append(temporal->instant));
            }
            return FinishStruct(temporal_key_type(), {&instants});
        }
        case LayerColumn::kExtent: {
            arrow::DoubleBuilder xmin, ymin, xmax, ymax;
            for (const auto& record : records) {
                Extent extent = transform_.KeyToExtent(record.key);
                ARROW_RETURN_NOT_OK(xmin.Append(extent.xmin));
                ARROW_RETURN_NOT_OK(ymin.Append(extent.ymin));
                ARROW_RETURN_NOT_OK(xmax.Append(extent.xmax));
                ARROW_RETURN_NOT_OK(ymax.Append(extent.ymax));
            }
            return FinishStruct(extent_type(), {&xmin, &ymin, &xmax, &ymax});
        }
        case LayerColumn::kTile: {
            TileBuilder tiles;
            for (const auto& record : records) {
                ARROW_RETURN_NOT_OK(tiles.Append(record.tile));
            }
            return tiles.Finish();
        }
    }
    return arrow::Status::Invalid("Unhandled layer column");
}

bool LayerScanOperator::HasNextBatch() const {
    return !exhausted_;
}

std::string LayerScanOperator::ToString() const {
    std::ostringstream oss;
    oss << "LayerScan(" << query_.layer_id().ToString() << ", columns=[";
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << LayerColumnName(columns_[i]);
    }
    oss << "], constraints=" << query_.constraints().size() << ")";
    oss << " [est. " << EstimateCardinality() << " rows]";
    return oss.str();
}

size_t LayerScanOperator::EstimateCardinality() const {
    return cardinality_;
}

} // namespace raster_ql
