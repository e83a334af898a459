#pragma once

#include <raster_ql/operators/operator.h>
#include <raster_ql/relation/schema_builder.h>
#include <raster_ql/storage/layer_reader.h>
#include <memory>
#include <string>
#include <vector>

namespace raster_ql {

/**
 * @brief Column-pruned scan over one layer
 *
 * Leaf operator that executes a (possibly constrained) LayerQuery and turns
 * the (key, tile) records into RecordBatches holding only the requested
 * columns, in the requested order. Duplicated names yield duplicated columns;
 * an empty column list yields batches with rows but no columns.
 *
 * The query is executed on the first GetNextBatch() call. Each operator is a
 * single-pass stream; scanning again requires a new operator.
 *
 * Example:
 *   ARROW_ASSIGN_OR_RAISE(auto scan, LayerScanOperator::Make(
 *       query, layer_schema, metadata, {"spatial_key", "tile"}));
 *   ARROW_ASSIGN_OR_RAISE(auto table, scan->GetAllResults());
 */
class LayerScanOperator : public Operator {
public:
    /**
     * @brief Create a scan operator
     * @param query Query to execute, constraints already applied
     * @param layer_schema Full schema of the layer relation
     * @param metadata Layer metadata (key to extent transform)
     * @param required_columns Column names to produce
     * @param batch_size Maximum rows per batch
     * @return Operator, or UnknownColumn if a name is not in layer_schema
     */
    static arrow::Result<std::shared_ptr<LayerScanOperator>> Make(
        LayerQuery query,
        std::shared_ptr<arrow::Schema> layer_schema,
        const LayerMetadata& metadata,
        const std::vector<std::string>& required_columns,
        int64_t batch_size = 4096);

    arrow::Result<std::shared_ptr<arrow::Schema>> GetOutputSchema() const override;
    arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() override;
    bool HasNextBatch() const override;
    std::string ToString() const override;

    // Number of keys admitted by the layer's key bounds
    size_t EstimateCardinality() const override;

    const LayerQuery& query() const { return query_; }

private:
    LayerScanOperator(LayerQuery query,
                      std::shared_ptr<arrow::Schema> output_schema,
                      std::vector<LayerColumn> columns,
                      MapKeyTransform transform,
                      size_t cardinality,
                      int64_t batch_size);

    arrow::Result<std::shared_ptr<arrow::Array>> BuildColumn(
        LayerColumn column, const std::vector<TileRecord>& records) const;

    LayerQuery query_;
    std::shared_ptr<arrow::Schema> output_schema_;
    std::vector<LayerColumn> columns_;
    MapKeyTransform transform_;
    size_t cardinality_;
    int64_t batch_size_;

    std::unique_ptr<TileRecordIterator> records_;
    bool exhausted_ = false;
};

} // namespace raster_ql
