#pragma once

#include <memory>
#include <string>
#include <arrow/api.h>
#include <arrow/result.h>

namespace raster_ql {

// Operator statistics for scan profiling
struct OperatorStats {
    size_t rows_processed = 0;
    size_t batches_processed = 0;
    size_t records_read = 0;
    double execution_time_ms = 0.0;

    std::string ToString() const;
};

// Base class for batch-producing operators
// All operators are lazy: they produce results on-demand via GetNextBatch()
class Operator {
public:
    virtual ~Operator() = default;

    // Get the output schema of this operator
    // This is known before execution begins
    virtual arrow::Result<std::shared_ptr<arrow::Schema>> GetOutputSchema() const = 0;

    // Execute the operator and return the next batch of results
    // Returns nullptr when no more data is available
    virtual arrow::Result<std::shared_ptr<arrow::RecordBatch>> GetNextBatch() = 0;

    // Check if the operator may have more data
    virtual bool HasNextBatch() const = 0;

    // Get all results at once (convenience method)
    // Collects all batches into a single Arrow Table
    arrow::Result<std::shared_ptr<arrow::Table>> GetAllResults();

    virtual const OperatorStats& GetStats() const { return stats_; }

    // Human-readable description, used for debugging
    virtual std::string ToString() const = 0;

    // Estimated number of output rows
    virtual size_t EstimateCardinality() const = 0;

protected:
    OperatorStats stats_;
};

} // namespace raster_ql
