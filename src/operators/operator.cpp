#include <raster_ql/operators/operator.h>
#include <sstream>

namespace raster_ql {

std::string OperatorStats::ToString() const {
    std::ostringstream oss;
    oss << "OperatorStats{"
        << "rows=" << rows_processed
        << ", batches=" << batches_processed
        << ", records=" << records_read
        << ", time=" << execution_time_ms << "ms"
        << "}";
    return oss.str();
}

arrow::Result<std::shared_ptr<arrow::Table>> Operator::GetAllResults() {
    ARROW_ASSIGN_OR_RAISE(auto schema, GetOutputSchema());

    std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
    while (HasNextBatch()) {
        ARROW_ASSIGN_OR_RAISE(auto batch, GetNextBatch());
        if (batch) {
            batches.push_back(batch);
        }
    }

    // Empty results still carry the output schema
    return arrow::Table::FromRecordBatches(schema, batches);
}

} // namespace raster_ql
