#pragma once

#include <raster_ql/types/layer.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>

namespace raster_ql {

// Relation configuration options
struct RelationOptions {
    // Maximum rows per output batch
    int64_t batch_size = 4096;

    // Fail Scan() with kUnsupportedFilter instead of ignoring a filter that
    // has no native constraint
    bool reject_unrecognized_filters = false;

    // Value reported by EstimatedSizeBytes()
    int64_t default_size_in_bytes = std::numeric_limits<int64_t>::max();

    arrow::Status Validate() const;
};

/**
 * @brief Options of a relation opened by name, as a data source receives them
 *
 * Recognized keys:
 *   path            catalog URI (required)
 *   layer           layer name (required)
 *   zoom            layer zoom level (required)
 *   batch_size      rows per output batch
 *   strict_filters  "true"/"false", see RelationOptions
 */
struct DataSourceOptions {
    std::string path;
    LayerId layer_id;
    RelationOptions relation;

    static arrow::Result<DataSourceOptions> FromMap(
        const std::unordered_map<std::string, std::string>& options);
};

} // namespace raster_ql
