#pragma once

#include <arrow/api.h>
#include <optional>
#include <string>

namespace raster_ql {
namespace metadata {

/**
 * @brief Arrow field metadata for layer relations
 *
 * Key columns carry a role tag so consumers can find them without relying on
 * column names, and the spatial key carries the layer metadata as context:
 *   Field: "spatial_key" (struct<col, row>)
 *   Metadata: {"raster_ql.role": "spatial_key", "raster_ql.context": "{...}"}
 */

inline constexpr const char* KEY_ROLE = "raster_ql.role";
inline constexpr const char* KEY_CONTEXT = "raster_ql.context";

inline constexpr const char* ROLE_SPATIAL_KEY = "spatial_key";
inline constexpr const char* ROLE_TEMPORAL_KEY = "temporal_key";

/**
 * @brief Attach a role tag to field metadata
 * @param field Original field
 * @param role ROLE_SPATIAL_KEY or ROLE_TEMPORAL_KEY
 * @return New field with metadata attached
 */
arrow::Result<std::shared_ptr<arrow::Field>> AttachRole(
    const std::shared_ptr<arrow::Field>& field,
    const std::string& role
);

std::optional<std::string> GetRole(const std::shared_ptr<arrow::Field>& field);

// Attach a serialized layer metadata document
arrow::Result<std::shared_ptr<arrow::Field>> AttachContext(
    const std::shared_ptr<arrow::Field>& field,
    const std::string& context
);

std::optional<std::string> GetContext(const std::shared_ptr<arrow::Field>& field);

/**
 * @brief Find the first field tagged with a role
 * @return Field index, or -1 when no field has the role
 */
int FindFieldByRole(const std::shared_ptr<arrow::Schema>& schema, const std::string& role);

} // namespace metadata
} // namespace raster_ql
