#pragma once

#include <arrow/status.h>
#include <optional>
#include <string>
#include <vector>

namespace raster_ql {

/**
 * @brief Domain error kinds raised by the relation adapter
 *
 * Every domain failure is an ordinary arrow::Status whose detail is a
 * RasterErrorDetail carrying one of these codes. Failures coming from the
 * attribute store or the layer reader (missing layers, I/O) have no detail
 * and are propagated unchanged.
 */
enum class ErrorCode {
    kUnsupportedKeyType,
    kUnsupportedValueType,
    kUnknownColumn,
    kUnsupportedFilter,
};

const char* ErrorCodeName(ErrorCode code);

class RasterErrorDetail : public arrow::StatusDetail {
public:
    static constexpr const char* kTypeId = "raster_ql::RasterErrorDetail";

    explicit RasterErrorDetail(ErrorCode code) : code_(code) {}

    const char* type_id() const override { return kTypeId; }
    std::string ToString() const override;

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Status factories (NotImplemented for type resolution, KeyError for columns,
// Invalid for rejected filters)
arrow::Status UnsupportedKeyType(const std::string& key_class);
arrow::Status UnsupportedValueType(const std::string& value_class);
arrow::Status UnknownColumn(const std::string& column,
                            const std::vector<std::string>& available);
arrow::Status UnsupportedFilter(const std::string& description);

// Returns the domain code attached to a status, if any
std::optional<ErrorCode> GetErrorCode(const arrow::Status& status);

inline bool IsUnsupportedKeyType(const arrow::Status& status) {
    return GetErrorCode(status) == ErrorCode::kUnsupportedKeyType;
}

inline bool IsUnsupportedValueType(const arrow::Status& status) {
    return GetErrorCode(status) == ErrorCode::kUnsupportedValueType;
}

inline bool IsUnknownColumn(const arrow::Status& status) {
    return GetErrorCode(status) == ErrorCode::kUnknownColumn;
}

inline bool IsUnsupportedFilter(const arrow::Status& status) {
    return GetErrorCode(status) == ErrorCode::kUnsupportedFilter;
}

} // namespace raster_ql
