#include <raster_ql/util/status.h>
#include <memory>
#include <sstream>
#include <cstring>

namespace raster_ql {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kUnsupportedKeyType: return "UnsupportedKeyType";
        case ErrorCode::kUnsupportedValueType: return "UnsupportedValueType";
        case ErrorCode::kUnknownColumn: return "UnknownColumn";
        case ErrorCode::kUnsupportedFilter: return "UnsupportedFilter";
    }
    return "Unknown";
}

std::string RasterErrorDetail::ToString() const {
    return std::string("raster_ql error: ") + ErrorCodeName(code_);
}

namespace {

arrow::Status MakeStatus(arrow::StatusCode status_code, ErrorCode code,
                         std::string message) {
    return arrow::Status(status_code, std::move(message),
                         std::make_shared<RasterErrorDetail>(code));
}

} // namespace

arrow::Status UnsupportedKeyType(const std::string& key_class) {
    return MakeStatus(arrow::StatusCode::NotImplemented,
                      ErrorCode::kUnsupportedKeyType,
                      "Unsupported key type " + key_class);
}

arrow::Status UnsupportedValueType(const std::string& value_class) {
    return MakeStatus(arrow::StatusCode::NotImplemented,
                      ErrorCode::kUnsupportedValueType,
                      "Unsupported tile type " + value_class);
}

arrow::Status UnknownColumn(const std::string& column,
                            const std::vector<std::string>& available) {
    std::ostringstream oss;
    oss << "Unknown column '" << column << "', available columns: [";
    for (size_t i = 0; i < available.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << available[i];
    }
    oss << "]";
    return MakeStatus(arrow::StatusCode::KeyError,
                      ErrorCode::kUnknownColumn, oss.str());
}

arrow::Status UnsupportedFilter(const std::string& description) {
    return MakeStatus(arrow::StatusCode::Invalid,
                      ErrorCode::kUnsupportedFilter,
                      "Filter cannot be pushed down to the layer store: " + description);
}

std::optional<ErrorCode> GetErrorCode(const arrow::Status& status) {
    if (status.ok() || !status.detail()) {
        return std::nullopt;
    }
    const auto& detail = status.detail();
    if (std::strcmp(detail->type_id(), RasterErrorDetail::kTypeId) != 0) {
        return std::nullopt;
    }
    return static_cast<const RasterErrorDetail&>(*detail).code();
}

} // namespace raster_ql
