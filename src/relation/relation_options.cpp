#include <raster_ql/relation/relation_options.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>

namespace raster_ql {

namespace {

using OptionMap = std::unordered_map<std::string, std::string>;

arrow::Result<std::string> Required(const OptionMap& options, const std::string& key) {
    auto it = options.find(key);
    if (it == options.end() || it->second.empty()) {
        return arrow::Status::Invalid("Missing required option '", key, "'");
    }
    return it->second;
}

template <typename T>
arrow::Result<T> ParseInt(const std::string& key, const std::string& value) {
    T parsed;
    if (!absl::SimpleAtoi(value, &parsed)) {
        return arrow::Status::Invalid("Option '", key, "' is not an integer: '", value, "'");
    }
    return parsed;
}

arrow::Result<bool> ParseBool(const std::string& key, const std::string& value) {
    std::string lower = absl::AsciiStrToLower(value);
    if (lower == "true" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "0") {
        return false;
    }
    return arrow::Status::Invalid("Option '", key, "' is not a boolean: '", value, "'");
}

} // namespace

arrow::Status RelationOptions::Validate() const {
    if (batch_size <= 0) {
        return arrow::Status::Invalid("batch_size must be positive, got ", batch_size);
    }
    if (default_size_in_bytes < 0) {
        return arrow::Status::Invalid("default_size_in_bytes must be non-negative, got ",
                                      default_size_in_bytes);
    }
    return arrow::Status::OK();
}

arrow::Result<DataSourceOptions> DataSourceOptions::FromMap(const OptionMap& options) {
    DataSourceOptions result;

    ARROW_ASSIGN_OR_RAISE(result.path, Required(options, "path"));
    ARROW_ASSIGN_OR_RAISE(result.layer_id.name, Required(options, "layer"));
    ARROW_ASSIGN_OR_RAISE(auto zoom, Required(options, "zoom"));
    ARROW_ASSIGN_OR_RAISE(result.layer_id.zoom, ParseInt<int32_t>("zoom", zoom));

    if (auto it = options.find("batch_size"); it != options.end()) {
        ARROW_ASSIGN_OR_RAISE(result.relation.batch_size,
                              ParseInt<int64_t>("batch_size", it->second));
    }
    if (auto it = options.find("strict_filters"); it != options.end()) {
        ARROW_ASSIGN_OR_RAISE(result.relation.reject_unrecognized_filters,
                              ParseBool("strict_filters", it->second));
    }

    ARROW_RETURN_NOT_OK(result.relation.Validate());
    return result;
}

} // namespace raster_ql
