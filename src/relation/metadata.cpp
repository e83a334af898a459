#include <raster_ql/relation/metadata.h>

namespace raster_ql {
namespace metadata {

namespace {

arrow::Result<std::shared_ptr<arrow::Field>> SetKey(
    const std::shared_ptr<arrow::Field>& field,
    const char* key,
    const std::string& value) {

    if (!field) {
        return arrow::Status::Invalid("Cannot set ", key, " on a null field");
    }

    std::shared_ptr<arrow::KeyValueMetadata> metadata;
    if (field->metadata()) {
        metadata = field->metadata()->Copy();
    } else {
        metadata = std::make_shared<arrow::KeyValueMetadata>();
    }
    ARROW_RETURN_NOT_OK(metadata->Set(key, value));

    return field->WithMetadata(metadata);
}

std::optional<std::string> GetKey(const std::shared_ptr<arrow::Field>& field,
                                  const char* key) {
    if (!field || !field->metadata()) {
        return std::nullopt;
    }
    auto index = field->metadata()->FindKey(key);
    if (index == -1) {
        return std::nullopt;
    }
    return field->metadata()->value(index);
}

} // namespace

arrow::Result<std::shared_ptr<arrow::Field>> AttachRole(
    const std::shared_ptr<arrow::Field>& field,
    const std::string& role) {
    return SetKey(field, KEY_ROLE, role);
}

std::optional<std::string> GetRole(const std::shared_ptr<arrow::Field>& field) {
    return GetKey(field, KEY_ROLE);
}

arrow::Result<std::shared_ptr<arrow::Field>> AttachContext(
    const std::shared_ptr<arrow::Field>& field,
    const std::string& context) {
    return SetKey(field, KEY_CONTEXT, context);
}

std::optional<std::string> GetContext(const std::shared_ptr<arrow::Field>& field) {
    return GetKey(field, KEY_CONTEXT);
}

int FindFieldByRole(const std::shared_ptr<arrow::Schema>& schema, const std::string& role) {
    for (int i = 0; i < schema->num_fields(); ++i) {
        if (GetRole(schema->field(i)) == role) {
            return i;
        }
    }
    return -1;
}

} // namespace metadata
} // namespace raster_ql
