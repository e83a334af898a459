#include <raster_ql/relation/layer_relation.h>
#include <raster_ql/execution/layer_scan_operator.h>
#include <raster_ql/relation/predicate_translator.h>
#include <raster_ql/relation/schema_builder.h>
#include <raster_ql/types/json.h>
#include <raster_ql/util/logging.h>
#include <raster_ql/util/status.h>
#include <sstream>

namespace raster_ql {

namespace {

std::string JoinColumns(const std::vector<std::string>& columns) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << columns[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace

LayerRelation::LayerRelation(std::shared_ptr<const LayerCatalog> catalog,
                             LayerId layer_id,
                             std::vector<FilterPredicate> filters,
                             RelationOptions options)
    : LayerRelation(std::move(catalog), std::move(layer_id), std::move(filters),
                    options, std::make_shared<State>()) {}

LayerRelation::LayerRelation(std::shared_ptr<const LayerCatalog> catalog,
                             LayerId layer_id,
                             std::vector<FilterPredicate> filters,
                             RelationOptions options,
                             std::shared_ptr<State> state)
    : catalog_(std::move(catalog)),
      layer_id_(std::move(layer_id)),
      filters_(std::move(filters)),
      options_(options),
      state_(std::move(state)) {}

arrow::Result<LayerRelation> LayerRelation::Open(const std::string& uri,
                                                 LayerId layer_id,
                                                 RelationOptions options) {
    ARROW_RETURN_NOT_OK(options.Validate());
    ARROW_ASSIGN_OR_RAISE(auto catalog, OpenCatalog(uri));
    return LayerRelation(std::move(catalog), std::move(layer_id), {}, options);
}

LayerRelation LayerRelation::WithFilter(FilterPredicate predicate) const {
    std::vector<FilterPredicate> filters = filters_;
    filters.push_back(std::move(predicate));
    return LayerRelation(catalog_, layer_id_, std::move(filters), options_, state_);
}

arrow::Result<std::shared_ptr<const ResolvedLayer>> LayerRelation::Resolve() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->resolved) {
        state_->resolved = ReadLayer();
    }
    return *state_->resolved;
}

arrow::Result<std::shared_ptr<const ResolvedLayer>> LayerRelation::ReadLayer() const {
    if (!catalog_ || !catalog_->attribute_store || !catalog_->layer_reader) {
        return arrow::Status::Invalid("Relation over ", layer_id_.ToString(),
                                      " has no catalog");
    }

    auto resolved = std::make_shared<ResolvedLayer>();
    ARROW_ASSIGN_OR_RAISE(resolved->header, catalog_->attribute_store->ReadHeader(layer_id_));
    RASTER_QL_LOG_RESOLVE(layer_id_.ToString() << " declares key "
                          << resolved->header.key_class << ", value "
                          << resolved->header.value_class);

    ARROW_ASSIGN_OR_RAISE(resolved->type, ResolveLayerType(resolved->header));
    ARROW_ASSIGN_OR_RAISE(resolved->metadata,
        ReadLayerMetadata(*catalog_->attribute_store, layer_id_, resolved->type.key_variant));

    std::string context = LayerMetadataToJson(resolved->metadata).dump();
    ARROW_ASSIGN_OR_RAISE(resolved->schema,
        BuildLayerSchema(resolved->type.key_variant, resolved->type.value_variant, context));
    RASTER_QL_LOG_SCHEMA(layer_id_.ToString() << " -> " << resolved->schema->ToString());

    return std::shared_ptr<const ResolvedLayer>(std::move(resolved));
}

arrow::Result<std::shared_ptr<arrow::Schema>> LayerRelation::GetSchema() const {
    ARROW_ASSIGN_OR_RAISE(auto resolved, Resolve());
    return resolved->schema;
}

arrow::Result<LayerMetadata> LayerRelation::GetLayerMetadata() const {
    ARROW_ASSIGN_OR_RAISE(auto resolved, Resolve());
    return resolved->metadata;
}

arrow::Result<std::shared_ptr<Operator>> LayerRelation::Scan(
    const std::vector<std::string>& required_columns) const {

    ARROW_ASSIGN_OR_RAISE(auto resolved, Resolve());

    if (options_.reject_unrecognized_filters) {
        for (const auto& filter : filters_) {
            if (!IsRecognizedPredicate(filter)) {
                return UnsupportedFilter(filter.ToString());
            }
        }
    }

    RASTER_QL_LOG_SCAN("Reading " << layer_id_.ToString() << " from " << catalog_->uri
                       << " columns " << JoinColumns(required_columns)
                       << " with " << filters_.size() << " filter(s)");

    LayerQuery query = catalog_->layer_reader->Query(
        layer_id_, resolved->type.key_variant, resolved->type.value_variant);
    query = ApplyFilters(query, filters_);

    ARROW_ASSIGN_OR_RAISE(auto scan, LayerScanOperator::Make(
        std::move(query), resolved->schema, resolved->metadata,
        required_columns, options_.batch_size));
    return std::static_pointer_cast<Operator>(scan);
}

std::vector<FilterPredicate> LayerRelation::UnhandledFilters() const {
    std::vector<FilterPredicate> unhandled;
    for (const auto& filter : filters_) {
        if (!IsRecognizedPredicate(filter)) {
            unhandled.push_back(filter);
        }
    }
    return unhandled;
}

std::string LayerRelation::ToString() const {
    std::ostringstream oss;
    oss << "LayerRelation(" << (catalog_ ? catalog_->uri : std::string("<none>"))
        << ", " << layer_id_.ToString() << ", filters=[";
    for (size_t i = 0; i < filters_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << filters_[i].ToString();
    }
    oss << "])";
    return oss.str();
}

arrow::Result<LayerRelation> OpenRelation(
    const std::unordered_map<std::string, std::string>& options) {
    ARROW_ASSIGN_OR_RAISE(auto parsed, DataSourceOptions::FromMap(options));
    return LayerRelation::Open(parsed.path, parsed.layer_id, parsed.relation);
}

} // namespace raster_ql
