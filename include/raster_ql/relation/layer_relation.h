#pragma once

#include <raster_ql/layer/key_type_resolver.h>
#include <raster_ql/operators/operator.h>
#include <raster_ql/relation/filter_predicate.h>
#include <raster_ql/relation/relation_options.h>
#include <raster_ql/storage/catalog.h>
#include <arrow/api.h>
#include <arrow/result.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace raster_ql {

// Everything learned about a layer when a relation first touches it
struct ResolvedLayer {
    LayerHeader header;
    ResolvedLayerType type;
    LayerMetadata metadata;
    std::shared_ptr<arrow::Schema> schema;
};

/**
 * @brief Tabular view of one tile layer
 *
 * A relation is an immutable value naming a layer in a catalog plus the
 * filters pushed down to it. Opening one performs no I/O. The layer header
 * and metadata are read on the first GetSchema()/Scan()/Resolve() call and
 * the outcome, success or failure, is kept for the lifetime of the relation
 * and of every relation derived from it with WithFilter(). Concurrent first
 * callers wait for a single read.
 *
 * Example:
 *   LayerRelation relation(catalog, {"L1", 0});
 *   auto filtered = relation.WithFilter(ExtentIntersects(Point(0.5, 0.5)));
 *   ARROW_ASSIGN_OR_RAISE(auto scan, filtered.Scan({"spatial_key", "tile"}));
 *   ARROW_ASSIGN_OR_RAISE(auto table, scan->GetAllResults());
 */
class LayerRelation {
public:
    LayerRelation(std::shared_ptr<const LayerCatalog> catalog,
                  LayerId layer_id,
                  std::vector<FilterPredicate> filters = {},
                  RelationOptions options = {});

    // Opens the catalog at uri; the layer itself is not read yet
    static arrow::Result<LayerRelation> Open(const std::string& uri,
                                             LayerId layer_id,
                                             RelationOptions options = {});

    // Copy with the predicate appended; this relation is unchanged
    LayerRelation WithFilter(FilterPredicate predicate) const;

    arrow::Result<std::shared_ptr<const ResolvedLayer>> Resolve() const;

    /**
     * @brief Output schema of the relation
     * @return Schema, UnsupportedKeyType / UnsupportedValueType for layers of
     *         unknown representation, or the attribute store's error
     */
    arrow::Result<std::shared_ptr<arrow::Schema>> GetSchema() const;

    arrow::Result<LayerMetadata> GetLayerMetadata() const;

    /**
     * @brief Scan the layer, producing only the required columns
     *
     * Each call returns a new lazy operator; nothing is read from the layer
     * until its first GetNextBatch().
     *
     * @param required_columns Column names in output order
     * @return Operator, or UnknownColumn / UnsupportedFilter (strict mode)
     */
    arrow::Result<std::shared_ptr<Operator>> Scan(
        const std::vector<std::string>& required_columns) const;

    // Placeholder size estimate (RelationOptions::default_size_in_bytes)
    int64_t EstimatedSizeBytes() const { return options_.default_size_in_bytes; }

    // Filters that have no native constraint and do not narrow scans
    std::vector<FilterPredicate> UnhandledFilters() const;

    const std::shared_ptr<const LayerCatalog>& catalog() const { return catalog_; }
    const LayerId& layer_id() const { return layer_id_; }
    const std::vector<FilterPredicate>& filters() const { return filters_; }
    const RelationOptions& options() const { return options_; }

    std::string ToString() const;

private:
    struct State {
        std::mutex mutex;
        std::optional<arrow::Result<std::shared_ptr<const ResolvedLayer>>> resolved;
    };

    LayerRelation(std::shared_ptr<const LayerCatalog> catalog,
                  LayerId layer_id,
                  std::vector<FilterPredicate> filters,
                  RelationOptions options,
                  std::shared_ptr<State> state);

    arrow::Result<std::shared_ptr<const ResolvedLayer>> ReadLayer() const;

    std::shared_ptr<const LayerCatalog> catalog_;
    LayerId layer_id_;
    std::vector<FilterPredicate> filters_;
    RelationOptions options_;
    std::shared_ptr<State> state_;
};

// Opens a relation from data source options (see DataSourceOptions)
arrow::Result<LayerRelation> OpenRelation(
    const std::unordered_map<std::string, std::string>& options);

} // namespace raster_ql
