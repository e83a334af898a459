#include <raster_ql/storage/memory_catalog.h>
#include <raster_ql/layer/key_type_resolver.h>
#include <raster_ql/types/json.h>
#include <raster_ql/util/logging.h>
#include <absl/container/flat_hash_map.h>
#include <algorithm>
#include <mutex>

namespace raster_ql {

namespace {

struct StoredLayer {
    LayerHeader header;
    nlohmann::json metadata;
    std::shared_ptr<const std::vector<TileRecord>> records;
};

} // namespace

struct InMemoryCatalog::State {
    mutable std::mutex mutex;
    absl::flat_hash_map<LayerId, StoredLayer> layers;

    mutable std::atomic<int64_t> header_reads{0};
    mutable std::atomic<int64_t> metadata_reads{0};
    mutable std::atomic<int64_t> layer_reads{0};

    arrow::Result<StoredLayer> Find(const LayerId& id) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = layers.find(id);
        if (it == layers.end()) {
            return LayerNotFound(id);
        }
        return it->second;
    }
};

namespace {

class InMemoryAttributeStore : public AttributeStore {
public:
    explicit InMemoryAttributeStore(std::shared_ptr<InMemoryCatalog::State> state)
        : state_(std::move(state)) {}

    arrow::Result<LayerHeader> ReadHeader(const LayerId& id) const override {
        state_->header_reads.fetch_add(1);
        ARROW_ASSIGN_OR_RAISE(auto layer, state_->Find(id));
        return layer.header;
    }

    arrow::Result<nlohmann::json> ReadMetadataJson(const LayerId& id) const override {
        state_->metadata_reads.fetch_add(1);
        ARROW_ASSIGN_OR_RAISE(auto layer, state_->Find(id));
        return layer.metadata;
    }

    arrow::Result<bool> LayerExists(const LayerId& id) const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->layers.contains(id);
    }

    arrow::Result<std::vector<LayerId>> ListLayers() const override {
        std::vector<LayerId> ids;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ids.reserve(state_->layers.size());
            for (const auto& [id, layer] : state_->layers) {
                ids.push_back(id);
            }
        }
        std::sort(ids.begin(), ids.end(), [](const LayerId& a, const LayerId& b) {
            return a.name != b.name ? a.name < b.name : a.zoom < b.zoom;
        });
        return ids;
    }

private:
    std::shared_ptr<InMemoryCatalog::State> state_;
};

// Walks a snapshot of a layer's records, skipping keys outside the bounds
class SnapshotIterator : public TileRecordIterator {
public:
    SnapshotIterator(std::shared_ptr<const std::vector<TileRecord>> records,
                     std::optional<GridBounds> bounds,
                     KeyVariant key_variant)
        : records_(std::move(records)),
          bounds_(bounds),
          key_variant_(key_variant) {}

    arrow::Result<std::optional<TileRecord>> Next() override {
        while (position_ < records_->size()) {
            const TileRecord& record = (*records_)[position_++];
            bool space_time = std::holds_alternative<SpaceTimeKey>(record.key);
            if (space_time != (key_variant_ == KeyVariant::kSpaceTime)) {
                return arrow::Status::Invalid("Record key ", KeyToString(record.key),
                                              " does not match ",
                                              KeyVariantName(key_variant_), " query");
            }
            if (KeyInBounds(record.key, bounds_)) {
                return std::optional<TileRecord>(record);
            }
        }
        return std::optional<TileRecord>();
    }

private:
    std::shared_ptr<const std::vector<TileRecord>> records_;
    std::optional<GridBounds> bounds_;
    KeyVariant key_variant_;
    size_t position_ = 0;
};

class InMemoryLayerReader : public LayerReader {
public:
    explicit InMemoryLayerReader(std::shared_ptr<InMemoryCatalog::State> state)
        : state_(std::move(state)) {}

    arrow::Result<std::unique_ptr<TileRecordIterator>> Read(
        const LayerQuery& query) const override {

        state_->layer_reads.fetch_add(1);
        ARROW_ASSIGN_OR_RAISE(auto layer, state_->Find(query.layer_id()));

        std::optional<GridBounds> bounds;
        if (!query.constraints().empty()) {
            ARROW_ASSIGN_OR_RAISE(auto metadata,
                ParseLayerMetadata(layer.metadata, query.key_variant()));
            bounds = query.ToGridBounds(GetMapTransform(metadata));
        }

        RASTER_QL_LOG_STORE("In-memory read of " << query.ToString() << " over "
                            << layer.records->size() << " records");
        return std::make_unique<SnapshotIterator>(layer.records, bounds,
                                                  query.key_variant());
    }

private:
    std::shared_ptr<InMemoryCatalog::State> state_;
};

} // namespace

InMemoryCatalog::InMemoryCatalog(std::shared_ptr<State> state,
                                 std::shared_ptr<LayerCatalog> catalog)
    : state_(std::move(state)), catalog_(std::move(catalog)) {}

std::shared_ptr<InMemoryCatalog> InMemoryCatalog::Make(const std::string& uri) {
    auto state = std::make_shared<State>();
    auto catalog = std::make_shared<LayerCatalog>();
    catalog->uri = uri;
    catalog->attribute_store = std::make_shared<InMemoryAttributeStore>(state);
    catalog->layer_reader = std::make_shared<InMemoryLayerReader>(state);
    return std::shared_ptr<InMemoryCatalog>(new InMemoryCatalog(std::move(state), std::move(catalog)));
}

arrow::Status InMemoryCatalog::AddLayer(const LayerId& id, const LayerHeader& header,
                                        const nlohmann::json& metadata,
                                        std::vector<TileRecord> records) {
    StoredLayer layer{
        header,
        metadata,
        std::make_shared<const std::vector<TileRecord>>(std::move(records))
    };
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->layers.insert_or_assign(id, std::move(layer));
    return arrow::Status::OK();
}

arrow::Status InMemoryCatalog::WriteLayer(const LayerId& id, const LayerMetadata& metadata,
                                          std::vector<TileRecord> records) {
    KeyVariant variant = GetKeyVariant(metadata);
    for (const auto& record : records) {
        bool space_time = std::holds_alternative<SpaceTimeKey>(record.key);
        if (space_time != (variant == KeyVariant::kSpaceTime)) {
            return arrow::Status::Invalid("Record key ", KeyToString(record.key),
                                          " does not match ", KeyVariantName(variant),
                                          " layer ", id.ToString());
        }
    }
    return AddLayer(id, MakeLayerHeader(variant, "memory"),
                    LayerMetadataToJson(metadata), std::move(records));
}

int64_t InMemoryCatalog::header_reads() const { return state_->header_reads.load(); }
int64_t InMemoryCatalog::metadata_reads() const { return state_->metadata_reads.load(); }
int64_t InMemoryCatalog::layer_reads() const { return state_->layer_reads.load(); }

} // namespace raster_ql
