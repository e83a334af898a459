/**
 * Unit Tests for Layer Relations
 *
 * Tests schema resolution, column-pruned scans, filter pushdown, error
 * behavior and memoization of layer resolution over the in-memory catalog.
 */

#include "test_util.h"
#include <raster_ql/relation/layer_relation.h>
#include <raster_ql/relation/metadata.h>
#include <raster_ql/storage/memory_catalog.h>
#include <raster_ql/util/status.h>
#include <limits>
#include <thread>

namespace raster_ql {

using testutil::CollectExtents;
using testutil::CollectInstants;
using testutil::CollectSpatialKeys;
using testutil::CollectTiles;

class LayerRelationTest : public ::testing::Test {
protected:
    void SetUp() override {
        memory_ = InMemoryCatalog::Make();
        ASSERT_OK(memory_->WriteLayer(l1_, testutil::MakeTwoTileMetadata(),
                                      testutil::MakeTwoTileRecords()));
        ASSERT_OK(memory_->WriteLayer(st_, testutil::MakeSpaceTimeMetadata(),
                                      testutil::MakeSpaceTimeRecords()));
    }

    LayerRelation Relation(const LayerId& id, RelationOptions options = {}) const {
        return LayerRelation(memory_->catalog(), id, {}, options);
    }

    static arrow::Result<std::shared_ptr<arrow::Table>> ScanAll(
        const LayerRelation& relation, const std::vector<std::string>& columns) {
        ARROW_ASSIGN_OR_RAISE(auto scan, relation.Scan(columns));
        return scan->GetAllResults();
    }

    LayerId l1_{"L1", 0};
    LayerId st_{"ST", 3};
    std::shared_ptr<InMemoryCatalog> memory_;
};

TEST_F(LayerRelationTest, CatalogListsLayers) {
    auto store = memory_->catalog()->attribute_store;
    ASSERT_OK_AND_ASSIGN(auto layers, store->ListLayers());
    EXPECT_EQ(layers, (std::vector<LayerId>{l1_, st_}));
    ASSERT_OK_AND_ASSIGN(auto exists, store->LayerExists(LayerId{"L1", 1}));
    EXPECT_FALSE(exists);
}

//==============================================================================
// Schema
//==============================================================================

TEST_F(LayerRelationTest, SpatialSchema) {
    ASSERT_OK_AND_ASSIGN(auto schema, Relation(l1_).GetSchema());
    EXPECT_EQ(schema->field_names(),
              (std::vector<std::string>{"spatial_key", "extent", "tile"}));
}

TEST_F(LayerRelationTest, SpaceTimeSchema) {
    ASSERT_OK_AND_ASSIGN(auto schema, Relation(st_).GetSchema());
    EXPECT_EQ(schema->field_names(),
              (std::vector<std::string>{"spatial_key", "temporal_key", "extent", "tile"}));
}

TEST_F(LayerRelationTest, SchemaCarriesLayerMetadataContext) {
    ASSERT_OK_AND_ASSIGN(auto schema, Relation(l1_).GetSchema());
    auto context = metadata::GetContext(schema->field(0));
    ASSERT_TRUE(context.has_value());
    auto json = nlohmann::json::parse(*context);
    EXPECT_EQ(json.at("crs"), "EPSG:3857");
}

TEST_F(LayerRelationTest, SchemaDoesNotReadTiles) {
    ASSERT_OK_AND_ASSIGN(auto schema, Relation(l1_).GetSchema());
    EXPECT_EQ(memory_->layer_reads(), 0);
}

TEST_F(LayerRelationTest, OpeningPerformsNoReads) {
    LayerRelation relation = Relation(l1_).WithFilter(ExtentIntersects(Point(0.5, 0.5)));
    EXPECT_EQ(memory_->header_reads(), 0);
    EXPECT_EQ(memory_->metadata_reads(), 0);
    EXPECT_EQ(relation.filters().size(), 1u);
}

//==============================================================================
// Scans
//==============================================================================

TEST_F(LayerRelationTest, ScanTwoTileLayer) {
    ASSERT_OK_AND_ASSIGN(auto table, ScanAll(Relation(l1_), {"spatial_key", "extent"}));

    ASSERT_EQ(table->num_columns(), 2);
    ASSERT_EQ(table->num_rows(), 2);
    EXPECT_EQ(table->schema()->field_names(),
              (std::vector<std::string>{"spatial_key", "extent"}));

    EXPECT_EQ(CollectSpatialKeys(*table, 0),
              (std::vector<SpatialKey>{{0, 0}, {1, 0}}));
    EXPECT_EQ(CollectExtents(*table, 1),
              (std::vector<Extent>{{0.0, 0.0, 1.0, 1.0}, {1.0, 0.0, 2.0, 1.0}}));
}

TEST_F(LayerRelationTest, ScanWithPointFilter) {
    auto relation = Relation(l1_).WithFilter(ExtentIntersects(Point(0.5, 0.5)));
    ASSERT_OK_AND_ASSIGN(auto table, ScanAll(relation, {"spatial_key", "tile"}));

    ASSERT_EQ(table->num_rows(), 1);
    EXPECT_EQ(CollectSpatialKeys(*table, 0), (std::vector<SpatialKey>{{0, 0}}));

    auto tiles = CollectTiles(*table, 1);
    ASSERT_EQ(tiles.size(), 1u);
    ASSERT_NE(tiles[0], nullptr);
    EXPECT_TRUE(tiles[0]->Equals(*testutil::MakeTile(1.0)));
}

TEST_F(LayerRelationTest, ColumnsFollowRequestedOrder) {
    ASSERT_OK_AND_ASSIGN(auto table, ScanAll(Relation(st_), {"tile", "temporal_key", "spatial_key"}));
    EXPECT_EQ(table->schema()->field_names(),
              (std::vector<std::string>{"tile", "temporal_key", "spatial_key"}));
    EXPECT_EQ(table->num_rows(), 32);
}

TEST_F(LayerRelationTest, DuplicateColumnsAreRepeated) {
    ASSERT_OK_AND_ASSIGN(auto table, ScanAll(Relation(l1_), {"spatial_key", "spatial_key"}));
    ASSERT_EQ(table->num_columns(), 2);
    EXPECT_EQ(CollectSpatialKeys(*table, 0), CollectSpatialKeys(*table, 1));
}

TEST_F(LayerRelationTest, EmptyColumnListKeepsRowCount) {
    ASSERT_OK_AND_ASSIGN(auto table, ScanAll(Relation(l1_), {}));
    EXPECT_EQ(table->num_columns(), 0);
    EXPECT_EQ(table->num_rows(), 2);
}

TEST_F(LayerRelationTest, BatchesRespectBatchSize) {
    RelationOptions options;
    options.batch_size = 5;
    ASSERT_OK_AND_ASSIGN(auto scan, Relation(st_, options).Scan({"spatial_key"}));

    int64_t rows = 0;
    int batches = 0;
    while (scan->HasNextBatch()) {
        ASSERT_OK_AND_ASSIGN(auto batch, scan->GetNextBatch());
        if (!batch) break;
        EXPECT_LE(batch->num_rows(), 5);
        EXPECT_EQ(batch->num_columns(), 1);
        EXPECT_EQ(batch->schema()->field(0)->name(), "spatial_key");
        rows += batch->num_rows();
        ++batches;
    }
    EXPECT_EQ(rows, 32);
    EXPECT_EQ(batches, 7);
    EXPECT_EQ(scan->GetStats().rows_processed, 32u);
}

TEST_F(LayerRelationTest, ScanIsLazyAndRepeatable) {
    auto relation = Relation(l1_);
    ASSERT_OK_AND_ASSIGN(auto first, relation.Scan({"spatial_key"}));
    ASSERT_OK_AND_ASSIGN(auto second, relation.Scan({"spatial_key"}));
    EXPECT_EQ(memory_->layer_reads(), 0);

    ASSERT_OK_AND_ASSIGN(auto a, first->GetAllResults());
    ASSERT_OK_AND_ASSIGN(auto b, second->GetAllResults());
    EXPECT_EQ(memory_->layer_reads(), 2);
    EXPECT_TRUE(a->Equals(*b));
}

TEST_F(LayerRelationTest, SpaceTimeScanCarriesInstants) {
    auto relation = Relation(st_).WithFilter(ExtentIntersects(Point(2.5, 3.5)));
    ASSERT_OK_AND_ASSIGN(auto table,
                         ScanAll(relation, {"spatial_key", "temporal_key", "extent", "tile"}));

    ASSERT_EQ(table->num_rows(), 2);
    EXPECT_EQ(CollectSpatialKeys(*table, 0),
              (std::vector<SpatialKey>{{2, 0}, {2, 0}}));
    EXPECT_EQ(CollectInstants(*table, 1), (std::vector<int64_t>{1000, 2000}));
    EXPECT_EQ(CollectExtents(*table, 2)[0], (Extent{2.0, 3.0, 3.0, 4.0}));

    auto tiles = CollectTiles(*table, 3);
    ASSERT_OK_AND_ASSIGN(auto value, tiles[0]->GetDouble(0, 0));
    EXPECT_DOUBLE_EQ(value, 2.0);
}

TEST_F(LayerRelationTest, NullTilesScanAsNulls) {
    LayerId sparse{"sparse", 1};
    ASSERT_OK(memory_->WriteLayer(sparse, testutil::MakeTwoTileMetadata(), {
        TileRecord{SpatialKey{0, 0}, nullptr},
        TileRecord{SpatialKey{1, 0}, testutil::MakeTile(4.0)}
    }));
    ASSERT_OK_AND_ASSIGN(auto table, ScanAll(Relation(sparse), {"tile"}));
    auto tiles = CollectTiles(*table, 0);
    ASSERT_EQ(tiles.size(), 2u);
    EXPECT_EQ(tiles[0], nullptr);
    EXPECT_NE(tiles[1], nullptr);
}

//==============================================================================
// Filters
//==============================================================================

TEST_F(LayerRelationTest, WithFilterDoesNotMutateOriginal) {
    auto relation = Relation(l1_);
    auto filtered = relation.WithFilter(ExtentIntersects(Point(0.5, 0.5)));
    auto twice = filtered.WithFilter(ExtentIntersects(Point(1.5, 0.5)));

    EXPECT_TRUE(relation.filters().empty());
    EXPECT_EQ(filtered.filters().size(), 1u);
    EXPECT_EQ(twice.filters().size(), 2u);

    ASSERT_OK_AND_ASSIGN(auto all, ScanAll(relation, {"spatial_key"}));
    EXPECT_EQ(all->num_rows(), 2);
}

TEST_F(LayerRelationTest, RecognizedFiltersNeverEnlargeResults) {
    auto relation = Relation(st_);
    ASSERT_OK_AND_ASSIGN(auto all, ScanAll(relation, {"spatial_key"}));

    auto wide = relation.WithFilter(ExtentIntersects(Envelope(Geometry(
        LineString{Point(0.5, 0.5), Point(2.5, 2.5)}))));
    ASSERT_OK_AND_ASSIGN(auto wide_rows, ScanAll(wide, {"spatial_key"}));

    auto narrow = wide.WithFilter(ExtentIntersects(Point(1.5, 1.5)));
    ASSERT_OK_AND_ASSIGN(auto narrow_rows, ScanAll(narrow, {"spatial_key"}));

    EXPECT_EQ(wide_rows->num_rows(), 2 * 9);
    EXPECT_EQ(narrow_rows->num_rows(), 2);
    EXPECT_LE(wide_rows->num_rows(), all->num_rows());
    EXPECT_LE(narrow_rows->num_rows(), wide_rows->num_rows());
}

TEST_F(LayerRelationTest, DisjointFiltersYieldNoRows) {
    auto relation = Relation(l1_)
        .WithFilter(ExtentIntersects(Point(0.5, 0.5)))
        .WithFilter(ExtentIntersects(Point(1.5, 0.5)));
    ASSERT_OK_AND_ASSIGN(auto table, ScanAll(relation, {"spatial_key", "extent"}));
    EXPECT_EQ(table->num_rows(), 0);
    EXPECT_EQ(table->num_columns(), 2);
}

TEST_F(LayerRelationTest, NaNFilterSelectsNothing) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    auto point = Relation(l1_).WithFilter(ExtentIntersects(Point(nan, 0.5)));
    ASSERT_OK_AND_ASSIGN(auto point_rows, ScanAll(point, {"spatial_key"}));
    EXPECT_EQ(point_rows->num_rows(), 0);

    auto line = Relation(l1_).WithFilter(ExtentIntersects(
        LineString{Point(0.2, nan), Point(0.4, 0.4)}));
    ASSERT_OK_AND_ASSIGN(auto line_rows, ScanAll(line, {"spatial_key"}));
    EXPECT_EQ(line_rows->num_rows(), 0);
}

TEST_F(LayerRelationTest, UnrecognizedFilterHasNoEffect) {
    auto relation = Relation(l1_);
    auto filtered = relation.WithFilter(FilterPredicate{"tile", "intersects", Point(0.5, 0.5)});

    ASSERT_OK_AND_ASSIGN(auto expected, ScanAll(relation, {"spatial_key", "extent"}));
    ASSERT_OK_AND_ASSIGN(auto actual, ScanAll(filtered, {"spatial_key", "extent"}));
    EXPECT_TRUE(actual->Equals(*expected));

    auto unhandled = filtered.UnhandledFilters();
    ASSERT_EQ(unhandled.size(), 1u);
    EXPECT_EQ(unhandled[0].column_name, "tile");
}

TEST_F(LayerRelationTest, StrictModeRejectsUnrecognizedFilter) {
    RelationOptions options;
    options.reject_unrecognized_filters = true;
    auto relation = Relation(l1_, options)
        .WithFilter(ExtentIntersects(Point(0.5, 0.5)))
        .WithFilter(FilterPredicate{"extent", "within", Point(0.5, 0.5)});

    auto result = relation.Scan({"spatial_key"});
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsUnsupportedFilter(result.status()));
    EXPECT_EQ(memory_->layer_reads(), 0);
}

//==============================================================================
// Errors
//==============================================================================

TEST_F(LayerRelationTest, UnknownColumnFailsBeforeReading) {
    auto result = Relation(l1_).Scan({"spatial_key", "temporal_key"});
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsUnknownColumn(result.status()));
    EXPECT_NE(result.status().message().find("temporal_key"), std::string::npos);
    EXPECT_EQ(memory_->layer_reads(), 0);
}

TEST_F(LayerRelationTest, UnsupportedKeyTypeFailsBeforeReader) {
    LayerId bad{"bad", 0};
    ASSERT_OK(memory_->AddLayer(bad, LayerHeader{"GridKey", "Tile", "memory"},
                                LayerMetadataToJson(testutil::MakeTwoTileMetadata()),
                                testutil::MakeTwoTileRecords()));
    auto relation = Relation(bad);

    EXPECT_TRUE(IsUnsupportedKeyType(relation.GetSchema().status()));
    EXPECT_TRUE(IsUnsupportedKeyType(relation.Scan({"spatial_key"}).status()));
    EXPECT_EQ(memory_->layer_reads(), 0);
    EXPECT_EQ(memory_->metadata_reads(), 0);
}

TEST_F(LayerRelationTest, UnsupportedValueTypeFailsBeforeReader) {
    LayerId bad{"bad", 0};
    ASSERT_OK(memory_->AddLayer(bad, LayerHeader{"SpatialKey", "MultibandTile", "memory"},
                                LayerMetadataToJson(testutil::MakeTwoTileMetadata()),
                                testutil::MakeTwoTileRecords()));
    auto relation = Relation(bad);

    EXPECT_TRUE(IsUnsupportedValueType(relation.Scan({"tile"}).status()));
    EXPECT_TRUE(IsUnsupportedValueType(relation.GetSchema().status()));
    EXPECT_EQ(memory_->layer_reads(), 0);
}

TEST_F(LayerRelationTest, MissingLayerPropagatesStoreError) {
    auto relation = Relation(LayerId{"nope", 0});
    auto result = relation.GetSchema();
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(result.status().IsKeyError());
    EXPECT_FALSE(GetErrorCode(result.status()).has_value());
}

//==============================================================================
// Memoization
//==============================================================================

TEST_F(LayerRelationTest, ResolutionHappensOnce) {
    auto relation = Relation(l1_);
    ASSERT_OK(relation.GetSchema().status());
    ASSERT_OK(relation.GetSchema().status());
    ASSERT_OK(relation.Scan({"tile"}).status());

    auto derived = relation.WithFilter(ExtentIntersects(Point(0.5, 0.5)));
    ASSERT_OK(derived.GetSchema().status());

    EXPECT_EQ(memory_->header_reads(), 1);
    EXPECT_EQ(memory_->metadata_reads(), 1);
}

TEST_F(LayerRelationTest, FailedResolutionIsCached) {
    LayerId bad{"bad", 0};
    ASSERT_OK(memory_->AddLayer(bad, LayerHeader{"GridKey", "Tile", "memory"},
                                nlohmann::json::object(), {}));
    auto relation = Relation(bad);
    EXPECT_FALSE(relation.GetSchema().ok());
    EXPECT_FALSE(relation.GetSchema().ok());
    EXPECT_EQ(memory_->header_reads(), 1);
}

TEST_F(LayerRelationTest, ConcurrentFirstAccessResolvesOnce) {
    auto relation = Relation(st_);
    constexpr int kThreads = 8;

    std::vector<std::shared_ptr<arrow::Schema>> schemas(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&relation, &schemas, i] {
            auto schema = relation.GetSchema();
            if (schema.ok()) {
                schemas[i] = *schema;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(memory_->header_reads(), 1);
    for (const auto& schema : schemas) {
        ASSERT_NE(schema, nullptr);
        EXPECT_EQ(schema.get(), schemas[0].get());
    }
}

TEST_F(LayerRelationTest, EstimatedSizeIsPlaceholder) {
    EXPECT_EQ(Relation(l1_).EstimatedSizeBytes(), std::numeric_limits<int64_t>::max());

    RelationOptions options;
    options.default_size_in_bytes = 1024;
    EXPECT_EQ(Relation(l1_, options).EstimatedSizeBytes(), 1024);
}

TEST_F(LayerRelationTest, ScanOperatorDescription) {
    auto relation = Relation(l1_).WithFilter(ExtentIntersects(Point(0.5, 0.5)));
    ASSERT_OK_AND_ASSIGN(auto scan, relation.Scan({"spatial_key", "tile"}));
    EXPECT_EQ(scan->ToString(),
              "LayerScan(LayerId(L1, 0), columns=[spatial_key, tile], constraints=1) [est. 2 rows]");
    EXPECT_EQ(scan->EstimateCardinality(), 2u);
}

} // namespace raster_ql
