/**
 * Unit Tests for the File Catalog
 *
 * Verifies that layers written with FileLayerWriter can be listed, resolved
 * and scanned through a relation opened on the catalog directory.
 */

#include "test_util.h"
#include <raster_ql/relation/layer_relation.h>
#include <raster_ql/storage/file_catalog.h>
#include <raster_ql/types/json.h>
#include <raster_ql/util/status.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace raster_ql {
namespace {

using testutil::CollectExtents;
using testutil::CollectInstants;
using testutil::CollectSpatialKeys;
using testutil::CollectTiles;

class FileCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = "/tmp/raster_ql_test_file_catalog_" + std::to_string(getpid());
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    std::string test_dir_;
};

TEST_F(FileCatalogTest, WriterLaysOutAttributesAndTiles) {
    FileLayerWriter writer(test_dir_);
    ASSERT_OK(writer.Write(LayerId{"L1", 0}, testutil::MakeTwoTileMetadata(),
                           testutil::MakeTwoTileRecords()));

    EXPECT_TRUE(fs::exists(fs::path(test_dir_) / "attributes" / "L1__0__metadata.json"));
    EXPECT_TRUE(fs::exists(fs::path(test_dir_) / "L1" / "0" / "tiles.arrow"));

    std::ifstream in(fs::path(test_dir_) / "attributes" / "L1__0__metadata.json");
    auto document = nlohmann::json::parse(in);
    ASSERT_TRUE(document.is_array());
    EXPECT_EQ(document[0].at("name"), "L1");
    EXPECT_EQ(document[1].at("header").at("keyClass"), kSpatialKeyClass);
    EXPECT_EQ(document[1].at("header").at("format"), "file");
}

TEST_F(FileCatalogTest, AttributeStoreReadsWrittenLayer) {
    FileLayerWriter writer(test_dir_);
    ASSERT_OK(writer.Write(LayerId{"L1", 0}, testutil::MakeTwoTileMetadata(),
                           testutil::MakeTwoTileRecords()));

    FileAttributeStore store(test_dir_);
    ASSERT_OK_AND_ASSIGN(auto header, store.ReadHeader(LayerId{"L1", 0}));
    EXPECT_EQ(header, MakeLayerHeader(KeyVariant::kSpatial, "file"));

    ASSERT_OK_AND_ASSIGN(auto metadata,
                         ReadLayerMetadata(store, LayerId{"L1", 0}, KeyVariant::kSpatial));
    EXPECT_EQ(std::get<SpatialLayerMetadata>(metadata), testutil::MakeTwoTileMetadata());
}

TEST_F(FileCatalogTest, ListAndExists) {
    FileLayerWriter writer(test_dir_);
    ASSERT_OK(writer.Write(LayerId{"roads", 2}, testutil::MakeTwoTileMetadata(), {}));
    ASSERT_OK(writer.Write(LayerId{"L1", 0}, testutil::MakeTwoTileMetadata(), {}));
    ASSERT_OK(writer.Write(LayerId{"L1", 10}, testutil::MakeTwoTileMetadata(), {}));

    std::ofstream(fs::path(test_dir_) / "attributes" / "README.txt") << "not a layer";

    FileAttributeStore store(test_dir_);
    ASSERT_OK_AND_ASSIGN(auto layers, store.ListLayers());
    EXPECT_EQ(layers, (std::vector<LayerId>{{"L1", 0}, {"L1", 10}, {"roads", 2}}));

    ASSERT_OK_AND_ASSIGN(auto exists, store.LayerExists(LayerId{"roads", 2}));
    EXPECT_TRUE(exists);
    ASSERT_OK_AND_ASSIGN(auto missing, store.LayerExists(LayerId{"roads", 3}));
    EXPECT_FALSE(missing);
}

TEST_F(FileCatalogTest, ListOfEmptyCatalogIsEmpty) {
    FileAttributeStore store(test_dir_ + "/nothing_here");
    ASSERT_OK_AND_ASSIGN(auto layers, store.ListLayers());
    EXPECT_TRUE(layers.empty());
}

TEST_F(FileCatalogTest, MissingLayerIsKeyError) {
    FileAttributeStore store(test_dir_);
    auto result = store.ReadHeader(LayerId{"L1", 0});
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(result.status().IsKeyError());
}

TEST_F(FileCatalogTest, MalformedAttributesAreInvalid) {
    fs::create_directories(fs::path(test_dir_) / "attributes");
    std::ofstream(fs::path(test_dir_) / "attributes" / "L1__0__metadata.json") << "{not json";

    FileAttributeStore store(test_dir_);
    EXPECT_TRUE(store.ReadHeader(LayerId{"L1", 0}).status().IsInvalid());
}

TEST_F(FileCatalogTest, RelationScansFileLayer) {
    FileLayerWriter writer(test_dir_);
    ASSERT_OK(writer.Write(LayerId{"L1", 0}, testutil::MakeTwoTileMetadata(),
                           testutil::MakeTwoTileRecords()));

    ASSERT_OK_AND_ASSIGN(auto relation,
                         LayerRelation::Open("file://" + test_dir_, LayerId{"L1", 0}));
    ASSERT_OK_AND_ASSIGN(auto schema, relation.GetSchema());
    EXPECT_EQ(schema->field_names(),
              (std::vector<std::string>{"spatial_key", "extent", "tile"}));

    ASSERT_OK_AND_ASSIGN(auto scan, relation.Scan({"spatial_key", "extent"}));
    ASSERT_OK_AND_ASSIGN(auto table, scan->GetAllResults());
    EXPECT_EQ(CollectSpatialKeys(*table, 0), (std::vector<SpatialKey>{{0, 0}, {1, 0}}));
    EXPECT_EQ(CollectExtents(*table, 1),
              (std::vector<Extent>{{0.0, 0.0, 1.0, 1.0}, {1.0, 0.0, 2.0, 1.0}}));
}

TEST_F(FileCatalogTest, FilteredScanAcrossWriterBatches) {
    FileLayerWriter writer(test_dir_, 3);
    ASSERT_OK(writer.Write(LayerId{"ST", 3}, testutil::MakeSpaceTimeMetadata(),
                           testutil::MakeSpaceTimeRecords()));

    ASSERT_OK_AND_ASSIGN(auto relation, LayerRelation::Open(test_dir_, LayerId{"ST", 3}));
    auto filtered = relation.WithFilter(ExtentIntersects(Point(3.5, 0.5)));

    ASSERT_OK_AND_ASSIGN(auto scan, filtered.Scan({"temporal_key", "spatial_key", "tile"}));
    ASSERT_OK_AND_ASSIGN(auto table, scan->GetAllResults());

    ASSERT_EQ(table->num_rows(), 2);
    EXPECT_EQ(CollectInstants(*table, 0), (std::vector<int64_t>{1000, 2000}));
    EXPECT_EQ(CollectSpatialKeys(*table, 1), (std::vector<SpatialKey>{{3, 3}, {3, 3}}));

    auto tiles = CollectTiles(*table, 2);
    ASSERT_NE(tiles[1], nullptr);
    EXPECT_EQ(tiles[1]->cell_type(), CellType::kInt32);
    ASSERT_OK_AND_ASSIGN(auto value, tiles[1]->GetDouble(1, 1));
    EXPECT_DOUBLE_EQ(value, 33.0);
}

TEST_F(FileCatalogTest, NullTilesSurviveRoundTrip) {
    FileLayerWriter writer(test_dir_);
    ASSERT_OK(writer.Write(LayerId{"sparse", 0}, testutil::MakeTwoTileMetadata(), {
        TileRecord{SpatialKey{0, 0}, testutil::MakeTile(5.0)},
        TileRecord{SpatialKey{1, 0}, nullptr}
    }));

    ASSERT_OK_AND_ASSIGN(auto relation, LayerRelation::Open(test_dir_, LayerId{"sparse", 0}));
    ASSERT_OK_AND_ASSIGN(auto scan, relation.Scan({"tile"}));
    ASSERT_OK_AND_ASSIGN(auto table, scan->GetAllResults());
    auto tiles = CollectTiles(*table, 0);
    ASSERT_EQ(tiles.size(), 2u);
    ASSERT_NE(tiles[0], nullptr);
    EXPECT_TRUE(tiles[0]->Equals(*testutil::MakeTile(5.0)));
    EXPECT_EQ(tiles[1], nullptr);
}

TEST_F(FileCatalogTest, WriterRejectsMismatchedKeys) {
    FileLayerWriter writer(test_dir_);
    auto status = writer.Write(LayerId{"L1", 0}, testutil::MakeTwoTileMetadata(), {
        TileRecord{SpaceTimeKey{0, 0, 1}, testutil::MakeTile(1.0)}
    });
    EXPECT_TRUE(status.IsInvalid());
}

TEST_F(FileCatalogTest, UnsupportedHeaderFailsBeforeTilesAreOpened) {
    FileAttributeStore store(test_dir_);
    ASSERT_OK(store.Write(LayerId{"bad", 0},
                          LayerHeader{"geotrellis.spark.GridKey", kTileClass, "file"},
                          LayerMetadataToJson(testutil::MakeTwoTileMetadata())));

    ASSERT_OK_AND_ASSIGN(auto relation, LayerRelation::Open(test_dir_, LayerId{"bad", 0}));
    EXPECT_TRUE(IsUnsupportedKeyType(relation.Scan({"tile"}).status()));
}

TEST_F(FileCatalogTest, MissingTileFileFailsOnFirstBatch) {
    FileAttributeStore store(test_dir_);
    ASSERT_OK(store.Write(LayerId{"L1", 0}, MakeLayerHeader(KeyVariant::kSpatial, "file"),
                          LayerMetadataToJson(testutil::MakeTwoTileMetadata())));

    ASSERT_OK_AND_ASSIGN(auto relation, LayerRelation::Open(test_dir_, LayerId{"L1", 0}));
    ASSERT_OK_AND_ASSIGN(auto scan, relation.Scan({"spatial_key"}));
    auto batch = scan->GetNextBatch();
    ASSERT_FALSE(batch.ok());
    EXPECT_TRUE(batch.status().IsIOError());
}

TEST(OpenCatalogTest, SchemeHandling) {
    ASSERT_OK_AND_ASSIGN(auto file, OpenCatalog("file:///tmp/catalog"));
    EXPECT_EQ(file->uri, "file:///tmp/catalog");
    ASSERT_NE(file->layer_reader, nullptr);

    EXPECT_TRUE(OpenCatalog("s3://bucket/catalog").status().IsNotImplemented());
    EXPECT_TRUE(OpenCatalog("file://").status().IsInvalid());
}

} // namespace
} // namespace raster_ql
