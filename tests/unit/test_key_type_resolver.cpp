/**
 * Unit Tests for Key-Type Resolution
 *
 * Tests mapping of declared key/value class names to layer variants
 * and the error codes raised for unsupported representations.
 */

#include "test_util.h"
#include <raster_ql/layer/key_type_resolver.h>
#include <raster_ql/util/status.h>

namespace raster_ql {

TEST(KeyTypeResolverTest, SpaceTimeKeyResolvesToSpaceTime) {
    ASSERT_OK_AND_ASSIGN(auto variant, ResolveKeyVariant("SpaceTimeKey"));
    EXPECT_EQ(variant, KeyVariant::kSpaceTime);
}

TEST(KeyTypeResolverTest, SpatialKeyResolvesToSpatial) {
    ASSERT_OK_AND_ASSIGN(auto variant, ResolveKeyVariant("SpatialKey"));
    EXPECT_EQ(variant, KeyVariant::kSpatial);
}

TEST(KeyTypeResolverTest, QualifiedClassNamesResolve) {
    ASSERT_OK_AND_ASSIGN(auto space_time, ResolveKeyVariant(kSpaceTimeKeyClass));
    EXPECT_EQ(space_time, KeyVariant::kSpaceTime);

    ASSERT_OK_AND_ASSIGN(auto spatial, ResolveKeyVariant(kSpatialKeyClass));
    EXPECT_EQ(spatial, KeyVariant::kSpatial);

    ASSERT_OK_AND_ASSIGN(auto value, ResolveValueVariant(kTileClass));
    EXPECT_EQ(value, ValueVariant::kTile);
}

TEST(KeyTypeResolverTest, UnknownKeyClassFails) {
    auto result = ResolveKeyVariant("GridKey");
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(result.status().IsNotImplemented());
    EXPECT_TRUE(IsUnsupportedKeyType(result.status()));
    EXPECT_NE(result.status().message().find("GridKey"), std::string::npos);
}

TEST(KeyTypeResolverTest, MatchIsOnWholeSimpleName) {
    EXPECT_TRUE(IsUnsupportedKeyType(ResolveKeyVariant("SpatialKeyV2").status()));
    EXPECT_TRUE(IsUnsupportedKeyType(ResolveKeyVariant("spatialkey").status()));
    EXPECT_TRUE(IsUnsupportedKeyType(ResolveKeyVariant("").status()));
}

TEST(KeyTypeResolverTest, UnknownValueClassFails) {
    auto result = ResolveValueVariant("MultibandTile");
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsUnsupportedValueType(result.status()));
    EXPECT_FALSE(IsUnsupportedKeyType(result.status()));
}

TEST(KeyTypeResolverTest, KeyIsCheckedBeforeValue) {
    LayerHeader header{"GridKey", "MultibandTile", "memory"};
    auto result = ResolveLayerType(header);
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsUnsupportedKeyType(result.status()));
}

TEST(KeyTypeResolverTest, ResolveLayerType) {
    ASSERT_OK_AND_ASSIGN(auto resolved,
                         ResolveLayerType(LayerHeader{"SpaceTimeKey", "Tile", "file"}));
    EXPECT_EQ(resolved.key_variant, KeyVariant::kSpaceTime);
    EXPECT_EQ(resolved.value_variant, ValueVariant::kTile);
}

TEST(KeyTypeResolverTest, WrittenHeadersResolveBack) {
    for (KeyVariant variant : {KeyVariant::kSpatial, KeyVariant::kSpaceTime}) {
        LayerHeader header = MakeLayerHeader(variant, "memory");
        EXPECT_EQ(header.format, "memory");
        ASSERT_OK_AND_ASSIGN(auto resolved, ResolveLayerType(header));
        EXPECT_EQ(resolved.key_variant, variant);
    }
}

TEST(StatusTest, DomainErrorsCarryDetail) {
    auto status = UnknownColumn("bogus", {"spatial_key", "extent", "tile"});
    EXPECT_TRUE(status.IsKeyError());
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kUnknownColumn);
    EXPECT_NE(status.message().find("bogus"), std::string::npos);

    auto filter = UnsupportedFilter("tile intersects POINT(0 0)");
    EXPECT_TRUE(filter.IsInvalid());
    EXPECT_TRUE(IsUnsupportedFilter(filter));
}

TEST(StatusTest, PlainStatusesHaveNoCode) {
    EXPECT_FALSE(GetErrorCode(arrow::Status::OK()).has_value());
    EXPECT_FALSE(GetErrorCode(arrow::Status::KeyError("missing")).has_value());
    EXPECT_FALSE(IsUnknownColumn(arrow::Status::KeyError("missing")));
}

} // namespace raster_ql
