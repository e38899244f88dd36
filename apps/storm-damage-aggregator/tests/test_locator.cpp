// =============================================================================
// Region layer and spatial locator
// =============================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "locator.hpp"
#include "regions.hpp"

using namespace stormagg;

namespace {

const char* kWgs84 = "EPSG:4326";

NormalizedEvent eventAt(const std::string& id, double latitude, double longitude, double damage = 1000.0) {
    NormalizedEvent event;
    event.event_id = id;
    event.latitude = latitude;
    event.longitude = longitude;
    event.event_type = "Hail";
    event.damage_property = damage;
    return event;
}

// Two unit squares sharing the edge x = 1.
RegionLayer adjacentSquares() {
    return regionLayerFromWkt(
        {
            {"A", "POLYGON((0 0, 1 0, 1 1, 0 1, 0 0))"},
            {"B", "POLYGON((1 0, 2 0, 2 1, 1 1, 1 0))"},
        },
        kWgs84);
}

} // namespace

class LocatorTest : public ::testing::Test {
protected:
    RegionLayer layer = adjacentSquares();
};

TEST_F(LocatorTest, InteriorPointFindsItsRegion) {
    const auto located = locate({eventAt("E1", 0.5, 0.25)}, layer, kWgs84);
    ASSERT_EQ(located.size(), 1u);
    EXPECT_EQ(located[0].region_id, "A");
    EXPECT_EQ(located[0].event.event_id, "E1");
    EXPECT_DOUBLE_EQ(located[0].event.damage_property, 1000.0);
}

// A point on the shared edge intersects both squares.
TEST_F(LocatorTest, SharedBoundaryFansOut) {
    const auto located = locate({eventAt("E1", 0.5, 1.0)}, layer, kWgs84);
    ASSERT_EQ(located.size(), 2u);
    EXPECT_EQ(located[0].region_id, "A");
    EXPECT_EQ(located[1].region_id, "B");
    EXPECT_EQ(located[0].event.event_id, located[1].event.event_id);
}

TEST_F(LocatorTest, OuterBoundaryAndCornerCount) {
    const auto corner = locate({eventAt("E1", 0.0, 0.0)}, layer, kWgs84);
    ASSERT_EQ(corner.size(), 1u);
    EXPECT_EQ(corner[0].region_id, "A");

    const auto edge = locate({eventAt("E2", 1.0, 1.5)}, layer, kWgs84);
    ASSERT_EQ(edge.size(), 1u);
    EXPECT_EQ(edge[0].region_id, "B");
}

TEST_F(LocatorTest, PointsOutsideEveryRegionAreDropped) {
    const std::vector<NormalizedEvent> events = {
        eventAt("in", 0.5, 0.5),
        eventAt("out", 5.0, 5.0),
        eventAt("nan", std::numeric_limits<double>::quiet_NaN(), 0.5),
    };
    const RegionIndex index(layer);
    std::vector<LocatedEvent> located;
    const std::size_t unmatched = locateRange(events, 0, events.size(), index, located);

    EXPECT_EQ(unmatched, 2u);
    ASSERT_EQ(located.size(), 1u);
    EXPECT_EQ(located[0].event.event_id, "in");
}

TEST_F(LocatorTest, LongitudeIsXAndLatitudeIsY) {
    const RegionLayer wide = regionLayerFromWkt({{"W", "POLYGON((10 0, 20 0, 20 5, 10 5, 10 0))"}}, kWgs84);
    EXPECT_EQ(locate({eventAt("E1", 2.0, 15.0)}, wide, kWgs84).size(), 1u);
    EXPECT_TRUE(locate({eventAt("E2", 15.0, 2.0)}, wide, kWgs84).empty());
}

TEST_F(LocatorTest, OverlappingRegionsEachGetARow) {
    const RegionLayer overlapping = regionLayerFromWkt(
        {
            {"big", "POLYGON((0 0, 10 0, 10 10, 0 10, 0 0))"},
            {"small", "POLYGON((4 4, 6 4, 6 6, 4 6, 4 4))"},
            {"far", "POLYGON((50 50, 60 50, 60 60, 50 60, 50 50))"},
        },
        kWgs84);
    const RegionIndex index(overlapping);
    const auto regions = index.regionsAt(5.0, 5.0);
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0]->region_id, "big");
    EXPECT_EQ(regions[1]->region_id, "small");
}

TEST_F(LocatorTest, MultiPolygonRegion) {
    const RegionLayer islands = regionLayerFromWkt(
        {{"I", "MULTIPOLYGON(((0 0, 1 0, 1 1, 0 1, 0 0)), ((5 5, 6 5, 6 6, 5 6, 5 5)))"}}, kWgs84);
    EXPECT_EQ(locate({eventAt("E1", 5.5, 5.5)}, islands, kWgs84).size(), 1u);
    EXPECT_TRUE(locate({eventAt("E2", 3.0, 3.0)}, islands, kWgs84).empty());
}

TEST_F(LocatorTest, CrsMismatchIsFatal) {
    RegionLayer projected = adjacentSquares();
    projected.crs = "EPSG:3857";
    EXPECT_THROW(locate({eventAt("E1", 0.5, 0.5)}, projected, kWgs84), CrsMismatchError);

    RegionLayer unknown = adjacentSquares();
    unknown.crs.clear();
    EXPECT_THROW(locate({eventAt("E1", 0.5, 0.5)}, unknown, kWgs84), CrsMismatchError);
}

TEST_F(LocatorTest, ReprojectionBringsRegionsIntoEventCrs) {
    // Web Mercator square covering roughly 0..10 degrees of longitude and latitude.
    const RegionLayer mercator = regionLayerFromWkt(
        {{"M", "POLYGON((0 0, 1113194.9079 0, 1113194.9079 1118889.9749, 0 1118889.9749, 0 0))"}}, "EPSG:3857");

    const RegionLayer geographic = reprojectRegionLayer(mercator, kWgs84);
    EXPECT_EQ(geographic.crs, kWgs84);
    ASSERT_EQ(geographic.regions.size(), 1u);
    EXPECT_EQ(geographic.regions[0].region_id, "M");

    const auto inside = locate({eventAt("E1", 5.0, 5.0)}, geographic, kWgs84);
    ASSERT_EQ(inside.size(), 1u);
    EXPECT_EQ(inside[0].region_id, "M");
    EXPECT_TRUE(locate({eventAt("E2", 11.0, 5.0)}, geographic, kWgs84).empty());
}

TEST(RegionLayerTest, RejectsBadGeometryAndDuplicateIds) {
    EXPECT_THROW(regionLayerFromWkt({{"A", "POLYGON((0 0, 1 0"}}, kWgs84), InputError);
    EXPECT_THROW(regionLayerFromWkt({{"A", "POINT(1 1)"}}, kWgs84), InputError);
    EXPECT_THROW(
        regionLayerFromWkt(
            {{"A", "POLYGON((0 0, 1 0, 1 1, 0 0))"}, {"A", "POLYGON((2 2, 3 2, 3 3, 2 2))"}}, kWgs84),
        InputError);
}

TEST(RegionLayerTest, LoadsRegionTableWithWktGeometry) {
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "stormagg_regions_test.csv";
    {
        std::ofstream output(path);
        output << "id,geometry\n"
               << "10,\"POLYGON((0 0, 1 0, 1 1, 0 1, 0 0))\"\n"
               << "11,\"POLYGON((1 0, 2 0, 2 1, 1 1, 1 0))\"\n";
    }

    RegionSource source;
    source.path = path.string();
    source.crs = kWgs84;
    const RegionLayer loaded = loadRegionLayer(source);
    ASSERT_EQ(loaded.regions.size(), 2u);
    EXPECT_EQ(loaded.regions[0].region_id, "10");
    EXPECT_EQ(loaded.regions[1].region_id, "11");
    EXPECT_EQ(loaded.crs, kWgs84);

    source.crs.clear();
    EXPECT_THROW(loadRegionLayer(source), CrsMismatchError);

    std::filesystem::remove(path);
}

TEST(RegionLayerTest, MissingDatasetIsAnInputError) {
    RegionSource source;
    source.path = "/nonexistent/conus_grid.gpkg";
    EXPECT_THROW(loadRegionLayer(source), InputError);
}
