// =============================================================================
// Dominant category selection
// =============================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "selector.hpp"

using namespace stormagg;

namespace {

RegionCategoryTotal total(const std::string& region, const std::string& type, double mag) {
    RegionCategoryTotal row;
    row.region_id = region;
    row.event_type = type;
    row.mag = mag;
    return row;
}

} // namespace

TEST(SelectorTest, PicksLargestMagnitude) {
    const auto dominant = selectDominant({total("A", "Hail", 500.0), total("A", "Flood", 1500.0)});
    ASSERT_EQ(dominant.size(), 1u);
    EXPECT_EQ(dominant[0].region_id, "A");
    EXPECT_EQ(dominant[0].event_type, "Flood");
    EXPECT_DOUBLE_EQ(dominant[0].mag, 1500.0);
}

TEST(SelectorTest, OneRowPerRegionSortedById) {
    const auto dominant = selectDominant({
        total("B", "Hail", 1.0),
        total("A", "Tornado", 7.0),
        total("B", "Flood", 3.0),
        total("A", "Hail", 2.0),
        total("C", "Drought", 0.0),
    });
    ASSERT_EQ(dominant.size(), 3u);
    EXPECT_EQ(dominant[0].region_id, "A");
    EXPECT_EQ(dominant[0].event_type, "Tornado");
    EXPECT_EQ(dominant[1].region_id, "B");
    EXPECT_EQ(dominant[1].event_type, "Flood");
    EXPECT_EQ(dominant[2].region_id, "C");
    EXPECT_EQ(dominant[2].event_type, "Drought");
}

// Exact ties go to the lexicographically smallest category, whatever the input order.
TEST(SelectorTest, TiesResolveToSmallestCategoryName) {
    const auto forward = selectDominant({total("A", "Tornado", 100.0), total("A", "Hail", 100.0)});
    const auto reverse = selectDominant({total("A", "Hail", 100.0), total("A", "Tornado", 100.0)});
    ASSERT_EQ(forward.size(), 1u);
    ASSERT_EQ(reverse.size(), 1u);
    EXPECT_EQ(forward[0].event_type, "Hail");
    EXPECT_EQ(reverse[0].event_type, "Hail");
}

TEST(SelectorTest, EmptyTotalsSelectNothing) {
    EXPECT_TRUE(selectDominant({}).empty());
}
