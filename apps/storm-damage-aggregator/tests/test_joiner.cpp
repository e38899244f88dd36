// =============================================================================
// Event joiner
// =============================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "errors.hpp"
#include "joiner.hpp"

using namespace stormagg;

namespace {

EventLocation location(const std::string& id, double latitude, double longitude) {
    EventLocation row;
    row.event_id = id;
    row.latitude = latitude;
    row.longitude = longitude;
    return row;
}

EventDetail detail(const std::string& id, const std::string& type, const std::string& damage) {
    EventDetail row;
    row.event_id = id;
    row.event_type = type;
    row.damage_property = damage;
    return row;
}

} // namespace

TEST(JoinerTest, InnerJoinDropsKeysPresentOnOneSide) {
    const std::vector<EventLocation> locations = {location("1", 10, 20)};
    const std::vector<EventDetail> details = {detail("1", "Hail", "1K"), detail("2", "Flood", "2K")};

    JoinStats stats;
    const auto joined = join(locations, details, &stats);

    ASSERT_EQ(joined.size(), 1u);
    EXPECT_EQ(joined[0].event_id, "1");
    EXPECT_DOUBLE_EQ(joined[0].latitude, 10.0);
    EXPECT_DOUBLE_EQ(joined[0].longitude, 20.0);
    EXPECT_EQ(joined[0].event_type, "Hail");
    EXPECT_EQ(joined[0].damage_property_raw, "1K");
    EXPECT_EQ(stats.unmatched_left, 0u);
    EXPECT_EQ(stats.unmatched_right, 1u);
}

TEST(JoinerTest, DuplicateKeysProduceEveryPairing) {
    const std::vector<EventLocation> locations = {location("7", 1, 1), location("7", 2, 2), location("9", 3, 3)};
    const std::vector<EventDetail> details = {detail("7", "Hail", "1K"), detail("7", "Tornado", "2M")};

    JoinStats stats;
    const auto joined = join(locations, details, &stats);

    ASSERT_EQ(joined.size(), 4u);
    EXPECT_DOUBLE_EQ(joined[0].latitude, 1.0);
    EXPECT_EQ(joined[0].event_type, "Hail");
    EXPECT_DOUBLE_EQ(joined[1].latitude, 1.0);
    EXPECT_EQ(joined[1].event_type, "Tornado");
    EXPECT_DOUBLE_EQ(joined[2].latitude, 2.0);
    EXPECT_EQ(joined[2].event_type, "Hail");
    EXPECT_EQ(stats.unmatched_left, 1u);
    EXPECT_EQ(stats.unmatched_right, 0u);
}

TEST(JoinerTest, EmptyInputsJoinToNothing) {
    EXPECT_TRUE(join({}, {detail("1", "Hail", "1K")}).empty());
    EXPECT_TRUE(join({location("1", 0, 0)}, {}).empty());
}

TEST(JoinerTest, TableJoinSuffixesCollidingColumns) {
    Table left;
    left.columns = {"EVENT_ID", "LATITUDE", "SOURCE"};
    left.rows = {{"1", "10", "radar"}, {"3", "30", "radar"}};
    Table right;
    right.columns = {"SOURCE", "EVENT_ID", "EVENT_TYPE"};
    right.rows = {{"spotter", "1", "Hail"}, {"public", "2", "Flood"}};

    JoinStats stats;
    const Table joined = innerJoin(left, right, "EVENT_ID", JoinSuffixes(), &stats);

    const std::vector<std::string> expected_columns = {"EVENT_ID", "LATITUDE", "SOURCE_p", "SOURCE_d", "EVENT_TYPE"};
    EXPECT_EQ(joined.columns, expected_columns);
    ASSERT_EQ(joined.rows.size(), 1u);
    const std::vector<std::string> expected_row = {"1", "10", "radar", "spotter", "Hail"};
    EXPECT_EQ(joined.rows[0], expected_row);
    EXPECT_EQ(stats.unmatched_left, 1u);
    EXPECT_EQ(stats.unmatched_right, 1u);
}

TEST(JoinerTest, CustomSuffixes) {
    Table left;
    left.columns = {"EVENT_ID", "X"};
    left.rows = {{"1", "a"}};
    Table right;
    right.columns = {"EVENT_ID", "X"};
    right.rows = {{"1", "b"}};

    JoinSuffixes suffixes;
    suffixes.left = "_loc";
    suffixes.right = "_det";
    const Table joined = innerJoin(left, right, "EVENT_ID", suffixes);

    const std::vector<std::string> expected_columns = {"EVENT_ID", "X_loc", "X_det"};
    EXPECT_EQ(joined.columns, expected_columns);
    EXPECT_THROW(innerJoin(left, right, "MISSING"), InputError);
}

TEST(JoinerTest, JoinedTableConvertsToTypedEvents) {
    FieldSelection fields;
    Table locations;
    locations.columns = fields.locationColumns();
    locations.rows = {{"1", "35.5", "-97.25"}, {"2", "", "-90"}};
    Table details;
    details.columns = fields.detailColumns();
    details.rows = {{"1", "Hail", "1K"}, {"2", "Flood", "0"}};

    const auto events = joinedEventsFromTable(innerJoin(locations, details, fields.event_id), fields);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].event_id, "1");
    EXPECT_DOUBLE_EQ(events[0].latitude, 35.5);
    EXPECT_DOUBLE_EQ(events[0].longitude, -97.25);
    EXPECT_EQ(events[0].event_type, "Hail");
    EXPECT_EQ(events[0].damage_property_raw, "1K");
    EXPECT_TRUE(std::isnan(events[1].latitude));

    locations.rows[1][1] = "north";
    EXPECT_THROW(joinedEventsFromTable(innerJoin(locations, details, fields.event_id), fields), InputError);
}
