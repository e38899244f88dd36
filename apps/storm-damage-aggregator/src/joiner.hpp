#ifndef STORM_DAMAGE_AGGREGATOR_JOINER_HPP
#define STORM_DAMAGE_AGGREGATOR_JOINER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "io/table.hpp"
#include "types.hpp"

namespace stormagg {

// Column names used by the two input feeds.
struct FieldSelection {
  std::string event_id = "EVENT_ID";
  std::string latitude = "LATITUDE";
  std::string longitude = "LONGITUDE";
  std::string event_type = "EVENT_TYPE";
  std::string damage_property = "DAMAGE_PROPERTY";

  std::vector<std::string> locationColumns() const;
  std::vector<std::string> detailColumns() const;
};

// Appended to a non-key column name present in both tables.
struct JoinSuffixes {
  std::string left = "_p";
  std::string right = "_d";
};

// Rows dropped by an inner join because their key had no partner.
struct JoinStats {
  std::size_t unmatched_left = 0;
  std::size_t unmatched_right = 0;
};

// Inner join on `key`. Every pair of rows sharing a key is emitted, in left
// row order and then right row order. The key column appears once, first;
// other columns follow left then right.
Table innerJoin(
  const Table& left,
  const Table& right,
  const std::string& key,
  const JoinSuffixes& suffixes = {},
  JoinStats* stats = nullptr
);

std::vector<JoinedEvent> join(
  const std::vector<EventLocation>& locations,
  const std::vector<EventDetail>& details,
  JoinStats* stats = nullptr
);

// Converts the output of innerJoin over the two feeds into typed events.
// Blank coordinates become NaN; other unparseable coordinates raise InputError.
std::vector<JoinedEvent> joinedEventsFromTable(const Table& joined, const FieldSelection& fields);

} // namespace stormagg

#endif
