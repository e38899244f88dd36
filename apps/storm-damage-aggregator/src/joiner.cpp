#include "joiner.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <limits>
#include <unordered_map>
#include <utility>

#include "errors.hpp"

namespace stormagg {

namespace {

template <typename Left, typename Right, typename LeftKey, typename RightKey, typename Emit>
void hashJoin(
  const std::vector<Left>& left,
  const std::vector<Right>& right,
  LeftKey left_key,
  RightKey right_key,
  Emit emit,
  JoinStats* stats
) {
  std::unordered_map<std::string, std::vector<std::size_t>> index;
  index.reserve(right.size());
  for (std::size_t i = 0; i < right.size(); i += 1) {
    index[right_key(right[i])].push_back(i);
  }

  std::vector<bool> right_matched(right.size(), false);
  std::size_t unmatched_left = 0;
  for (const auto& row : left) {
    const auto match = index.find(left_key(row));
    if (match == index.end()) {
      unmatched_left += 1;
      continue;
    }
    for (const std::size_t i : match->second) {
      right_matched[i] = true;
      emit(row, right[i]);
    }
  }

  if (stats != nullptr) {
    stats->unmatched_left = unmatched_left;
    stats->unmatched_right = static_cast<std::size_t>(std::count(right_matched.begin(), right_matched.end(), false));
  }
}

double parseCoordinate(const std::string& text, const std::string& field, const std::string& event_id) {
  if (text.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const char* start = text.c_str();
  char* end = nullptr;
  const double value = std::strtod(start, &end);
  if (end == start || *end != '\0') {
    throw InputError("Invalid " + field + " '" + text + "' for event " + event_id);
  }
  return value;
}

} // namespace

std::vector<std::string> FieldSelection::locationColumns() const {
  return {event_id, latitude, longitude};
}

std::vector<std::string> FieldSelection::detailColumns() const {
  return {event_id, event_type, damage_property};
}

Table innerJoin(
  const Table& left,
  const Table& right,
  const std::string& key,
  const JoinSuffixes& suffixes,
  JoinStats* stats
) {
  const std::size_t left_key = left.columnIndex(key);
  const std::size_t right_key = right.columnIndex(key);

  std::vector<std::size_t> left_fields;
  std::vector<std::size_t> right_fields;
  Table joined;
  joined.columns.push_back(key);
  for (std::size_t i = 0; i < left.columns.size(); i += 1) {
    if (i == left_key) {
      continue;
    }
    const std::string& name = left.columns[i];
    left_fields.push_back(i);
    joined.columns.push_back(right.hasColumn(name) ? name + suffixes.left : name);
  }
  for (std::size_t i = 0; i < right.columns.size(); i += 1) {
    if (i == right_key) {
      continue;
    }
    const std::string& name = right.columns[i];
    right_fields.push_back(i);
    joined.columns.push_back(left.hasColumn(name) ? name + suffixes.right : name);
  }

  using Row = std::vector<std::string>;
  hashJoin(
    left.rows,
    right.rows,
    [left_key](const Row& row) -> const std::string& { return row[left_key]; },
    [right_key](const Row& row) -> const std::string& { return row[right_key]; },
    [&](const Row& l, const Row& r) {
      Row out;
      out.reserve(joined.columns.size());
      out.push_back(l[left_key]);
      for (const std::size_t i : left_fields) {
        out.push_back(l[i]);
      }
      for (const std::size_t i : right_fields) {
        out.push_back(r[i]);
      }
      joined.rows.push_back(std::move(out));
    },
    stats
  );
  return joined;
}

std::vector<JoinedEvent> join(
  const std::vector<EventLocation>& locations,
  const std::vector<EventDetail>& details,
  JoinStats* stats
) {
  std::vector<JoinedEvent> joined;
  hashJoin(
    locations,
    details,
    [](const EventLocation& location) -> const std::string& { return location.event_id; },
    [](const EventDetail& detail) -> const std::string& { return detail.event_id; },
    [&joined](const EventLocation& location, const EventDetail& detail) {
      JoinedEvent event;
      event.event_id = location.event_id;
      event.latitude = location.latitude;
      event.longitude = location.longitude;
      event.event_type = detail.event_type;
      event.damage_property_raw = detail.damage_property;
      joined.push_back(std::move(event));
    },
    stats
  );
  return joined;
}

std::vector<JoinedEvent> joinedEventsFromTable(const Table& joined, const FieldSelection& fields) {
  const std::size_t id = joined.columnIndex(fields.event_id);
  const std::size_t latitude = joined.columnIndex(fields.latitude);
  const std::size_t longitude = joined.columnIndex(fields.longitude);
  const std::size_t event_type = joined.columnIndex(fields.event_type);
  const std::size_t damage = joined.columnIndex(fields.damage_property);

  std::vector<JoinedEvent> events;
  events.reserve(joined.rows.size());
  for (const auto& row : joined.rows) {
    JoinedEvent event;
    event.event_id = row[id];
    event.latitude = parseCoordinate(row[latitude], fields.latitude, row[id]);
    event.longitude = parseCoordinate(row[longitude], fields.longitude, row[id]);
    event.event_type = row[event_type];
    event.damage_property_raw = row[damage];
    events.push_back(std::move(event));
  }
  return events;
}

} // namespace stormagg
