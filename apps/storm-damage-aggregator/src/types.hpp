#ifndef STORM_DAMAGE_AGGREGATOR_TYPES_HPP
#define STORM_DAMAGE_AGGREGATOR_TYPES_HPP

#include <cstddef>
#include <string>

namespace stormagg {

struct EventLocation {
  std::string event_id;
  double latitude = 0.0;
  double longitude = 0.0;
};

struct EventDetail {
  std::string event_id;
  std::string event_type;
  std::string damage_property;
};

struct JoinedEvent {
  std::string event_id;
  double latitude = 0.0;
  double longitude = 0.0;
  std::string event_type;
  std::string damage_property_raw;
};

// damage_property is the expanded magnitude, always >= 0.
struct NormalizedEvent {
  std::string event_id;
  double latitude = 0.0;
  double longitude = 0.0;
  std::string event_type;
  double damage_property = 0.0;
};

// Half-open slice [begin, end) of the normalized events handed to one
// locator worker.
struct EventBatch {
  std::size_t begin = 0;
  std::size_t end = 0;
};

struct LocatedEvent {
  NormalizedEvent event;
  std::string region_id;
};

struct RegionCategoryTotal {
  std::string region_id;
  std::string event_type;
  double mag = 0.0;
};

struct DominantCategory {
  std::string region_id;
  std::string event_type;
  double mag = 0.0;
};

} // namespace stormagg

#endif
