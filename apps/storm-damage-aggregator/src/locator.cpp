#include "locator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <geos/algorithm/locate/SimplePointInAreaLocator.h>
#include <geos/geom/Coordinate.h>
#include <geos/geom/Envelope.h>
#include <geos/geom/Location.h>

namespace stormagg {

RegionIndex::RegionIndex(const RegionLayer& layer) : layer_(layer) {
  for (const auto& region : layer_.regions) {
    tree_.insert(region.geometry->getEnvelopeInternal(), const_cast<RegionPolygon*>(&region));
  }
  tree_.build();
}

std::vector<const RegionPolygon*> RegionIndex::regionsAt(double x, double y) const {
  const geos::geom::Envelope query(x, x, y, y);
  std::vector<void*> hits;
  {
    const std::lock_guard<std::mutex> lock(tree_mutex_);
    tree_.query(&query, hits);
  }

  const geos::geom::Coordinate point(x, y);
  std::vector<const RegionPolygon*> regions;
  for (void* hit : hits) {
    const auto* region = static_cast<const RegionPolygon*>(hit);
    const auto location =
      geos::algorithm::locate::SimplePointInAreaLocator::locate(point, region->geometry.get());
    if (location != geos::geom::Location::EXTERIOR) {
      regions.push_back(region);
    }
  }
  // Tree order is unspecified; regions live in one vector, so address order is layer order.
  std::sort(regions.begin(), regions.end());
  return regions;
}

std::size_t locateRange(
  const std::vector<NormalizedEvent>& events,
  std::size_t begin,
  std::size_t end,
  const RegionIndex& index,
  std::vector<LocatedEvent>& out
) {
  std::size_t unmatched = 0;
  for (std::size_t i = begin; i < end && i < events.size(); i += 1) {
    const NormalizedEvent& event = events[i];
    if (!std::isfinite(event.latitude) || !std::isfinite(event.longitude)) {
      unmatched += 1;
      continue;
    }
    const auto regions = index.regionsAt(event.longitude, event.latitude);
    if (regions.empty()) {
      unmatched += 1;
      continue;
    }
    for (const RegionPolygon* region : regions) {
      LocatedEvent located;
      located.event = event;
      located.region_id = region->region_id;
      out.push_back(std::move(located));
    }
  }
  return unmatched;
}

std::vector<LocatedEvent> locate(
  const std::vector<NormalizedEvent>& events,
  const RegionIndex& index,
  const std::string& events_crs
) {
  requireSameCrs(events_crs, index.layer());
  std::vector<LocatedEvent> located;
  located.reserve(events.size());
  locateRange(events, 0, events.size(), index, located);
  return located;
}

std::vector<LocatedEvent> locate(
  const std::vector<NormalizedEvent>& events,
  const RegionLayer& regions,
  const std::string& events_crs
) {
  requireSameCrs(events_crs, regions);
  const RegionIndex index(regions);
  return locate(events, index, events_crs);
}

} // namespace stormagg
