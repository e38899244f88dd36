#ifndef STORM_DAMAGE_AGGREGATOR_LOCATOR_HPP
#define STORM_DAMAGE_AGGREGATOR_LOCATOR_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <geos/index/strtree/STRtree.h>

#include "regions.hpp"
#include "types.hpp"

namespace stormagg {

// Envelope R-tree over a region layer. The layer must outlive the index.
class RegionIndex {
 public:
  explicit RegionIndex(const RegionLayer& layer);

  RegionIndex(const RegionIndex&) = delete;
  RegionIndex& operator=(const RegionIndex&) = delete;

  const RegionLayer& layer() const { return layer_; }

  // Regions whose polygon intersects (x, y), boundary included, in layer order.
  std::vector<const RegionPolygon*> regionsAt(double x, double y) const;

 private:
  const RegionLayer& layer_;
  // STRtree::query is not const; queries are serialized.
  mutable geos::index::strtree::STRtree tree_;
  mutable std::mutex tree_mutex_;
};

// Locates events[begin, end): appends one LocatedEvent per (event,
// intersecting region) and returns how many events intersected no region.
// Events with non-finite coordinates intersect nothing.
std::size_t locateRange(
  const std::vector<NormalizedEvent>& events,
  std::size_t begin,
  std::size_t end,
  const RegionIndex& index,
  std::vector<LocatedEvent>& out
);

// Throws CrsMismatchError when the region layer is not in `events_crs`.
std::vector<LocatedEvent> locate(
  const std::vector<NormalizedEvent>& events,
  const RegionIndex& index,
  const std::string& events_crs
);

std::vector<LocatedEvent> locate(
  const std::vector<NormalizedEvent>& events,
  const RegionLayer& regions,
  const std::string& events_crs
);

} // namespace stormagg

#endif
