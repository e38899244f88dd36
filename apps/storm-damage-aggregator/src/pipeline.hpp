#ifndef STORM_DAMAGE_AGGREGATOR_PIPELINE_HPP
#define STORM_DAMAGE_AGGREGATOR_PIPELINE_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "aggregator.hpp"
#include "locator.hpp"
#include "metrics.hpp"
#include "normalizer.hpp"
#include "regions.hpp"
#include "types.hpp"

namespace stormagg {

// Upper bound on locator threads; larger requests are clamped.
constexpr std::size_t kMaxWorkers = 256;

struct StageOptions {
  // CRS of event coordinates; the region layer must already be in it.
  std::string events_crs = "EPSG:4326";
  ScaleTable scales = ScaleTable::defaults();
  std::size_t workers = 1;
  std::size_t batch_size = 1024;
  std::size_t queue_size = 64;
};

// Locates `events` on `workers` threads and merges their partial totals.
// Rethrows the first worker failure after all threads have joined.
CategoryTotals locateAndAggregate(
  const std::vector<NormalizedEvent>& events,
  const RegionIndex& index,
  const StageOptions& options,
  Metrics& metrics
);

// normalize -> locate -> aggregate -> select over already joined events.
std::vector<DominantCategory> runStages(
  const std::vector<JoinedEvent>& joined,
  const RegionLayer& regions,
  const StageOptions& options,
  Metrics& metrics
);

// The whole pipeline over in-memory feeds.
std::vector<DominantCategory> runPipeline(
  const std::vector<EventLocation>& locations,
  const std::vector<EventDetail>& details,
  const RegionLayer& regions,
  const StageOptions& options,
  Metrics& metrics
);

} // namespace stormagg

#endif
