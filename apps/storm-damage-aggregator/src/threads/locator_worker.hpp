#ifndef STORM_DAMAGE_AGGREGATOR_LOCATOR_WORKER_HPP
#define STORM_DAMAGE_AGGREGATOR_LOCATOR_WORKER_HPP

#include <exception>
#include <vector>

#include "../aggregator.hpp"
#include "../locator.hpp"
#include "../metrics.hpp"
#include "../queue.hpp"
#include "../types.hpp"

namespace stormagg {

// Locates every batch popped from `input` and folds the located rows into
// this worker's private `totals`. An exception is stored in `failure` and
// cancels the queue so the other workers stop too.
void locatorThread(
  const std::vector<NormalizedEvent>& events,
  const RegionIndex& index,
  BlockingQueue<EventBatch>& input,
  CategoryTotals& totals,
  Metrics& metrics,
  std::exception_ptr& failure
);

} // namespace stormagg

#endif
