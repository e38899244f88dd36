#include "locator_worker.hpp"

#include <chrono>
#include <cstdint>

namespace stormagg {

void locatorThread(
  const std::vector<NormalizedEvent>& events,
  const RegionIndex& index,
  BlockingQueue<EventBatch>& input,
  CategoryTotals& totals,
  Metrics& metrics,
  std::exception_ptr& failure
) {
  try {
    std::vector<LocatedEvent> located;
    EventBatch batch;
    while (true) {
      const auto queue_start = std::chrono::steady_clock::now();
      if (!input.pop(batch)) {
        break;
      }
      metrics.addQueueOverhead(elapsedMs(queue_start));

      const auto locate_start = std::chrono::steady_clock::now();
      located.clear();
      const std::size_t unmatched = locateRange(events, batch.begin, batch.end, index, located);
      metrics.addLocated(static_cast<std::int64_t>(located.size()));
      metrics.addUnlocated(static_cast<std::int64_t>(unmatched));
      metrics.addLocateProcessing(elapsedMs(locate_start));

      const auto aggregate_start = std::chrono::steady_clock::now();
      totals.addAll(located);
      metrics.addAggregateProcessing(elapsedMs(aggregate_start));
    }
  } catch (const std::exception&) {
    failure = std::current_exception();
    input.cancel();
  }
}

} // namespace stormagg
