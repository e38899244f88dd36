#include "pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <thread>

#include "joiner.hpp"
#include "queue.hpp"
#include "selector.hpp"
#include "threads/batcher.hpp"
#include "threads/locator_worker.hpp"

namespace stormagg {

CategoryTotals locateAndAggregate(
  const std::vector<NormalizedEvent>& events,
  const RegionIndex& index,
  const StageOptions& options,
  Metrics& metrics
) {
  const std::size_t worker_count = std::min(std::max<std::size_t>(options.workers, 1), kMaxWorkers);
  BlockingQueue<EventBatch> batch_queue(options.queue_size);
  std::vector<CategoryTotals> partials(worker_count);
  std::vector<std::exception_ptr> failures(worker_count);

  std::thread batcher_thread;
  std::vector<std::thread> locator_threads;
  try {
    locator_threads.reserve(worker_count);
    batcher_thread = std::thread(batcherThread, events.size(), options.batch_size, std::ref(batch_queue));
    for (std::size_t i = 0; i < worker_count; i += 1) {
      locator_threads.emplace_back(
        locatorThread,
        std::cref(events),
        std::cref(index),
        std::ref(batch_queue),
        std::ref(partials[i]),
        std::ref(metrics),
        std::ref(failures[i])
      );
    }
  } catch (const std::exception&) {
    // Threads already running must be joined before unwinding past them.
    batch_queue.cancel();
    if (batcher_thread.joinable()) {
      batcher_thread.join();
    }
    for (auto& thread : locator_threads) {
      thread.join();
    }
    throw;
  }

  batcher_thread.join();
  for (auto& thread : locator_threads) {
    thread.join();
  }

  for (const auto& failure : failures) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }

  const auto merge_start = std::chrono::steady_clock::now();
  CategoryTotals totals;
  for (const auto& partial : partials) {
    totals.merge(partial);
  }
  metrics.addAggregateProcessing(elapsedMs(merge_start));
  metrics.addAggregatedGroups(static_cast<std::int64_t>(totals.size()));
  return totals;
}

std::vector<DominantCategory> runStages(
  const std::vector<JoinedEvent>& joined,
  const RegionLayer& regions,
  const StageOptions& options,
  Metrics& metrics
) {
  const auto normalize_start = std::chrono::steady_clock::now();
  const std::vector<NormalizedEvent> events = normalizeEvents(joined, options.scales);
  metrics.addNormalizeProcessing(elapsedMs(normalize_start));

  requireSameCrs(options.events_crs, regions);
  const RegionIndex index(regions);
  const CategoryTotals totals = locateAndAggregate(events, index, options, metrics);

  const auto select_start = std::chrono::steady_clock::now();
  std::vector<DominantCategory> dominant = selectDominant(totals.rows());
  metrics.addSelectProcessing(elapsedMs(select_start));
  return dominant;
}

std::vector<DominantCategory> runPipeline(
  const std::vector<EventLocation>& locations,
  const std::vector<EventDetail>& details,
  const RegionLayer& regions,
  const StageOptions& options,
  Metrics& metrics
) {
  metrics.addLocationsRead(static_cast<std::int64_t>(locations.size()));
  metrics.addDetailsRead(static_cast<std::int64_t>(details.size()));
  metrics.addRegionsLoaded(static_cast<std::int64_t>(regions.regions.size()));

  const auto join_start = std::chrono::steady_clock::now();
  JoinStats stats;
  const std::vector<JoinedEvent> joined = join(locations, details, &stats);
  metrics.addJoined(static_cast<std::int64_t>(joined.size()));
  metrics.addUnmatchedLocations(static_cast<std::int64_t>(stats.unmatched_left));
  metrics.addUnmatchedDetails(static_cast<std::int64_t>(stats.unmatched_right));
  metrics.addJoinProcessing(elapsedMs(join_start));

  return runStages(joined, regions, options, metrics);
}

} // namespace stormagg
