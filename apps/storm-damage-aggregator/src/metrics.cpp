#include "metrics.hpp"

namespace stormagg
{

  void Metrics::markStart()
  {
    start_ = std::chrono::steady_clock::now();
    started_ = true;
  }

  void Metrics::markEnd()
  {
    end_ = std::chrono::steady_clock::now();
    ended_ = true;
  }

  void Metrics::addLocationsRead(std::int64_t count)
  {
    locations_read_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addDetailsRead(std::int64_t count)
  {
    details_read_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addRegionsLoaded(std::int64_t count)
  {
    regions_loaded_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addJoined(std::int64_t count)
  {
    joined_events_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addUnmatchedLocations(std::int64_t count)
  {
    unmatched_locations_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addUnmatchedDetails(std::int64_t count)
  {
    unmatched_details_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addLocated(std::int64_t count)
  {
    located_events_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addUnlocated(std::int64_t count)
  {
    unlocated_events_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addAggregatedGroups(std::int64_t count)
  {
    aggregated_groups_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addRegionsWritten(std::int64_t count)
  {
    regions_written_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addLoadProcessing(double ms)
  {
    load_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
  }

  void Metrics::addJoinProcessing(double ms)
  {
    join_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
  }

  void Metrics::addNormalizeProcessing(double ms)
  {
    normalize_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
  }

  void Metrics::addLocateProcessing(double ms)
  {
    locate_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
  }

  void Metrics::addAggregateProcessing(double ms)
  {
    aggregate_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
  }

  void Metrics::addSelectProcessing(double ms)
  {
    select_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
  }

  void Metrics::addWriteProcessing(double ms)
  {
    write_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
  }

  void Metrics::addQueueOverhead(double ms)
  {
    queue_overhead_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
  }

  MetricsSnapshot Metrics::snapshot() const
  {
    MetricsSnapshot snapshot;
    snapshot.locations_read = locations_read_.load(std::memory_order_relaxed);
    snapshot.details_read = details_read_.load(std::memory_order_relaxed);
    snapshot.regions_loaded = regions_loaded_.load(std::memory_order_relaxed);
    snapshot.joined_events = joined_events_.load(std::memory_order_relaxed);
    snapshot.unmatched_locations = unmatched_locations_.load(std::memory_order_relaxed);
    snapshot.unmatched_details = unmatched_details_.load(std::memory_order_relaxed);
    snapshot.located_events = located_events_.load(std::memory_order_relaxed);
    snapshot.unlocated_events = unlocated_events_.load(std::memory_order_relaxed);
    snapshot.aggregated_groups = aggregated_groups_.load(std::memory_order_relaxed);
    snapshot.regions_written = regions_written_.load(std::memory_order_relaxed);
    snapshot.load_processing_ms = load_processing_us_.load(std::memory_order_relaxed) / 1000.0;
    snapshot.join_processing_ms = join_processing_us_.load(std::memory_order_relaxed) / 1000.0;
    snapshot.normalize_processing_ms = normalize_processing_us_.load(std::memory_order_relaxed) / 1000.0;
    snapshot.locate_processing_ms = locate_processing_us_.load(std::memory_order_relaxed) / 1000.0;
    snapshot.aggregate_processing_ms = aggregate_processing_us_.load(std::memory_order_relaxed) / 1000.0;
    snapshot.select_processing_ms = select_processing_us_.load(std::memory_order_relaxed) / 1000.0;
    snapshot.write_processing_ms = write_processing_us_.load(std::memory_order_relaxed) / 1000.0;
    snapshot.queue_overhead_ms = queue_overhead_us_.load(std::memory_order_relaxed) / 1000.0;

    if (started_ && ended_)
    {
      const auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(end_ - start_);
      snapshot.duration_sec = duration.count();
      if (snapshot.duration_sec > 0.0)
      {
        snapshot.throughput_per_sec = snapshot.located_events / snapshot.duration_sec;
      }
    }

    return snapshot;
  }

} // namespace stormagg
