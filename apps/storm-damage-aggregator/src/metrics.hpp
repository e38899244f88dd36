#ifndef STORM_DAMAGE_AGGREGATOR_METRICS_HPP
#define STORM_DAMAGE_AGGREGATOR_METRICS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace stormagg
{

  struct MetricsSnapshot
  {
    std::int64_t locations_read = 0;
    std::int64_t details_read = 0;
    std::int64_t regions_loaded = 0;
    std::int64_t joined_events = 0;
    std::int64_t unmatched_locations = 0;
    std::int64_t unmatched_details = 0;
    std::int64_t located_events = 0;
    std::int64_t unlocated_events = 0;
    std::int64_t aggregated_groups = 0;
    std::int64_t regions_written = 0;
    double throughput_per_sec = 0.0;
    double duration_sec = 0.0;
    double load_processing_ms = 0.0;
    double join_processing_ms = 0.0;
    double normalize_processing_ms = 0.0;
    double locate_processing_ms = 0.0;
    double aggregate_processing_ms = 0.0;
    double select_processing_ms = 0.0;
    double write_processing_ms = 0.0;
    double queue_overhead_ms = 0.0;
  };

  // Counters are updated from locator workers; everything else from the
  // coordinating thread.
  class Metrics
  {
  public:
    void markStart();
    void markEnd();

    void addLocationsRead(std::int64_t count);
    void addDetailsRead(std::int64_t count);
    void addRegionsLoaded(std::int64_t count);
    void addJoined(std::int64_t count);
    void addUnmatchedLocations(std::int64_t count);
    void addUnmatchedDetails(std::int64_t count);
    void addLocated(std::int64_t count);
    void addUnlocated(std::int64_t count);
    void addAggregatedGroups(std::int64_t count);
    void addRegionsWritten(std::int64_t count);

    void addLoadProcessing(double ms);
    void addJoinProcessing(double ms);
    void addNormalizeProcessing(double ms);
    void addLocateProcessing(double ms);
    void addAggregateProcessing(double ms);
    void addSelectProcessing(double ms);
    void addWriteProcessing(double ms);
    void addQueueOverhead(double ms);

    MetricsSnapshot snapshot() const;

  private:
    std::atomic<std::int64_t> locations_read_{0};
    std::atomic<std::int64_t> details_read_{0};
    std::atomic<std::int64_t> regions_loaded_{0};
    std::atomic<std::int64_t> joined_events_{0};
    std::atomic<std::int64_t> unmatched_locations_{0};
    std::atomic<std::int64_t> unmatched_details_{0};
    std::atomic<std::int64_t> located_events_{0};
    std::atomic<std::int64_t> unlocated_events_{0};
    std::atomic<std::int64_t> aggregated_groups_{0};
    std::atomic<std::int64_t> regions_written_{0};
    std::atomic<std::int64_t> load_processing_us_{0};
    std::atomic<std::int64_t> join_processing_us_{0};
    std::atomic<std::int64_t> normalize_processing_us_{0};
    std::atomic<std::int64_t> locate_processing_us_{0};
    std::atomic<std::int64_t> aggregate_processing_us_{0};
    std::atomic<std::int64_t> select_processing_us_{0};
    std::atomic<std::int64_t> write_processing_us_{0};
    std::atomic<std::int64_t> queue_overhead_us_{0};
    std::chrono::steady_clock::time_point start_{};
    std::chrono::steady_clock::time_point end_{};
    bool started_ = false;
    bool ended_ = false;
  };

  // Milliseconds elapsed since `start`.
  inline double elapsedMs(std::chrono::steady_clock::time_point start)
  {
    return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
               std::chrono::steady_clock::now() - start)
        .count();
  }

} // namespace stormagg

#endif
