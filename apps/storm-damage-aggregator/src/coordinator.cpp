#include "coordinator.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "io/results.hpp"
#include "io/table.hpp"

namespace stormagg {

PipelineCoordinator::PipelineCoordinator(PipelineConfig config) : config_(std::move(config)) {}

int PipelineCoordinator::run(Metrics& metrics) {
  metrics.markStart();

  std::vector<DominantCategory> dominant;
  try {
    dominant = compute(metrics);
  } catch (const std::exception& error) {
    metrics.markEnd();
    std::cerr << "Error: " << error.what() << "\n";
    return 1;
  }

  const auto write_start = std::chrono::steady_clock::now();
  if (!writeDominantCategoriesFile(config_.output_file, dominant)) {
    metrics.markEnd();
    return 1;
  }
  metrics.addRegionsWritten(static_cast<std::int64_t>(dominant.size()));
  metrics.addWriteProcessing(elapsedMs(write_start));
  std::cout << "Wrote " << dominant.size() << " regions to " << config_.output_file << "\n";

  metrics.markEnd();
  return 0;
}

std::vector<DominantCategory> PipelineCoordinator::compute(Metrics& metrics) {
  const auto load_start = std::chrono::steady_clock::now();
  const Table locations = readCsvFile(config_.locations_file, config_.fields.locationColumns());
  metrics.addLocationsRead(static_cast<std::int64_t>(locations.rows.size()));
  std::cout << "Loaded " << locations.rows.size() << " locations from " << config_.locations_file << "\n";

  const Table details = readCsvFile(config_.details_file, config_.fields.detailColumns());
  metrics.addDetailsRead(static_cast<std::int64_t>(details.rows.size()));
  std::cout << "Loaded " << details.rows.size() << " details from " << config_.details_file << "\n";
  metrics.addLoadProcessing(elapsedMs(load_start));

  const RegionLayer regions = loadRegions(metrics);

  const auto join_start = std::chrono::steady_clock::now();
  JoinStats stats;
  const Table merged = innerJoin(locations, details, config_.fields.event_id, config_.suffixes, &stats);
  const std::vector<JoinedEvent> joined = joinedEventsFromTable(merged, config_.fields);
  metrics.addJoined(static_cast<std::int64_t>(joined.size()));
  metrics.addUnmatchedLocations(static_cast<std::int64_t>(stats.unmatched_left));
  metrics.addUnmatchedDetails(static_cast<std::int64_t>(stats.unmatched_right));
  metrics.addJoinProcessing(elapsedMs(join_start));
  std::cout << "Joined " << joined.size() << " events (" << stats.unmatched_left << " locations and "
            << stats.unmatched_right << " details without a partner)\n";

  return runStages(joined, regions, config_.stages, metrics);
}

RegionLayer PipelineCoordinator::loadRegions(Metrics& metrics) const {
  const auto load_start = std::chrono::steady_clock::now();
  RegionLayer regions = loadRegionLayer(config_.regions);
  std::cout << "Loaded " << regions.regions.size() << " regions from " << config_.regions.path << " ("
            << regions.crs << ")\n";

  if (!sameCrs(regions.crs, config_.stages.events_crs)) {
    std::cout << "Reprojecting regions from " << regions.crs << " to " << config_.stages.events_crs << "\n";
    regions = reprojectRegionLayer(regions, config_.stages.events_crs);
  }
  metrics.addRegionsLoaded(static_cast<std::int64_t>(regions.regions.size()));
  metrics.addLoadProcessing(elapsedMs(load_start));
  return regions;
}

} // namespace stormagg
