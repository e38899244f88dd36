#ifndef STORM_DAMAGE_AGGREGATOR_COORDINATOR_HPP
#define STORM_DAMAGE_AGGREGATOR_COORDINATOR_HPP

#include <string>
#include <vector>

#include "joiner.hpp"
#include "metrics.hpp"
#include "pipeline.hpp"
#include "regions.hpp"
#include "types.hpp"

namespace stormagg {

struct PipelineConfig {
  std::string locations_file;
  std::string details_file;
  std::string output_file;
  RegionSource regions;
  FieldSelection fields;
  JoinSuffixes suffixes;
  StageOptions stages;
};

// Reads both feeds and the region layer, runs the stages and writes one row
// per region. Nothing is written when any stage fails.
class PipelineCoordinator {
 public:
  explicit PipelineCoordinator(PipelineConfig config);

  // 0 on success, 1 after reporting a fatal error on stderr.
  int run(Metrics& metrics);

  // Same as run() but propagates fatal errors and returns the rows instead
  // of writing them.
  std::vector<DominantCategory> compute(Metrics& metrics);

 private:
  RegionLayer loadRegions(Metrics& metrics) const;

  PipelineConfig config_;
};

} // namespace stormagg

#endif
