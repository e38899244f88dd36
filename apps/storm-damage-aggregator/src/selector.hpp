#ifndef STORM_DAMAGE_AGGREGATOR_SELECTOR_HPP
#define STORM_DAMAGE_AGGREGATOR_SELECTOR_HPP

#include <vector>

#include "types.hpp"

namespace stormagg {

// One row per region: the category with the largest mag. An exact tie goes
// to the lexicographically smallest event_type. Sorted by region_id.
std::vector<DominantCategory> selectDominant(const std::vector<RegionCategoryTotal>& totals);

} // namespace stormagg

#endif
