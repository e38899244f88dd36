#include "selector.hpp"

#include <map>
#include <string>
#include <utility>

namespace stormagg {

namespace {

bool beats(const RegionCategoryTotal& candidate, const RegionCategoryTotal& current) {
  if (candidate.mag != current.mag) {
    return candidate.mag > current.mag;
  }
  return candidate.event_type < current.event_type;
}

} // namespace

std::vector<DominantCategory> selectDominant(const std::vector<RegionCategoryTotal>& totals) {
  std::map<std::string, const RegionCategoryTotal*> best;
  for (const auto& total : totals) {
    auto [entry, inserted] = best.emplace(total.region_id, &total);
    if (!inserted && beats(total, *entry->second)) {
      entry->second = &total;
    }
  }

  std::vector<DominantCategory> dominant;
  dominant.reserve(best.size());
  for (const auto& [region_id, total] : best) {
    DominantCategory row;
    row.region_id = region_id;
    row.event_type = total->event_type;
    row.mag = total->mag;
    dominant.push_back(std::move(row));
  }
  return dominant;
}

} // namespace stormagg
