#include "aggregator.hpp"

namespace stormagg {

void CategoryTotals::add(const LocatedEvent& located) {
  sums_[{located.region_id, located.event.event_type}] += located.event.damage_property;
}

void CategoryTotals::addAll(const std::vector<LocatedEvent>& located) {
  for (const auto& event : located) {
    add(event);
  }
}

void CategoryTotals::merge(const CategoryTotals& other) {
  for (const auto& [key, sum] : other.sums_) {
    sums_[key] += sum;
  }
}

std::vector<RegionCategoryTotal> CategoryTotals::rows() const {
  std::vector<RegionCategoryTotal> totals;
  totals.reserve(sums_.size());
  for (const auto& [key, sum] : sums_) {
    RegionCategoryTotal total;
    total.region_id = key.first;
    total.event_type = key.second;
    total.mag = sum;
    totals.push_back(std::move(total));
  }
  return totals;
}

std::vector<RegionCategoryTotal> aggregate(const std::vector<LocatedEvent>& located) {
  CategoryTotals totals;
  totals.addAll(located);
  return totals.rows();
}

} // namespace stormagg
