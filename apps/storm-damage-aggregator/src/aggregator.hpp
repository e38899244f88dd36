#ifndef STORM_DAMAGE_AGGREGATOR_AGGREGATOR_HPP
#define STORM_DAMAGE_AGGREGATOR_AGGREGATOR_HPP

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace stormagg {

// Running sums keyed by (region_id, event_type). Partial tables built on
// different workers combine with merge().
class CategoryTotals {
 public:
  void add(const LocatedEvent& located);
  void addAll(const std::vector<LocatedEvent>& located);
  void merge(const CategoryTotals& other);

  std::size_t size() const { return sums_.size(); }

  // Sorted by region_id, then event_type.
  std::vector<RegionCategoryTotal> rows() const;

 private:
  std::map<std::pair<std::string, std::string>, double> sums_;
};

std::vector<RegionCategoryTotal> aggregate(const std::vector<LocatedEvent>& located);

} // namespace stormagg

#endif
