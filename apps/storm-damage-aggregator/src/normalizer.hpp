#ifndef STORM_DAMAGE_AGGREGATOR_NORMALIZER_HPP
#define STORM_DAMAGE_AGGREGATOR_NORMALIZER_HPP

#include <map>
#include <string>
#include <vector>

#include "types.hpp"

namespace stormagg {

// Suffix letter -> multiplier applied to the numeral in front of it.
struct ScaleTable {
  std::map<char, double> factors;

  static ScaleTable defaults();
};

// Expands an encoded damage string such as "2.5M" into 2500000.
// Blank, "nan", "0", "0.00" and any single-character string map to zero.
// Throws MalformedMagnitudeError for everything else that does not end in a
// suffix from `scales` preceded by a non-negative numeral.
double normalizeMagnitude(const std::string& raw, const ScaleTable& scales);

std::vector<NormalizedEvent> normalizeEvents(const std::vector<JoinedEvent>& events, const ScaleTable& scales);

} // namespace stormagg

#endif
