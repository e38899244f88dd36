#include "normalizer.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>

#include "errors.hpp"

namespace stormagg {

namespace {

constexpr const char* kDamageField = "DAMAGE_PROPERTY";

bool isZeroSentinel(const std::string& value) {
  return value.empty() || value == "nan" || value == "NaN" || value == "0" || value == "0.00" || value.size() == 1;
}

bool parseNumeral(const std::string& text, double& out) {
  if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
    return false;
  }
  const char* start = text.c_str();
  char* end = nullptr;
  const double parsed = std::strtod(start, &end);
  if (end == start || *end != '\0') {
    return false;
  }
  if (!std::isfinite(parsed) || parsed < 0.0) {
    return false;
  }
  out = parsed;
  return true;
}

double expand(const std::string& raw, const ScaleTable& scales, const std::string& event_id) {
  if (isZeroSentinel(raw)) {
    return 0.0;
  }

  const auto scale = scales.factors.find(raw.back());
  if (scale == scales.factors.end()) {
    throw MalformedMagnitudeError(raw, event_id, kDamageField);
  }

  double numeral = 0.0;
  if (!parseNumeral(raw.substr(0, raw.size() - 1), numeral)) {
    throw MalformedMagnitudeError(raw, event_id, kDamageField);
  }
  return numeral * scale->second;
}

} // namespace

ScaleTable ScaleTable::defaults() {
  ScaleTable table;
  table.factors = {{'K', 1e3}, {'M', 1e6}, {'B', 1e9}};
  return table;
}

double normalizeMagnitude(const std::string& raw, const ScaleTable& scales) {
  return expand(raw, scales, std::string());
}

std::vector<NormalizedEvent> normalizeEvents(const std::vector<JoinedEvent>& events, const ScaleTable& scales) {
  std::vector<NormalizedEvent> normalized;
  normalized.reserve(events.size());
  for (const auto& joined : events) {
    NormalizedEvent event;
    event.event_id = joined.event_id;
    event.latitude = joined.latitude;
    event.longitude = joined.longitude;
    event.event_type = joined.event_type;
    event.damage_property = expand(joined.damage_property_raw, scales, joined.event_id);
    normalized.push_back(std::move(event));
  }
  return normalized;
}

} // namespace stormagg
