#include "results.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

#include "table.hpp"

namespace stormagg {

namespace {

std::string formatMagnitude(double mag) {
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<double>::max_digits10) << mag;
  return out.str();
}

} // namespace

void writeDominantCategories(std::ostream& output, const std::vector<DominantCategory>& rows) {
  writeCsvRow(output, {"id", "EVENT_TYPE", "mag"});
  for (const auto& row : rows) {
    writeCsvRow(output, {row.region_id, row.event_type, formatMagnitude(row.mag)});
  }
}

bool writeDominantCategoriesFile(const std::string& output_file, const std::vector<DominantCategory>& rows) {
  std::ofstream output(output_file);
  if (!output.is_open()) {
    std::cerr << "Failed to open output file: " << output_file << "\n";
    return false;
  }

  writeDominantCategories(output, rows);
  output.flush();
  if (!output) {
    std::cerr << "Failed to write output file: " << output_file << "\n";
    return false;
  }
  return true;
}

} // namespace stormagg
