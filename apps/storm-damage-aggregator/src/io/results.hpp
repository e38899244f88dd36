#ifndef STORM_DAMAGE_AGGREGATOR_IO_RESULTS_HPP
#define STORM_DAMAGE_AGGREGATOR_IO_RESULTS_HPP

#include <iosfwd>
#include <string>
#include <vector>

#include "../types.hpp"

namespace stormagg {

// Writes `id,EVENT_TYPE,mag` rows. mag keeps enough digits to read back
// the exact double.
void writeDominantCategories(std::ostream& output, const std::vector<DominantCategory>& rows);

// Returns false, after reporting on stderr, when the file cannot be written.
bool writeDominantCategoriesFile(const std::string& output_file, const std::vector<DominantCategory>& rows);

} // namespace stormagg

#endif
