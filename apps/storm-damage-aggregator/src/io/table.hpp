#ifndef STORM_DAMAGE_AGGREGATOR_IO_TABLE_HPP
#define STORM_DAMAGE_AGGREGATOR_IO_TABLE_HPP

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace stormagg {

// Column-named table of raw string cells, as read from a CSV feed.
struct Table {
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;

  bool hasColumn(const std::string& name) const;
  // Throws InputError when the column is missing.
  std::size_t columnIndex(const std::string& name) const;
};

// Reads a CSV document with a header row. Quoted fields may contain commas,
// doubled quotes and line breaks. When `select` is non-empty only those
// columns are kept, in that order; a missing one raises InputError.
Table readCsv(std::istream& input, const std::vector<std::string>& select = {});
Table readCsvFile(const std::string& path, const std::vector<std::string>& select = {});

Table selectColumns(const Table& table, const std::vector<std::string>& names);

void writeCsvRow(std::ostream& output, const std::vector<std::string>& cells);

} // namespace stormagg

#endif
