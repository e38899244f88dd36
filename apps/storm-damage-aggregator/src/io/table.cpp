#include "table.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <utility>

#include "../errors.hpp"

namespace stormagg {

namespace {

// Splits one CSV record, pulling further physical lines while a quoted field
// is still open. Returns false at end of input.
bool readRecord(std::istream& input, std::vector<std::string>& cells, std::size_t& line_number) {
  cells.clear();
  std::string line;
  do {
    if (!std::getline(input, line)) {
      return false;
    }
    line_number += 1;
  } while (line.empty() || line == "\r");

  std::string cell;
  bool quoted = false;
  while (true) {
    for (std::size_t i = 0; i < line.size(); i += 1) {
      const char c = line[i];
      if (quoted) {
        if (c != '"') {
          cell += c;
        } else if (i + 1 < line.size() && line[i + 1] == '"') {
          cell += '"';
          i += 1;
        } else {
          quoted = false;
        }
      } else if (c == '"') {
        quoted = true;
      } else if (c == ',') {
        cells.push_back(std::move(cell));
        cell.clear();
      } else if (c == '\r' && i + 1 == line.size()) {
        continue;
      } else {
        cell += c;
      }
    }
    if (!quoted) {
      break;
    }
    if (!std::getline(input, line)) {
      throw InputError("Unterminated quoted field at line " + std::to_string(line_number));
    }
    line_number += 1;
    cell += '\n';
  }
  cells.push_back(std::move(cell));
  return true;
}

bool needsQuoting(const std::string& cell) {
  return cell.find_first_of(",\"\r\n") != std::string::npos;
}

} // namespace

bool Table::hasColumn(const std::string& name) const {
  for (const auto& column : columns) {
    if (column == name) {
      return true;
    }
  }
  return false;
}

std::size_t Table::columnIndex(const std::string& name) const {
  for (std::size_t i = 0; i < columns.size(); i += 1) {
    if (columns[i] == name) {
      return i;
    }
  }
  throw InputError("Missing column: " + name);
}

Table readCsv(std::istream& input, const std::vector<std::string>& select) {
  Table table;
  std::size_t line_number = 0;
  if (!readRecord(input, table.columns, line_number)) {
    throw InputError("CSV input has no header row");
  }
  if (!table.columns.empty() && table.columns.front().rfind("\xEF\xBB\xBF", 0) == 0) {
    table.columns.front().erase(0, 3);
  }

  std::vector<std::size_t> picked;
  if (!select.empty()) {
    picked.reserve(select.size());
    for (const auto& name : select) {
      picked.push_back(table.columnIndex(name));
    }
  }

  std::vector<std::string> cells;
  while (readRecord(input, cells, line_number)) {
    if (cells.size() != table.columns.size()) {
      throw InputError(
        "Line " + std::to_string(line_number) + " has " + std::to_string(cells.size()) + " fields, expected " +
        std::to_string(table.columns.size())
      );
    }
    if (picked.empty()) {
      table.rows.push_back(cells);
      continue;
    }
    std::vector<std::string> row;
    row.reserve(picked.size());
    for (const std::size_t index : picked) {
      row.push_back(std::move(cells[index]));
    }
    table.rows.push_back(std::move(row));
  }

  if (!select.empty()) {
    table.columns = select;
  }
  return table;
}

Table readCsvFile(const std::string& path, const std::vector<std::string>& select) {
  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    throw InputError("Failed to open input file: " + path);
  }
  try {
    return readCsv(input, select);
  } catch (const InputError& error) {
    throw InputError(path + ": " + error.what());
  }
}

Table selectColumns(const Table& table, const std::vector<std::string>& names) {
  std::vector<std::size_t> picked;
  picked.reserve(names.size());
  for (const auto& name : names) {
    picked.push_back(table.columnIndex(name));
  }

  Table selected;
  selected.columns = names;
  selected.rows.reserve(table.rows.size());
  for (const auto& source : table.rows) {
    std::vector<std::string> row;
    row.reserve(picked.size());
    for (const std::size_t index : picked) {
      row.push_back(source[index]);
    }
    selected.rows.push_back(std::move(row));
  }
  return selected;
}

void writeCsvRow(std::ostream& output, const std::vector<std::string>& cells) {
  for (std::size_t i = 0; i < cells.size(); i += 1) {
    if (i > 0) {
      output << ',';
    }
    const std::string& cell = cells[i];
    if (!needsQuoting(cell)) {
      output << cell;
      continue;
    }
    output << '"';
    for (const char c : cell) {
      if (c == '"') {
        output << '"';
      }
      output << c;
    }
    output << '"';
  }
  output << '\n';
}

} // namespace stormagg
