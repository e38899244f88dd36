#ifndef STORM_DAMAGE_AGGREGATOR_FETCH_HPP
#define STORM_DAMAGE_AGGREGATOR_FETCH_HPP

#include <iosfwd>
#include <string>
#include <vector>

#include "../io/table.hpp"
#include "../joiner.hpp"

namespace stormagg {

struct FetchConfig {
  std::string base_url = "https://www.ncei.noaa.gov/pub/data/swdi/stormevents/csvfiles/";
  std::string output_dir = ".";
  int retries = 3;
  long timeout_sec = 120;
  FieldSelection fields;
};

// File names starting with "StormEvents" found in an HTML directory
// listing, in listing order, without duplicates.
std::vector<std::string> parseListing(const std::string& html);

// "StormEvents_details-ftp_v1.0_d1950_c2021.csv.gz" -> "details".
// Empty when the name has no '_'.
std::string classifyFile(const std::string& file_name);

// Inflates a gzip member. Throws FetchError on corrupt input.
std::string gunzip(const std::string& compressed);

// GET with the configured timeout, retrying with exponential backoff.
// Throws FetchError after the last attempt.
std::string downloadWithRetry(const std::string& url, const FetchConfig& config);

// Appends the rows of `table` restricted to `columns`, writing the header
// first when `write_header` is set.
void appendColumns(std::ostream& output, const Table& table, const std::vector<std::string>& columns, bool write_header);

// Lists the remote directory, downloads every details/locations file and
// concatenates their relevant columns into details_all.csv and
// locations_all.csv under output_dir. Returns a process exit code.
int runFetch(const FetchConfig& config);

} // namespace stormagg

#endif
