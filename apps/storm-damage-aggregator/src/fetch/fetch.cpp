#include "fetch.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <regex>
#include <sstream>
#include <thread>
#include <unordered_set>

#include <curl/curl.h>
#include <zlib.h>

#include "../errors.hpp"

namespace stormagg {

namespace {

constexpr int kRetryMinSeconds = 1;
constexpr int kRetryMaxSeconds = 15;
constexpr std::size_t kInflateChunk = 64 * 1024;

struct KindOutput {
  std::vector<std::string> columns;
  std::ofstream stream;
  bool header_written = false;
};

std::size_t appendToString(void* contents, std::size_t size, std::size_t nmemb, std::string* output) {
  const std::size_t total_size = size * nmemb;
  output->append(static_cast<char*>(contents), total_size);
  return total_size;
}

bool httpGet(const std::string& url, long timeout_sec, std::string& response, std::string& error) {
  CURL* curl = curl_easy_init();
  if (!curl) {
    error = "curl_easy_init failed";
    return false;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendToString);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);

  const CURLcode res = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    error = curl_easy_strerror(res);
    return false;
  }
  // Non-HTTP schemes such as file:// report no status code.
  if (http_code != 0 && http_code != 200) {
    error = "HTTP status " + std::to_string(http_code);
    return false;
  }
  return true;
}

} // namespace

std::vector<std::string> parseListing(const std::string& html) {
  static const std::regex kEntry(R"(>\s*(StormEvents[^<>\s"]*)\s*<)");

  std::vector<std::string> files;
  std::unordered_set<std::string> seen;
  for (auto it = std::sregex_iterator(html.begin(), html.end(), kEntry); it != std::sregex_iterator(); ++it) {
    std::string name = (*it)[1].str();
    if (seen.insert(name).second) {
      files.push_back(std::move(name));
    }
  }
  return files;
}

std::string classifyFile(const std::string& file_name) {
  const std::size_t underscore = file_name.find('_');
  if (underscore == std::string::npos) {
    return std::string();
  }
  const std::string token = file_name.substr(underscore + 1, file_name.find('_', underscore + 1) - underscore - 1);
  return token.substr(0, token.find('-'));
}

std::string gunzip(const std::string& compressed) {
  z_stream stream{};
  // 16 + MAX_WBITS selects the gzip wrapper.
  if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
    throw FetchError("inflateInit2 failed");
  }
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  stream.avail_in = static_cast<uInt>(compressed.size());

  std::string inflated;
  std::vector<char> buffer(kInflateChunk);
  int status = Z_OK;
  do {
    stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
    stream.avail_out = static_cast<uInt>(buffer.size());
    status = inflate(&stream, Z_NO_FLUSH);
    if (status != Z_OK && status != Z_STREAM_END) {
      const std::string reason = stream.msg != nullptr ? stream.msg : zError(status);
      inflateEnd(&stream);
      throw FetchError("Corrupt gzip data: " + reason);
    }
    inflated.append(buffer.data(), buffer.size() - stream.avail_out);
  } while (status != Z_STREAM_END);

  inflateEnd(&stream);
  return inflated;
}

std::string downloadWithRetry(const std::string& url, const FetchConfig& config) {
  const int attempts = std::max(config.retries, 0) + 1;
  int delay_seconds = kRetryMinSeconds;
  std::string error;
  for (int attempt = 1; attempt <= attempts; attempt += 1) {
    std::string response;
    if (httpGet(url, config.timeout_sec, response, error)) {
      return response;
    }
    if (attempt == attempts) {
      break;
    }
    std::cerr << "Download of " << url << " failed (" << error << "), retrying in " << delay_seconds
              << " seconds..." << std::endl;
    std::this_thread::sleep_for(std::chrono::seconds(delay_seconds));
    delay_seconds = std::min(delay_seconds * 2, kRetryMaxSeconds);
  }
  throw FetchError("Download of " + url + " failed after " + std::to_string(attempts) + " attempts: " + error);
}

void appendColumns(std::ostream& output, const Table& table, const std::vector<std::string>& columns, bool write_header) {
  const Table selected = selectColumns(table, columns);
  if (write_header) {
    writeCsvRow(output, selected.columns);
  }
  for (const auto& row : selected.rows) {
    writeCsvRow(output, row);
  }
}

int runFetch(const FetchConfig& config) {
  try {
    std::filesystem::create_directories(config.output_dir);

    std::map<std::string, KindOutput> outputs;
    outputs["details"].columns = config.fields.detailColumns();
    outputs["locations"].columns = config.fields.locationColumns();
    for (auto& [kind, output] : outputs) {
      const std::filesystem::path path = std::filesystem::path(config.output_dir) / (kind + "_all.csv");
      output.stream.open(path);
      if (!output.stream.is_open()) {
        std::cerr << "Failed to open output file: " << path.string() << "\n";
        return 1;
      }
    }

    std::cout << "Listing " << config.base_url << std::endl;
    const std::vector<std::string> files = parseListing(downloadWithRetry(config.base_url, config));

    for (std::size_t i = 0; i < files.size(); i += 1) {
      std::cout << i << " / " << files.size() << std::endl;
      const auto output = outputs.find(classifyFile(files[i]));
      if (output == outputs.end()) {
        continue;
      }

      const std::string csv = gunzip(downloadWithRetry(config.base_url + files[i], config));
      std::istringstream input(csv);
      Table table;
      try {
        table = readCsv(input, output->second.columns);
      } catch (const InputError& error) {
        throw InputError(files[i] + ": " + error.what());
      }
      appendColumns(output->second.stream, table, output->second.columns, !output->second.header_written);
      output->second.header_written = true;
    }

    for (auto& [kind, output] : outputs) {
      output.stream.flush();
      if (!output.stream) {
        std::cerr << "Failed to write " << kind << "_all.csv\n";
        return 1;
      }
    }
  } catch (const std::exception& error) {
    std::cerr << "Error: " << error.what() << "\n";
    return 1;
  }
  return 0;
}

} // namespace stormagg
