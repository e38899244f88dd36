#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include <curl/curl.h>

#include "coordinator.hpp"
#include "fetch/fetch.hpp"
#include "metrics.hpp"

namespace
{

  void printUsage()
  {
    std::cout
        << "Usage: storm-damage-aggregator <command> [options]\n\n"
        << "Commands:\n"
        << "  aggregate            Join, locate and aggregate storm events per region\n"
        << "  fetch                Download and merge the storm event CSV feeds\n\n"
        << "Aggregate options:\n"
        << "  --locations <file>   Locations CSV (EVENT_ID, LATITUDE, LONGITUDE)\n"
        << "  --details <file>     Details CSV (EVENT_ID, EVENT_TYPE, DAMAGE_PROPERTY)\n"
        << "  --regions <file>     Region polygons (any GDAL vector dataset, or CSV with WKT)\n"
        << "  --output <file>      Output file (default: aggregated.csv)\n"
        << "  --region-layer <n>   Layer inside the region dataset (default: first)\n"
        << "  --region-id <field>  Region id field (default: id)\n"
        << "  --regions-crs <crs>  CRS of a CSV region table\n"
        << "  --crs <crs>          CRS of event coordinates (default: EPSG:4326)\n"
        << "  --workers <number>   Locator worker threads (default: CPU count)\n"
        << "  --batch-size <num>   Events per worker batch (default: 1024)\n"
        << "  --queue-size <num>   Max queued batches (default: 64)\n\n"
        << "Fetch options:\n"
        << "  --base-url <url>     Directory listing to download from\n"
        << "  --output-dir <dir>   Where details_all.csv and locations_all.csv go (default: .)\n"
        << "  --retries <number>   Retries per download (default: 3)\n"
        << "  --timeout <seconds>  Per-request timeout (default: 120)\n\n"
        << "  -h, --help           Show this help message\n";
  }

  bool parseSize(const std::string &value, std::size_t &out)
  {
    char *end = nullptr;
    const long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0' || parsed <= 0)
    {
      return false;
    }
    out = static_cast<std::size_t>(parsed);
    return true;
  }

  // Fetches the value following argv[i] into `out`, advancing i.
  bool takeValue(int argc, char **argv, int &i, std::string &out, std::string &error)
  {
    if (i + 1 >= argc)
    {
      error = std::string("Missing value for ") + argv[i];
      return false;
    }
    out = argv[i + 1];
    i += 1;
    return true;
  }

  bool takeSize(int argc, char **argv, int &i, std::size_t &out, std::string &error)
  {
    const std::string flag = argv[i];
    std::string value;
    if (!takeValue(argc, argv, i, value, error))
    {
      return false;
    }
    if (!parseSize(value, out))
    {
      error = "Invalid value for " + flag;
      return false;
    }
    return true;
  }

  bool parseAggregateArguments(int argc, char **argv, stormagg::PipelineConfig &config, std::string &error)
  {
    for (int i = 2; i < argc; i += 1)
    {
      const std::string arg = argv[i];
      bool ok = true;

      if (arg == "--help" || arg == "-h")
      {
        printUsage();
        std::exit(0);
      }
      else if (arg == "--locations")
      {
        ok = takeValue(argc, argv, i, config.locations_file, error);
      }
      else if (arg == "--details")
      {
        ok = takeValue(argc, argv, i, config.details_file, error);
      }
      else if (arg == "--regions")
      {
        ok = takeValue(argc, argv, i, config.regions.path, error);
      }
      else if (arg == "--output")
      {
        ok = takeValue(argc, argv, i, config.output_file, error);
      }
      else if (arg == "--region-layer")
      {
        ok = takeValue(argc, argv, i, config.regions.layer_name, error);
      }
      else if (arg == "--region-id")
      {
        ok = takeValue(argc, argv, i, config.regions.id_field, error);
      }
      else if (arg == "--regions-crs")
      {
        ok = takeValue(argc, argv, i, config.regions.crs, error);
      }
      else if (arg == "--crs")
      {
        ok = takeValue(argc, argv, i, config.stages.events_crs, error);
      }
      else if (arg == "--workers")
      {
        ok = takeSize(argc, argv, i, config.stages.workers, error);
        if (ok && (config.stages.workers == 0 || config.stages.workers > stormagg::kMaxWorkers))
        {
          error = "--workers must be between 1 and " + std::to_string(stormagg::kMaxWorkers);
          ok = false;
        }
      }
      else if (arg == "--batch-size")
      {
        ok = takeSize(argc, argv, i, config.stages.batch_size, error);
      }
      else if (arg == "--queue-size")
      {
        ok = takeSize(argc, argv, i, config.stages.queue_size, error);
      }
      else
      {
        error = "Unknown argument: " + arg;
        return false;
      }

      if (!ok)
      {
        return false;
      }
    }

    if (config.locations_file.empty() || config.details_file.empty() || config.regions.path.empty())
    {
      error = "--locations, --details and --regions are required";
      return false;
    }

    return true;
  }

  bool parseFetchArguments(int argc, char **argv, stormagg::FetchConfig &config, std::string &error)
  {
    for (int i = 2; i < argc; i += 1)
    {
      const std::string arg = argv[i];
      bool ok = true;

      if (arg == "--help" || arg == "-h")
      {
        printUsage();
        std::exit(0);
      }
      else if (arg == "--base-url")
      {
        ok = takeValue(argc, argv, i, config.base_url, error);
      }
      else if (arg == "--output-dir")
      {
        ok = takeValue(argc, argv, i, config.output_dir, error);
      }
      else if (arg == "--retries" || arg == "--timeout")
      {
        std::string value;
        ok = takeValue(argc, argv, i, value, error);
        char *end = nullptr;
        const long parsed = ok ? std::strtol(value.c_str(), &end, 10) : 0;
        if (ok && (end == value.c_str() || *end != '\0' || parsed < 0 || (arg == "--timeout" && parsed == 0)))
        {
          error = "Invalid value for " + arg;
          ok = false;
        }
        if (ok && arg == "--retries")
        {
          config.retries = static_cast<int>(parsed);
        }
        else if (ok)
        {
          config.timeout_sec = parsed;
        }
      }
      else
      {
        error = "Unknown argument: " + arg;
        return false;
      }

      if (!ok)
      {
        return false;
      }
    }

    if (!config.base_url.empty() && config.base_url.back() != '/')
    {
      config.base_url += '/';
    }
    return true;
  }

  int runAggregate(int argc, char **argv)
  {
    stormagg::PipelineConfig config;
    config.output_file = "aggregated.csv";

    const unsigned int hardware_threads = std::thread::hardware_concurrency();
    config.stages.workers = hardware_threads > 0 ? hardware_threads : 4;

    std::string error;
    if (!parseAggregateArguments(argc, argv, config, error))
    {
      std::cerr << error << "\n\n";
      printUsage();
      return 1;
    }

    stormagg::Metrics metrics;
    stormagg::PipelineCoordinator coordinator(config);
    const int result = coordinator.run(metrics);

    const stormagg::MetricsSnapshot snapshot = metrics.snapshot();
    const double total_processing = snapshot.load_processing_ms + snapshot.join_processing_ms +
                                    snapshot.normalize_processing_ms + snapshot.locate_processing_ms +
                                    snapshot.aggregate_processing_ms + snapshot.select_processing_ms +
                                    snapshot.write_processing_ms;
    const double total_measured = total_processing + snapshot.queue_overhead_ms;

    std::cout << "\n=== Aggregation Summary ===\n"
              << "Locations read: " << snapshot.locations_read << "\n"
              << "Details read: " << snapshot.details_read << "\n"
              << "Regions loaded: " << snapshot.regions_loaded << "\n"
              << "Joined events: " << snapshot.joined_events << "\n"
              << "Unmatched locations: " << snapshot.unmatched_locations << "\n"
              << "Unmatched details: " << snapshot.unmatched_details << "\n"
              << "Located rows: " << snapshot.located_events << "\n"
              << "Events outside all regions: " << snapshot.unlocated_events << "\n"
              << "Region/category groups: " << snapshot.aggregated_groups << "\n"
              << "Regions written: " << snapshot.regions_written << "\n"
              << "Duration: " << snapshot.duration_sec << " sec\n"
              << "Throughput: " << snapshot.throughput_per_sec << " located rows/sec\n";

    if (total_measured > 0)
    {
      std::cout << "\n=== Time Breakdown ===\n"
                << "Load: " << snapshot.load_processing_ms << "ms "
                << "(" << (snapshot.load_processing_ms / total_measured * 100) << "%)\n"
                << "Join: " << snapshot.join_processing_ms << "ms "
                << "(" << (snapshot.join_processing_ms / total_measured * 100) << "%)\n"
                << "Normalize: " << snapshot.normalize_processing_ms << "ms "
                << "(" << (snapshot.normalize_processing_ms / total_measured * 100) << "%)\n"
                << "Locate (all workers): " << snapshot.locate_processing_ms << "ms "
                << "(" << (snapshot.locate_processing_ms / total_measured * 100) << "%)\n"
                << "Aggregate: " << snapshot.aggregate_processing_ms << "ms "
                << "(" << (snapshot.aggregate_processing_ms / total_measured * 100) << "%)\n"
                << "Select: " << snapshot.select_processing_ms << "ms "
                << "(" << (snapshot.select_processing_ms / total_measured * 100) << "%)\n"
                << "Write: " << snapshot.write_processing_ms << "ms "
                << "(" << (snapshot.write_processing_ms / total_measured * 100) << "%)\n"
                << "Queue overhead: " << snapshot.queue_overhead_ms << "ms "
                << "(" << (snapshot.queue_overhead_ms / total_measured * 100) << "%)\n";
    }

    return result;
  }

  int runFetchCommand(int argc, char **argv)
  {
    stormagg::FetchConfig config;
    std::string error;
    if (!parseFetchArguments(argc, argv, config, error))
    {
      std::cerr << error << "\n\n";
      printUsage();
      return 1;
    }

    curl_global_init(CURL_GLOBAL_ALL);
    const int result = stormagg::runFetch(config);
    curl_global_cleanup();
    return result;
  }

} // namespace

int main(int argc, char **argv)
{
  if (argc < 2)
  {
    printUsage();
    return 1;
  }

  const std::string command = argv[1];
  if (command == "--help" || command == "-h")
  {
    printUsage();
    return 0;
  }
  if (command == "aggregate")
  {
    return runAggregate(argc, argv);
  }
  if (command == "fetch")
  {
    return runFetchCommand(argc, argv);
  }

  std::cerr << "Unknown command: " << command << "\n\n";
  printUsage();
  return 1;
}
