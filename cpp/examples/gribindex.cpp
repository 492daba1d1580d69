// Prints the message index of a GRIB file as JSON, building or refreshing its
// cached sidecar on the way.
#define GRIBSCAN_IMPLEMENTATION
#include <gribscan/gribscan.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string_view>

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3 || (argc == 3 && std::string_view(argv[2]) != "--no-cache")) {
    std::cerr << "Usage: " << argv[0] << " <input.grib> [--no-cache]" << std::endl;
    return 1;
  }
  const std::string inputFilename = argv[1];

  gribscan::CacheLocator locator;
  const bool useCache = argc == 2;
  const gribscan::IndexCache cache{locator, useCache, [](const gribscan::Status& problem) {
                                     std::cerr << "warning: " << problem.message << std::endl;
                                   }};

  gribscan::GribIndex index;
  {
    const auto res = cache.buildOrLoad(inputFilename, &index);
    if (!res.ok()) {
      std::cerr << "Failed to index " << inputFilename << ": " << res.message << std::endl;
      return 1;
    }
  }

  nlohmann::ordered_json output;
  output["path"] = inputFilename;
  output["version"] = index.version;
  output["source"] = index.source == gribscan::GribIndex::Source::Cache ? "cache" : "scan";
  if (useCache) {
    output["cache_directory"] = locator.directory();
  }
  output["messages"] = nlohmann::ordered_json::array();
  for (size_t i = 0; i < index.size(); ++i) {
    const auto range = index.range(i);
    nlohmann::ordered_json message;
    message["offset"] = range.offset;
    message["length"] = range.length;
    output["messages"].push_back(std::move(message));
  }

  std::cout << output.dump(2) << std::endl;
  return 0;
}
