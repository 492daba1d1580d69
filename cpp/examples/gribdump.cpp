#define GRIBSCAN_IMPLEMENTATION
#include <gribscan/gribscan.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

using gribscan::ByteOffset;

template <typename... T>
[[nodiscard]] inline std::string StrFormat(std::string_view msg, T&&... args) {
  return fmt::format(msg, std::forward<T>(args)...);
}

struct FileCloser {
  void operator()(std::FILE* file) const {
    std::fclose(file);
  }
};

std::string ToString(const gribscan::MessageRange& range, uint8_t edition) {
  return StrFormat("[Message] offset={}, length={}, edition={}", range.offset, range.length,
                   edition);
}

std::string ToString(const gribscan::Shape& shape) {
  const auto dim = [](const std::optional<int64_t>& value) {
    return value ? std::to_string(*value) : std::string("?");
  };
  return StrFormat("{}x{}", dim(shape.rows), dim(shape.cols));
}

std::string ToString(const gribscan::BoundingBox& box) {
  return StrFormat("north={}, west={}, south={}, east={}", box.north, box.west, box.south,
                   box.east);
}

std::string ToString(const gribscan::Statistics& statistics) {
  return StrFormat("[Statistics] count={}, minimum={}, maximum={}, average={}, stdev={}",
                   statistics.count, statistics.minimum, statistics.maximum, statistics.average,
                   statistics.stdev);
}

void DumpRaw(gribscan::IReadable& dataSource) {
  // Frame every message without decoding anything
  gribscan::MessageScanner scanner{dataSource};

  bool running = true;
  while (running) {
    const auto range = scanner.next();
    if (range.has_value()) {
      std::byte* data = nullptr;
      if (const uint64_t skipped = scanner.skippedBytes(); skipped > 0) {
        const ByteOffset start = range->offset - skipped;
        const uint64_t preview = dataSource.read(&data, start, std::min<uint64_t>(skipped, 4));
        std::cout << StrFormat("! skipped {} bytes at offset {} starting with {}\n", skipped,
                               start, gribscan::internal::BytesToHex(data, preview));
      }
      uint8_t edition = 0;
      if (dataSource.read(&data, range->offset, gribscan::internal::IndicatorLength) ==
          gribscan::internal::IndicatorLength) {
        edition = uint8_t(data[gribscan::internal::IndicatorLength - 1]);
      }
      std::cout << ToString(*range, edition) << "\n";
    } else {
      running = false;
    }

    if (!scanner.status().ok()) {
      std::cout << "! " << scanner.status().message << "\n";
    }
  }
}

void DumpFields(const std::string& path) {
  auto onProblem = [](const gribscan::Status& problem) {
    std::cerr << "! " << problem.message << "\n";
  };

  gribscan::ReaderOptions options;
  options.onProblem = onProblem;

  gribscan::GribReader reader;
  auto status = reader.open(path, options);
  if (!status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return;
  }
  std::cout << StrFormat("{} messages, index from {}\n", reader.size(),
                         reader.index().source == gribscan::GribIndex::Source::Cache ? "cache"
                                                                                      : "scan");

  for (size_t i = 0; i < reader.size(); ++i) {
    gribscan::Field field;
    if (status = reader.field(i, &field); !status.ok()) {
      std::cerr << "! " << status.message << "\n";
      continue;
    }

    std::string description;
    gribscan::Shape shape;
    gribscan::DateTime valid;
    if (status = field.describe(&description); !status.ok()) {
      std::cerr << "! " << status.message << "\n";
      continue;
    }
    if (status = field.shape(&shape); !status.ok()) {
      std::cerr << "! " << status.message << "\n";
      continue;
    }
    std::cout << StrFormat("[{}] offset={} {} shape={}", i, *field.offset(), description,
                           ToString(shape));
    if (field.validDatetime(&valid).ok()) {
      std::cout << " valid=" << valid.isoformat();
    }
    gribscan::BoundingBox box;
    if (field.boundingBox(&box).ok()) {
      std::cout << " " << ToString(box);
    }
    std::cout << "\n";
  }

  gribscan::Statistics statistics;
  if (status = reader.statistics(&statistics); status.ok()) {
    std::cout << ToString(statistics) << "\n";
  } else {
    std::cerr << "! " << status.message << "\n";
  }

  reader.close();
}

int main(int argc, char* argv[]) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <input.grib>\n";
    return 1;
  }

  const std::string inputFile = argv[1];
  std::unique_ptr<std::FILE, FileCloser> file{std::fopen(inputFile.c_str(), "rb")};
  if (!file) {
    std::cerr << "Failed to open " << inputFile << " for reading\n";
    return 1;
  }
  gribscan::FileReader dataSource{file.get()};

  std::cout << "Raw messages:\n";
  DumpRaw(dataSource);
  std::cout << "\nFields:\n";
  DumpFields(inputFile);

  return 0;
}
