#include "crc32.hpp"
#include "internal.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>

namespace gribscan {

namespace {

struct FileCloser {
  void operator()(std::FILE* file) const {
    std::fclose(file);
  }
};

Status ReadJson(const std::string& path, nlohmann::json* output) {
  std::ifstream stream{path};
  if (!stream.is_open()) {
    return Status{StatusCode::CacheMiss, internal::StrCat("cannot open \"", path, "\"")};
  }
  auto parsed = nlohmann::json::parse(stream, nullptr, false);
  if (parsed.is_discarded()) {
    return Status{StatusCode::CacheMiss, internal::StrCat("\"", path, "\" is not valid JSON")};
  }
  if (!parsed.is_object()) {
    return Status{StatusCode::CacheMiss,
                  internal::StrCat("\"", path, "\" does not hold a JSON object")};
  }
  *output = std::move(parsed);
  return StatusCode::Success;
}

// Written next to the target and renamed into place
Status WriteJson(const std::string& path, const nlohmann::json& value) {
  const std::string tmpPath = path + ".tmp";
  {
    std::ofstream stream{tmpPath, std::ios::out | std::ios::trunc};
    if (!stream.is_open()) {
      return Status{StatusCode::WriteFailed, internal::StrCat("cannot open \"", tmpPath, "\"")};
    }
    stream << value.dump();
    stream.flush();
    if (!stream.good()) {
      return Status{StatusCode::WriteFailed, internal::StrCat("write to \"", tmpPath, "\" failed")};
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmpPath, path, ec);
  if (ec) {
    std::filesystem::remove(tmpPath, ec);
    return Status{StatusCode::WriteFailed,
                  internal::StrCat("cannot move \"", tmpPath, "\" to \"", path, "\"")};
  }
  return StatusCode::Success;
}

Status ReadOffsetArray(const nlohmann::json& record, const char* key,
                       std::vector<uint64_t>* output) {
  const auto it = record.find(key);
  if (it == record.end() || !it->is_array()) {
    return Status{StatusCode::CacheMiss, internal::StrCat("missing \"", key, "\" array")};
  }
  output->clear();
  output->reserve(it->size());
  for (const auto& element : *it) {
    if (!element.is_number_unsigned()) {
      return Status{StatusCode::CacheMiss,
                    internal::StrCat("\"", key, "\" holds a non-integer or negative entry")};
    }
    output->push_back(element.get<uint64_t>());
  }
  return StatusCode::Success;
}

Status ReadNumber(const nlohmann::json& record, const char* key, double* output) {
  const auto it = record.find(key);
  if (it == record.end() || !it->is_number()) {
    return Status{StatusCode::CacheMiss, internal::StrCat("missing number \"", key, "\"")};
  }
  *output = it->get<double>();
  return StatusCode::Success;
}

}  // namespace

// CacheLocator ////////////////////////////////////////////////////////////////

CacheLocator::CacheLocator(std::string directory)
    : directory_(directory.empty() ? DefaultDirectory() : std::move(directory)) {}

const std::string& CacheLocator::directory() const {
  return directory_;
}

std::string CacheLocator::DefaultDirectory() {
  if (const char* env = std::getenv("GRIBSCAN_CACHE_DIR"); env && *env) {
    return env;
  }
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    tmp = "/tmp";
  }
  return (tmp / "gribscan").string();
}

Status CacheLocator::sidecarPath(std::string_view ns, const std::string& sourcePath,
                                 std::string_view extension, std::string* output) const {
  std::error_code ec;
  const auto absolute = std::filesystem::absolute(sourcePath, ec);
  if (ec) {
    return Status{StatusCode::OpenFailed,
                  internal::StrCat("cannot resolve \"", sourcePath, "\": ", ec.message())};
  }
  const auto fileSize = std::filesystem::file_size(absolute, ec);
  if (ec) {
    return Status{StatusCode::OpenFailed,
                  internal::StrCat("cannot stat \"", sourcePath, "\": ", ec.message())};
  }
  const auto modified = std::filesystem::last_write_time(absolute, ec);
  if (ec) {
    return Status{StatusCode::OpenFailed,
                  internal::StrCat("cannot stat \"", sourcePath, "\": ", ec.message())};
  }

  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    return Status{StatusCode::WriteFailed, internal::StrCat("cannot create cache directory \"",
                                                            directory_, "\": ", ec.message())};
  }

  const auto identity = internal::StrCat(absolute.string(), "|", uint64_t(fileSize), "|",
                                         int64_t(modified.time_since_epoch().count()));
  const auto name = internal::StrCat(ns, "-", internal::crc32Hex(identity), extension);
  *output = (std::filesystem::path(directory_) / name).string();
  return StatusCode::Success;
}

// IndexCache //////////////////////////////////////////////////////////////////

IndexCache::IndexCache(CacheLocator locator, bool useCache, ProblemCallback onProblem)
    : locator_(std::move(locator))
    , useCache_(useCache)
    , onProblem_(std::move(onProblem)) {}

Status IndexCache::buildOrLoad(const std::string& path, GribIndex* index) const {
  std::string sidecar;
  if (useCache_) {
    if (auto status = locator_.sidecarPath(Namespace, path, ".json", &sidecar); !status.ok()) {
      // An unreadable source is returned by Build() below
      if (status.code != StatusCode::OpenFailed) {
        onProblem_(status);
      }
      sidecar.clear();
    }
  }

  if (!sidecar.empty()) {
    std::error_code ec;
    if (std::filesystem::exists(sidecar, ec)) {
      const auto status = Load(sidecar, index);
      if (status.ok()) {
        return status;
      }
      onProblem_(status);
    }
  }

  if (auto status = Build(path, index, onProblem_); !status.ok()) {
    return status;
  }

  if (!sidecar.empty()) {
    if (auto status = Save(sidecar, *index); !status.ok()) {
      onProblem_(status);
    }
  }
  return StatusCode::Success;
}

Status IndexCache::Build(const std::string& path, GribIndex* index,
                         const ProblemCallback& onProblem) {
  std::unique_ptr<std::FILE, FileCloser> file{std::fopen(path.c_str(), "rb")};
  if (!file) {
    return Status{StatusCode::OpenFailed, internal::StrCat("failed to open \"", path, "\"")};
  }
  FileReader reader{file.get()};

  GribIndex result;
  for (const auto& range : ScanMessages(reader, onProblem)) {
    result.offsets.push_back(range.offset);
    result.lengths.push_back(range.length);
  }
  result.source = GribIndex::Source::Scan;
  *index = std::move(result);
  return StatusCode::Success;
}

Status IndexCache::Load(const std::string& sidecar, GribIndex* index) {
  nlohmann::json record;
  if (auto status = ReadJson(sidecar, &record); !status.ok()) {
    return status;
  }

  const auto version = record.find("version");
  if (version == record.end() || !version->is_number_integer()) {
    return Status{StatusCode::CacheMiss,
                  internal::StrCat("\"", sidecar, "\" has no integer \"version\"")};
  }
  if (version->get<int64_t>() != IndexVersion) {
    return Status{StatusCode::CacheMiss,
                  internal::StrCat("\"", sidecar, "\" has version ", version->get<int64_t>(),
                                   ", expected ", IndexVersion)};
  }

  GribIndex result;
  if (auto status = ReadOffsetArray(record, "offsets", &result.offsets); !status.ok()) {
    return status;
  }
  if (auto status = ReadOffsetArray(record, "lengths", &result.lengths); !status.ok()) {
    return status;
  }
  if (result.offsets.size() != result.lengths.size()) {
    return Status{StatusCode::CacheMiss,
                  internal::StrCat("\"", sidecar, "\" has ", result.offsets.size(),
                                   " offsets but ", result.lengths.size(), " lengths")};
  }
  result.version = IndexVersion;
  result.source = GribIndex::Source::Cache;
  *index = std::move(result);
  return StatusCode::Success;
}

Status IndexCache::Save(const std::string& sidecar, const GribIndex& index) {
  nlohmann::json record = nlohmann::json::object();
  record["version"] = IndexVersion;
  record["offsets"] = index.offsets;
  record["lengths"] = index.lengths;
  return WriteJson(sidecar, record);
}

// Statistics sidecar //////////////////////////////////////////////////////////

Status LoadStatistics(const std::string& sidecar, Statistics* statistics) {
  nlohmann::json record;
  if (auto status = ReadJson(sidecar, &record); !status.ok()) {
    return status;
  }

  Statistics result;
  for (const auto& [key, output] : {std::make_pair("minimum", &result.minimum),
                                    std::make_pair("maximum", &result.maximum),
                                    std::make_pair("average", &result.average),
                                    std::make_pair("stdev", &result.stdev)}) {
    if (auto status = ReadNumber(record, key, output); !status.ok()) {
      return status;
    }
  }
  const auto count = record.find("count");
  if (count == record.end() || !count->is_number_unsigned()) {
    return Status{StatusCode::CacheMiss,
                  internal::StrCat("\"", sidecar, "\" has no integer \"count\"")};
  }
  result.count = count->get<uint64_t>();
  *statistics = result;
  return StatusCode::Success;
}

Status SaveStatistics(const std::string& sidecar, const Statistics& statistics) {
  nlohmann::json record = nlohmann::json::object();
  record["minimum"] = statistics.minimum;
  record["maximum"] = statistics.maximum;
  record["average"] = statistics.average;
  record["stdev"] = statistics.stdev;
  record["count"] = statistics.count;
  return WriteJson(sidecar, record);
}

}  // namespace gribscan
