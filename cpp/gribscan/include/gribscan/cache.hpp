#pragma once

#include "scanner.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace gribscan {

/**
 * @brief Byte offsets and lengths of every message in one GRIB file, in file
 * order.
 */
struct GRIBSCAN_PUBLIC GribIndex {
  enum struct Source {
    Scan,
    Cache,
  };

  int64_t version = IndexVersion;
  std::vector<ByteOffset> offsets;
  std::vector<uint64_t> lengths;
  /**
   * @brief Whether this index was produced by scanning the file or read back
   * from a sidecar. Not persisted.
   */
  Source source = Source::Scan;

  size_t size() const {
    return offsets.size();
  }

  MessageRange range(size_t index) const {
    return MessageRange{offsets[index], lengths[index]};
  }
};

/**
 * @brief Resolves where derived data for a source file is cached.
 *
 * Sidecar names combine a namespace with a CRC32 of the source file's absolute
 * path, size and modification time, so rewriting a file invalidates every
 * sidecar derived from it.
 */
class GRIBSCAN_PUBLIC CacheLocator {
public:
  /**
   * @param directory Directory holding sidecars. When empty, the
   *   `GRIBSCAN_CACHE_DIR` environment variable is used, falling back to a
   *   `gribscan` directory under the system temporary directory.
   */
  explicit CacheLocator(std::string directory = {});

  const std::string& directory() const;

  /**
   * @brief Returns the sidecar path for `sourcePath` in cache namespace `ns`,
   * creating the cache directory if needed.
   */
  Status sidecarPath(std::string_view ns, const std::string& sourcePath,
                     std::string_view extension, std::string* output) const;

  static std::string DefaultDirectory();

private:
  std::string directory_;
};

/**
 * @brief Builds GRIB indexes, reusing a JSON sidecar when a valid one exists.
 *
 * Sidecar problems never fail `buildOrLoad()`: an unreadable, malformed or
 * outdated sidecar is a cache miss and the file is scanned again; a sidecar
 * that cannot be written leaves the freshly built index usable. Both cases are
 * reported through the problem callback.
 */
class GRIBSCAN_PUBLIC IndexCache {
public:
  static constexpr std::string_view Namespace = "grib-index";

  IndexCache(CacheLocator locator, bool useCache = true,
             ProblemCallback onProblem = [](const Status&) {});

  /**
   * @brief Loads the index for `path` from its sidecar or, on a cache miss,
   * scans the file and writes a new sidecar.
   *
   * @return Status StatusCode::OpenFailed if the source file cannot be opened
   *   for scanning. Cache problems are never returned.
   */
  Status buildOrLoad(const std::string& path, GribIndex* index) const;

  /**
   * @brief Scans `path` and fills `index`.
   */
  static Status Build(const std::string& path, GribIndex* index,
                      const ProblemCallback& onProblem = [](const Status&) {});

  /**
   * @brief Reads an index sidecar.
   *
   * @return Status StatusCode::CacheMiss if the sidecar is missing, not a JSON
   *   object, lacks a well-typed `version`, `offsets` or `lengths` field, has
   *   mismatched array sizes or carries a version other than IndexVersion.
   */
  static Status Load(const std::string& sidecar, GribIndex* index);

  static Status Save(const std::string& sidecar, const GribIndex& index);

private:
  CacheLocator locator_;
  bool useCache_;
  ProblemCallback onProblem_;
};

/**
 * @brief Reads a statistics sidecar. Uses the same tolerant policy as index
 * sidecars: anything but a complete record is StatusCode::CacheMiss.
 */
GRIBSCAN_PUBLIC Status LoadStatistics(const std::string& sidecar, Statistics* statistics);

GRIBSCAN_PUBLIC Status SaveStatistics(const std::string& sidecar, const Statistics& statistics);

}  // namespace gribscan

#ifdef GRIBSCAN_IMPLEMENTATION
#  include "cache.inl"
#endif
