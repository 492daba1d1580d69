#pragma once

#include "cache.hpp"
#include "decoder.hpp"
#include "field.hpp"
#include "scanner.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gribscan {

class GribReader;

/**
 * @brief Options for opening a GRIB file.
 */
struct GRIBSCAN_PUBLIC ReaderOptions {
  /**
   * @brief Directory for index and statistics sidecars. See CacheLocator for
   * the default.
   */
  std::string cacheDirectory;
  /**
   * @brief When false, sidecars are neither read nor written and every open
   * scans the file.
   */
  bool useCache = true;
  /**
   * @brief The decoding backend. If not provided, DefaultDecoder() is used.
   */
  std::shared_ptr<IDecoder> decoder;
  /**
   * @brief Called for every recoverable problem: unusable sidecars, failed
   * sidecar writes, framing errors and decode errors during iteration.
   */
  ProblemCallback onProblem = [](const Status&) {};

  /**
   * @brief validate the configuration.
   */
  Status validate() const;
};

/**
 * @brief An iterable view of the Fields of a GRIB file, in file order.
 *
 * Every `begin()` opens its own MessageCursor at the start of the file, so
 * traversals are independent of each other and of random access through the
 * reader. Decode errors end the traversal and are passed to the problem
 * callback.
 */
struct GRIBSCAN_PUBLIC FieldView {
  struct GRIBSCAN_PUBLIC Iterator {
    using iterator_category = std::input_iterator_tag;
    using difference_type = int64_t;
    using value_type = Field;
    using pointer = Field*;
    using reference = Field&;

    reference operator*() const;
    pointer operator->() const;
    Iterator& operator++();
    void operator++(int);
    GRIBSCAN_PUBLIC friend bool operator==(const Iterator& a, const Iterator& b);
    GRIBSCAN_PUBLIC friend bool operator!=(const Iterator& a, const Iterator& b);

  private:
    friend FieldView;

    Iterator() = default;
    Iterator(const std::string& path, std::shared_ptr<IDecoder> decoder,
             const ProblemCallback& onProblem);

    class Impl {
    public:
      Impl(const std::string& path, std::shared_ptr<IDecoder> decoder,
           const ProblemCallback& onProblem);

      Impl(const Impl&) = delete;
      Impl& operator=(const Impl&) = delete;
      Impl(Impl&&) = delete;
      Impl& operator=(Impl&&) = delete;

      void increment();
      reference dereference();
      bool has_value() const;

    private:
      MessageCursor cursor_;
      Field current_;
      bool hasValue_ = false;
      ProblemCallback onProblem_;
    };

    std::unique_ptr<Impl> impl_;
  };

  FieldView(const GribReader& reader);
  FieldView(const GribReader& reader, const ProblemCallback& onProblem);

  Iterator begin();
  Iterator end();

private:
  std::string path_;
  std::shared_ptr<IDecoder> decoder_;
  ProblemCallback onProblem_;
};

/**
 * @brief Provides indexed and sequential access to the messages of one GRIB
 * file.
 *
 * The message index is loaded from its sidecar or built by scanning when the
 * file is opened. Fields returned by `field()` share the reader's
 * random-access cursor and must not outlive the reader. A reader, its cursor
 * and its pending Fields may only be used by one thread at a time; separate
 * readers share no state.
 */
class GRIBSCAN_PUBLIC GribReader final {
public:
  GribReader() = default;
  ~GribReader();

  GribReader(const GribReader&) = delete;
  GribReader& operator=(const GribReader&) = delete;
  GribReader(GribReader&&) = delete;
  GribReader& operator=(GribReader&&) = delete;

  /**
   * @brief Opens a GRIB file and loads or builds its message index.
   *
   * @return Status StatusCode::NoDecoder if no decoding backend is available,
   *   StatusCode::OpenFailed if the file cannot be read. Cache problems are
   *   reported through `options.onProblem` and never fail the open.
   */
  Status open(const std::string& path, ReaderOptions options = {});

  /**
   * @brief Closes the file, dropping the index, cursor and cached statistics.
   * Fields obtained from `field()` become unusable.
   */
  void close();

  bool isOpen() const;

  const std::string& path() const;

  const GribIndex& index() const;

  /**
   * @brief Number of messages in the file.
   */
  size_t size() const;

  /**
   * @brief Returns a lazily decoded Field for message `n`.
   *
   * @return Status StatusCode::OutOfRange unless `n < size()`.
   */
  Status field(size_t n, Field* output);

  /**
   * @brief Shortcut for `field(0)`, used to probe the grid of a file.
   */
  Status first(Field* output);

  FieldView fields() const;
  FieldView::Iterator begin() const;
  FieldView::Iterator end() const;

  /**
   * @brief Minimum, maximum, mean and standard deviation over every value of
   * every message. The result is memoized and cached in a sidecar.
   *
   * `average` is the mean of the per-cell sums divided by the message count,
   * and `stdev` is `sqrt(mean(per-cell sum of squares) / count - average^2)`.
   *
   * @return Status StatusCode::MissingValues if any grid cell is NaN or a
   *   message carries no grid,
   *   StatusCode::ShapeMismatch if messages have differently sized grids,
   *   StatusCode::NoMessages for an empty file, or a decode error.
   */
  Status statistics(Statistics* output);

  /**
   * @brief Sorted, de-duplicated valid datetimes of every message.
   */
  Status datetimes(std::vector<DateTime>* output) const;

  /**
   * @brief The valid datetime shared by every message.
   *
   * @return Status StatusCode::NotUnique if messages have different valid
   *   datetimes, StatusCode::NoMessages for an empty file.
   */
  Status datetime(DateTime* output) const;

  /**
   * @brief The smallest box enclosing the bounding box of every message.
   */
  Status boundingBox(BoundingBox* output) const;

  static constexpr std::string_view StatisticsNamespace = "grib-statistics";

private:
  friend FieldView;

  std::string path_;
  ReaderOptions options_;
  std::shared_ptr<IDecoder> decoder_;
  std::optional<CacheLocator> locator_;
  GribIndex index_;
  std::unique_ptr<MessageCursor> cursor_;
  std::optional<Statistics> statistics_;
  bool open_ = false;

  Status openCursor_(MessageCursor** output);
  Status computeStatistics_(Statistics* output) const;
  Status forEachField_(const std::function<Status(Field&)>& visit) const;
};

/**
 * @brief Concatenates the messages of several readers into one indexable
 * sequence. The readers must outlive the FieldSet.
 */
class GRIBSCAN_PUBLIC FieldSet final {
public:
  explicit FieldSet(std::vector<GribReader*> readers);

  size_t size() const;

  /**
   * @brief Returns message `n` of the concatenation.
   *
   * @return Status StatusCode::OutOfRange unless `n < size()`.
   */
  Status field(size_t n, Field* output);

private:
  std::vector<GribReader*> readers_;
};

}  // namespace gribscan

#ifdef GRIBSCAN_IMPLEMENTATION
#  include "reader.inl"
#endif
