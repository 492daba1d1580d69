#pragma once

#include "errors.hpp"
#include "visibility.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gribscan {

#define GRIBSCAN_LIBRARY_VERSION "0.3.0"

using ByteOffset = uint64_t;
using ByteArray = std::vector<std::byte>;
using ProblemCallback = std::function<void(const Status&)>;

constexpr char LibraryVersion[] = GRIBSCAN_LIBRARY_VERSION;
constexpr uint8_t Magic[] = {'G', 'R', 'I', 'B'};
constexpr uint8_t EndMarker[] = {'7', '7', '7', '7'};
constexpr ByteOffset EndOffset = std::numeric_limits<ByteOffset>::max();

/**
 * @brief Integer the decoder returns for keys that are "not applicable" to a
 * message. Only the grid shape accessors translate it into an empty value.
 */
constexpr int64_t MissingLong = 2147483647;

/**
 * @brief Version tag written into index sidecars. A sidecar carrying any other
 * version is ignored and the index is rebuilt.
 */
constexpr int64_t IndexVersion = 1;

/**
 * @brief The byte range `[offset, offset + length)` of one GRIB message.
 */
struct MessageRange {
  ByteOffset offset;
  uint64_t length;

  ByteOffset end() const {
    return offset + length;
  }
};

/**
 * @brief A value returned by the decoder for a single key. Scalar keys produce
 * an integer, floating point or string; array keys (`values`,
 * `distinctLatitudes`, `distinctLongitudes`) produce a vector of doubles.
 */
using Value = std::variant<int64_t, double, std::string, std::vector<double>>;

/**
 * @brief Renders a decoded value for display. Arrays are summarized by size.
 */
std::string ToString(const Value& value);

/**
 * @brief Maps the decoder's "not applicable" sentinel to an empty value.
 */
inline std::optional<int64_t> MissingIsNull(std::optional<int64_t> value) {
  if (value && *value == MissingLong) {
    return std::nullopt;
  }
  return value;
}

/**
 * @brief A calendar timestamp with minute resolution, as carried by GRIB
 * `date` and `time` keys.
 */
struct GRIBSCAN_PUBLIC DateTime {
  int32_t year = 1970;
  int32_t month = 1;
  int32_t day = 1;
  int32_t hour = 0;
  int32_t minute = 0;

  DateTime() = default;
  DateTime(int32_t year, int32_t month, int32_t day, int32_t hour = 0, int32_t minute = 0)
      : year(year)
      , month(month)
      , day(day)
      , hour(hour)
      , minute(minute) {}

  /**
   * @brief Builds a timestamp from a YYYYMMDD-encoded date and an HHMM-encoded
   * time.
   */
  static DateTime FromGrib(int64_t date, int64_t time);

  /**
   * @brief Builds a timestamp from seconds since 1970-01-01T00:00.
   */
  static DateTime FromEpochSeconds(int64_t seconds);

  int64_t epochSeconds() const;

  DateTime addHours(int64_t hours) const;

  /**
   * @brief ISO 8601 representation, e.g. `2020-05-13T12:00:00`.
   */
  std::string isoformat() const;

  GRIBSCAN_PUBLIC friend bool operator==(const DateTime& a, const DateTime& b);
  GRIBSCAN_PUBLIC friend bool operator!=(const DateTime& a, const DateTime& b);
  GRIBSCAN_PUBLIC friend bool operator<(const DateTime& a, const DateTime& b);
};

/**
 * @brief Geographic extent of a field, in degrees.
 */
struct GRIBSCAN_PUBLIC BoundingBox {
  double north = 0;
  double west = 0;
  double south = 0;
  double east = 0;

  /**
   * @brief Returns the smallest box enclosing both `a` and `b`.
   */
  static BoundingBox Merge(const BoundingBox& a, const BoundingBox& b);
};

/**
 * @brief Grid corners and per-axis increments of a field. Every entry is
 * empty when the decoder does not provide it for the message's grid type.
 */
struct GridDefinition {
  std::optional<double> north;
  std::optional<double> south;
  std::optional<double> west;
  std::optional<double> east;
  std::optional<double> southNorthIncrement;
  std::optional<double> westEastIncrement;
};

/**
 * @brief `(rows, cols)` of a regular grid, i.e. the `Nj` and `Ni` keys. A
 * dimension is empty when the decoder reports it as missing or not applicable.
 */
struct Shape {
  std::optional<int64_t> rows;
  std::optional<int64_t> cols;

  bool known() const {
    return rows.has_value() && cols.has_value();
  }
};

/**
 * @brief Field values together with the shape they should be viewed in. When
 * `shape` is empty the values are a flat sequence.
 */
struct Array {
  std::vector<double> values;
  std::optional<std::pair<int64_t, int64_t>> shape;

  /**
   * @brief Value at `(row, col)`, or empty if the array is unshaped or the
   * position is outside the shape.
   */
  std::optional<double> at(int64_t row, int64_t col) const {
    if (!shape || row < 0 || col < 0 || row >= shape->first || col >= shape->second) {
      return std::nullopt;
    }
    const size_t index = size_t(row) * size_t(shape->second) + size_t(col);
    if (index >= values.size()) {
      return std::nullopt;
    }
    return values[index];
  }
};

/**
 * @brief Descriptive metadata of one field: its grid definition, shape and the
 * `shortName`, `units` and `paramId` keys when the decoder provides them.
 */
struct FieldMetadata {
  GridDefinition grid;
  Shape shape;
  std::optional<std::string> shortName;
  std::optional<std::string> units;
  std::optional<std::string> paramId;
};

/**
 * @brief Aggregate statistics over every value of every message in a file.
 */
struct Statistics {
  double minimum = 0;
  double maximum = 0;
  double average = 0;
  double stdev = 0;
  uint64_t count = 0;
};

}  // namespace gribscan

#ifdef GRIBSCAN_IMPLEMENTATION
#  include "types.inl"
#endif
