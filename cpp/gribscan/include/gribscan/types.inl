#include "internal.hpp"
#include <algorithm>
#include <cstdio>

namespace gribscan {

std::string ToString(const Value& value) {
  if (const auto* l = std::get_if<int64_t>(&value)) {
    return std::to_string(*l);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%g", *d);
    return buffer;
  }
  if (const auto* s = std::get_if<std::string>(&value)) {
    return *s;
  }
  return internal::StrCat("<", std::get<std::vector<double>>(value).size(), " values>");
}

// DateTime ////////////////////////////////////////////////////////////////////

namespace {

// Days since 1970-01-01 in the proleptic Gregorian calendar
int64_t DaysFromCivil(int64_t y, int64_t m, int64_t d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

void CivilFromDays(int64_t z, int32_t* year, int32_t* month, int32_t* day) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  const int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const int64_t m = mp < 10 ? mp + 3 : mp - 9;
  *year = int32_t(yoe + era * 400 + (m <= 2));
  *month = int32_t(m);
  *day = int32_t(d);
}

int64_t FloorDiv(int64_t a, int64_t b) {
  return a / b - ((a % b != 0) && ((a < 0) != (b < 0)));
}

}  // namespace

DateTime DateTime::FromGrib(int64_t date, int64_t time) {
  return DateTime{int32_t(date / 10000), int32_t(date % 10000 / 100), int32_t(date % 100),
                  int32_t(time / 100), int32_t(time % 100)};
}

DateTime DateTime::FromEpochSeconds(int64_t seconds) {
  const int64_t days = FloorDiv(seconds, 86400);
  const int64_t secondOfDay = seconds - days * 86400;
  DateTime result;
  CivilFromDays(days, &result.year, &result.month, &result.day);
  result.hour = int32_t(secondOfDay / 3600);
  result.minute = int32_t(secondOfDay % 3600 / 60);
  return result;
}

int64_t DateTime::epochSeconds() const {
  return DaysFromCivil(year, month, day) * 86400 + int64_t(hour) * 3600 + int64_t(minute) * 60;
}

DateTime DateTime::addHours(int64_t hours) const {
  return FromEpochSeconds(epochSeconds() + hours * 3600);
}

std::string DateTime::isoformat() const {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:00", year, month, day, hour,
                minute);
  return buffer;
}

bool operator==(const DateTime& a, const DateTime& b) {
  return a.epochSeconds() == b.epochSeconds();
}

bool operator!=(const DateTime& a, const DateTime& b) {
  return !(a == b);
}

bool operator<(const DateTime& a, const DateTime& b) {
  return a.epochSeconds() < b.epochSeconds();
}

// BoundingBox /////////////////////////////////////////////////////////////////

BoundingBox BoundingBox::Merge(const BoundingBox& a, const BoundingBox& b) {
  BoundingBox result;
  result.north = std::max(a.north, b.north);
  result.south = std::min(a.south, b.south);
  result.west = std::min(a.west, b.west);
  result.east = std::max(a.east, b.east);
  return result;
}

}  // namespace gribscan
