#pragma once

#include "types.hpp"
#include <cstring>

// Do not compile on systems with non-8-bit bytes
static_assert(std::numeric_limits<unsigned char>::digits == 8);

namespace gribscan {

namespace internal {

/* magic bytes */
constexpr uint64_t MagicLength = sizeof(Magic);
/* magic bytes, 3-byte total length, edition number */
constexpr uint64_t IndicatorLength = sizeof(Magic) + 3 + 1;
/* octets 9-16 of an edition 2 indicator section */
constexpr uint64_t Edition2LengthSize = 8;
constexpr uint32_t Edition1LengthFlag = 0x800000;
constexpr uint32_t Edition1LengthMask = 0x7fffff;
constexpr uint8_t Section2PresentFlag = 1 << 7;
constexpr uint8_t Section3PresentFlag = 1 << 6;
/* section 4 lengths below this mean the total length field was scaled by 120 */
constexpr uint32_t Edition1LengthScale = 120;

inline std::string ToHex(uint8_t byte) {
  std::string result{2, '\0'};
  result[0] = "0123456789ABCDEF"[(uint8_t(byte) >> 4) & 0x0F];
  result[1] = "0123456789ABCDEF"[uint8_t(byte) & 0x0F];
  return result;
}
inline std::string ToHex(std::byte byte) {
  return ToHex(uint8_t(byte));
}

inline std::string to_string(const std::string& arg) {
  return arg;
}
inline std::string to_string(std::string_view arg) {
  return std::string(arg);
}
inline std::string to_string(const char* arg) {
  return std::string(arg);
}
template <typename... T>
[[nodiscard]] inline std::string StrCat(T&&... args) {
  using gribscan::internal::to_string;
  using std::to_string;
  return ("" + ... + to_string(std::forward<T>(args)));
}

// GRIB stores every multi-byte integer big-endian

inline uint32_t ParseUint24(const std::byte* data) {
  return (uint32_t(data[0]) << 16) | (uint32_t(data[1]) << 8) | uint32_t(data[2]);
}

inline uint64_t ParseUint64(const std::byte* data) {
  return (uint64_t(data[0]) << 56) | (uint64_t(data[1]) << 48) | (uint64_t(data[2]) << 40) |
         (uint64_t(data[3]) << 32) | (uint64_t(data[4]) << 24) | (uint64_t(data[5]) << 16) |
         (uint64_t(data[6]) << 8) | uint64_t(data[7]);
}

inline bool IsMagic(const std::byte* data) {
  return std::memcmp(data, Magic, sizeof(Magic)) == 0;
}

inline std::string BytesToHex(const std::byte* data, uint64_t size) {
  std::string result;
  for (uint64_t i = 0; i < size; ++i) {
    result += internal::ToHex(data[i]);
  }
  return result;
}

}  // namespace internal

}  // namespace gribscan
