#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace gribscan::internal {

/**
 * Byte-wise CRC32 lookup table for the reflected IEEE polynomial. Used to derive
 * stable, short cache file names from a source file's identity, so the value must
 * never change between library versions.
 */
struct CRC32Table {
private:
  std::array<uint32_t, 256> table = {};

public:
  constexpr CRC32Table() {
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t r = i;
      for (int bit = 0; bit < 8; bit++) {
        r = ((r & 1) * 0xedb88320) ^ (r >> 1);
      }
      table[i] = r;
    }
  }

  constexpr uint32_t operator[](size_t index) const {
    return table[index];
  }
};

static constexpr CRC32Table CRC32_TABLE;

static constexpr uint32_t CRC32_INIT = 0xffffffff;

inline uint32_t crc32Update(uint32_t prev, std::string_view data) {
  uint32_t r = prev;
  for (const char c : data) {
    r = CRC32_TABLE[(r ^ uint8_t(c)) & 0xff] ^ (r >> 8);
  }
  return r;
}

inline uint32_t crc32Final(uint32_t crc) {
  return crc ^ 0xffffffff;
}

/** Eight lowercase hex digits of the CRC32 of `data`. */
inline std::string crc32Hex(std::string_view data) {
  const uint32_t crc = crc32Final(crc32Update(CRC32_INIT, data));
  std::string result(8, '0');
  for (int i = 7, shift = 0; i >= 0; i--, shift += 4) {
    result[size_t(i)] = "0123456789abcdef"[(crc >> shift) & 0xf];
  }
  return result;
}

}  // namespace gribscan::internal
