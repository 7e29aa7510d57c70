#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace tilext {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return ((value & 0x00000000000000FFull) << 56) | ((value & 0x000000000000FF00ull) << 40) |
         ((value & 0x0000000000FF0000ull) << 24) | ((value & 0x00000000FF000000ull) << 8) |
         ((value & 0x000000FF00000000ull) >> 8) | ((value & 0x0000FF0000000000ull) >> 24) |
         ((value & 0x00FF000000000000ull) >> 40) | ((value & 0xFF00000000000000ull) >> 56);
}

} // namespace detail

inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// Host <-> little-endian conversion (index.bin and tile headers are little-endian)
inline constexpr uint32_t htole32(uint32_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint64_t htole64(uint64_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint32_t letoh32(uint32_t value) noexcept {
  return htole32(value);
}

inline constexpr uint64_t letoh64(uint64_t value) noexcept {
  return htole64(value);
}

// Unaligned little-endian loads and stores
inline uint32_t loadLE32(const uint8_t *src) noexcept {
  uint32_t value;
  std::memcpy(&value, src, sizeof(value));
  return letoh32(value);
}

inline uint64_t loadLE64(const uint8_t *src) noexcept {
  uint64_t value;
  std::memcpy(&value, src, sizeof(value));
  return letoh64(value);
}

inline void storeLE32(uint8_t *dst, uint32_t value) noexcept {
  value = htole32(value);
  std::memcpy(dst, &value, sizeof(value));
}

inline void storeLE64(uint8_t *dst, uint64_t value) noexcept {
  value = htole64(value);
  std::memcpy(dst, &value, sizeof(value));
}

} // namespace tilext
