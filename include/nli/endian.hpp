#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace nli {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint16_t byteswap(uint16_t value) noexcept {
  return static_cast<uint16_t>((value << 8) | (value >> 8));
}

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return (static_cast<uint64_t>(byteswap(static_cast<uint32_t>(value))) << 32) |
         byteswap(static_cast<uint32_t>(value >> 32));
}

} // namespace detail

// Check if the system is little-endian at compile time
inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// ZIP stores every integer little-endian (glibc reserves the htole16 family as macros)
inline constexpr uint16_t toLittleEndian16(uint16_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint32_t toLittleEndian32(uint32_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint64_t toLittleEndian64(uint64_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint16_t fromLittleEndian16(uint16_t value) noexcept {
  return toLittleEndian16(value);
}

inline constexpr uint32_t fromLittleEndian32(uint32_t value) noexcept {
  return toLittleEndian32(value);
}

inline constexpr uint64_t fromLittleEndian64(uint64_t value) noexcept {
  return toLittleEndian64(value);
}

// Store a host value little-endian at dest
inline void storeLE16(uint8_t *dest, uint16_t value) noexcept {
  uint16_t le = toLittleEndian16(value);
  std::memcpy(dest, &le, 2);
}

inline void storeLE32(uint8_t *dest, uint32_t value) noexcept {
  uint32_t le = toLittleEndian32(value);
  std::memcpy(dest, &le, 4);
}

inline void storeLE64(uint8_t *dest, uint64_t value) noexcept {
  uint64_t le = toLittleEndian64(value);
  std::memcpy(dest, &le, 8);
}

// Load a little-endian value from src into host order
inline uint16_t loadLE16(const uint8_t *src) noexcept {
  uint16_t le;
  std::memcpy(&le, src, 2);
  return fromLittleEndian16(le);
}

inline uint32_t loadLE32(const uint8_t *src) noexcept {
  uint32_t le;
  std::memcpy(&le, src, 4);
  return fromLittleEndian32(le);
}

inline uint64_t loadLE64(const uint8_t *src) noexcept {
  uint64_t le;
  std::memcpy(&le, src, 8);
  return fromLittleEndian64(le);
}

} // namespace nli
