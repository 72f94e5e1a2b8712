#pragma once
#include <cstddef>
#include <cstdint>

namespace ocean {

// 1 字节 BCD -> 0..99，非法半字节返回 -1
inline int bcdToInt(uint8_t b) {
  int hi = (b >> 4) & 0x0F, lo = b & 0x0F;
  if (hi > 9 || lo > 9) return -1;
  return hi * 10 + lo;
}

// 0..99 -> 1 字节 BCD，超出范围返回 0xFF
inline uint8_t intToBcd(int v) {
  if (v < 0 || v > 99) return 0xFF;
  return static_cast<uint8_t>(((v / 10) << 4) | (v % 10));
}

// 小端读写
inline uint16_t readU16Le(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

inline int16_t readI16Le(const uint8_t* p) {
  return static_cast<int16_t>(readU16Le(p));
}

inline uint32_t readU32Le(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

inline void writeU16Le(uint8_t* p, uint16_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

inline void writeU32Le(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

}  // namespace ocean
