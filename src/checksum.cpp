#include "ocean_ros_driver/checksum.hpp"

#include "ocean_ros_driver/bcd_utils.hpp"

namespace ocean {

uint16_t checksum(uint16_t seed, const uint16_t* words, size_t count) {
  uint32_t sum = seed;
  for (size_t i = 0; i < count; ++i) {
    sum += words[i];
  }
  return static_cast<uint16_t>(sum & 0xFFFF);
}

uint16_t checksumBytes(uint16_t seed, const uint8_t* payload, size_t len) {
  uint32_t sum = seed;
  size_t i = 0;
  for (; i + 1 < len; i += 2) {
    sum += readU16Le(payload + i);
  }
  if (i < len) {
    sum += payload[i];
  }
  return static_cast<uint16_t>(sum & 0xFFFF);
}

bool validate(uint16_t seed, const uint8_t* payload, size_t len,
              uint16_t claimed) {
  return checksumBytes(seed, payload, len) == claimed;
}

}  // namespace ocean
