#include "ocean_ros_driver/base64.hpp"

namespace ocean {

static const char base64CharacterSet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

static int indexOf(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

std::string base64Encode(const std::vector<uint8_t>& data) {
  std::string out;
  out.reserve((data.size() + 2) / 3 * 4);

  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    uint32_t x = (static_cast<uint32_t>(data[i]) << 16) |
                 (static_cast<uint32_t>(data[i + 1]) << 8) | data[i + 2];
    for (int j = 3; j >= 0; --j) {
      out += base64CharacterSet[(x >> (6 * j)) & 0x3F];
    }
  }

  size_t rest = data.size() - i;
  if (rest == 1) {
    uint32_t x = static_cast<uint32_t>(data[i]) << 16;
    out += base64CharacterSet[(x >> 18) & 0x3F];
    out += base64CharacterSet[(x >> 12) & 0x3F];
    out += "==";
  } else if (rest == 2) {
    uint32_t x = (static_cast<uint32_t>(data[i]) << 16) |
                 (static_cast<uint32_t>(data[i + 1]) << 8);
    out += base64CharacterSet[(x >> 18) & 0x3F];
    out += base64CharacterSet[(x >> 12) & 0x3F];
    out += base64CharacterSet[(x >> 6) & 0x3F];
    out += '=';
  }
  return out;
}

bool base64Decode(const std::string& encoded, std::vector<uint8_t>& out) {
  out.clear();
  if (encoded.size() % 4 != 0) return false;

  for (size_t i = 0; i < encoded.size(); i += 4) {
    uint32_t x = 0;
    int pad = 0;
    for (size_t j = 0; j < 4; ++j) {
      char c = encoded[i + j];
      if (c == '=') {
        // padding only allowed in the last two positions of the last group
        if (i + 4 != encoded.size() || j < 2) return false;
        ++pad;
        x <<= 6;
        continue;
      }
      if (pad) return false;
      int idx = indexOf(c);
      if (idx < 0) return false;
      x = (x << 6) | static_cast<uint32_t>(idx);
    }
    out.push_back(static_cast<uint8_t>((x >> 16) & 0xFF));
    if (pad < 2) out.push_back(static_cast<uint8_t>((x >> 8) & 0xFF));
    if (pad < 1) out.push_back(static_cast<uint8_t>(x & 0xFF));
  }
  return true;
}

}  // namespace ocean
