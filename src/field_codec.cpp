#include "ocean_ros_driver/field_codec.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

#include "ocean_ros_driver/bcd_utils.hpp"

namespace ocean {

const char* toString(Mutability m) {
  switch (m) {
    case Mutability::ReadOnly:
      return "read-only";
    case Mutability::ReadWrite:
      return "read-write";
    case Mutability::Immutable:
      return "immutable";
  }
  return "?";
}

Word16 Word16::with(BitRange r, unsigned v) const {
  if (r.width == 0 || r.lsb + r.width > 16) {
    throw std::out_of_range("bit range outside a 16-bit word");
  }
  if (v >= (1u << r.width)) {
    throw std::out_of_range("value " + std::to_string(v) + " exceeds " +
                            std::to_string(r.width) + " bit(s)");
  }
  uint16_t raw = static_cast<uint16_t>((raw_ & ~r.mask()) |
                                       ((v << r.lsb) & r.mask()));
  return Word16(raw);
}

namespace {

void requireLength(size_t len, size_t want) {
  if (len != want) {
    throw std::length_error("field width " + std::to_string(len) +
                            ", codec expects " + std::to_string(want));
  }
}

int64_t checkedInt(const Value& v, int64_t lo, int64_t hi) {
  int64_t x = v.asInt();
  if (x < lo || x > hi) {
    throw std::out_of_range("value " + std::to_string(x) + " not in [" +
                            std::to_string(lo) + ", " + std::to_string(hi) +
                            "]");
  }
  return x;
}

Value decodeU8(const uint8_t* p, size_t len) {
  requireLength(len, 1);
  return Value::integer(p[0]);
}

void encodeU8(const Value& v, uint8_t* out, size_t len) {
  requireLength(len, 1);
  out[0] = static_cast<uint8_t>(checkedInt(v, 0, 0xFF));
}

Value decodeU16(const uint8_t* p, size_t len) {
  requireLength(len, 2);
  return Value::integer(readU16Le(p));
}

void encodeU16(const Value& v, uint8_t* out, size_t len) {
  requireLength(len, 2);
  writeU16Le(out, static_cast<uint16_t>(checkedInt(v, 0, 0xFFFF)));
}

Value decodeI16(const uint8_t* p, size_t len) {
  requireLength(len, 2);
  return Value::integer(readI16Le(p));
}

void encodeI16(const Value& v, uint8_t* out, size_t len) {
  requireLength(len, 2);
  int64_t x = checkedInt(v, -32768, 32767);
  writeU16Le(out, static_cast<uint16_t>(static_cast<int16_t>(x)));
}

Value decodeU32(const uint8_t* p, size_t len) {
  requireLength(len, 4);
  return Value::integer(readU32Le(p));
}

void encodeU32(const Value& v, uint8_t* out, size_t len) {
  requireLength(len, 4);
  writeU32Le(out, static_cast<uint32_t>(checkedInt(v, 0, 0xFFFFFFFFLL)));
}

// Text is cut at the first NUL; the remainder of the field is padding.
Value decodeText(const uint8_t* p, size_t len) {
  size_t n = 0;
  while (n < len && p[n] != 0) ++n;
  return Value::text(std::string(reinterpret_cast<const char*>(p), n));
}

void encodeText(const Value& v, uint8_t* out, size_t len) {
  const std::string& s = v.asText();
  std::memset(out, 0, len);
  std::memcpy(out, s.data(), s.size() < len ? s.size() : len);
}

Value decodeBcdClock(const uint8_t* p, size_t len) {
  requireLength(len, 6);
  std::vector<int64_t> parts;
  parts.reserve(6);
  for (size_t i = 0; i < len; ++i) {
    int d = bcdToInt(p[i]);
    if (d < 0) {
      throw std::invalid_argument("invalid BCD byte in clock field");
    }
    parts.push_back(d);
  }
  return Value::intList(parts);
}

void encodeBcdClock(const Value& v, uint8_t* out, size_t len) {
  requireLength(len, 6);
  const std::vector<int64_t>& parts = v.asIntList();
  if (parts.size() != 6) {
    throw std::invalid_argument("clock field needs 6 elements");
  }
  for (size_t i = 0; i < 6; ++i) {
    if (parts[i] < 0 || parts[i] > 99) {
      throw std::out_of_range("clock element out of range");
    }
    out[i] = intToBcd(static_cast<int>(parts[i]));
  }
}

Value decodeBytes(const uint8_t* p, size_t len) {
  return Value::bytes(std::vector<uint8_t>(p, p + len));
}

void encodeBytes(const Value& v, uint8_t* out, size_t len) {
  const std::vector<uint8_t>& b = v.asBytes();
  requireLength(b.size(), len);
  std::memcpy(out, b.data(), len);
}

}  // namespace

namespace codec {
const FieldCodec kU8 = {decodeU8, encodeU8, false};
const FieldCodec kU16 = {decodeU16, encodeU16, false};
const FieldCodec kI16 = {decodeI16, encodeI16, false};
const FieldCodec kU32 = {decodeU32, encodeU32, false};
const FieldCodec kText = {decodeText, encodeText, false};
const FieldCodec kBcdClock = {decodeBcdClock, encodeBcdClock, false};
const FieldCodec kBytes = {decodeBytes, encodeBytes, false};
const FieldCodec kSpare = {nullptr, nullptr, true};
}  // namespace codec

}  // namespace ocean
