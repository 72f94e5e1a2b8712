#include "ocean_ros_driver/value.hpp"

#include <cstdio>
#include <stdexcept>

#include "ocean_ros_driver/base64.hpp"

namespace ocean {

Value::Value() : type_(Type::Null), int_(0) {}

Value Value::integer(int64_t v) {
  Value out;
  out.type_ = Type::Integer;
  out.int_ = v;
  return out;
}

Value Value::text(const std::string& v) {
  Value out;
  out.type_ = Type::Text;
  out.text_ = v;
  return out;
}

Value Value::bytes(const std::vector<uint8_t>& v) {
  Value out;
  out.type_ = Type::Bytes;
  out.bytes_ = v;
  return out;
}

Value Value::intList(const std::vector<int64_t>& v) {
  Value out;
  out.type_ = Type::IntList;
  out.list_ = v;
  return out;
}

int64_t Value::asInt() const {
  if (type_ != Type::Integer) {
    throw std::invalid_argument("value is not an integer: " + toString());
  }
  return int_;
}

const std::string& Value::asText() const {
  if (type_ != Type::Text) {
    throw std::invalid_argument("value is not text: " + toString());
  }
  return text_;
}

const std::vector<uint8_t>& Value::asBytes() const {
  if (type_ != Type::Bytes) {
    throw std::invalid_argument("value is not a byte block: " + toString());
  }
  return bytes_;
}

const std::vector<int64_t>& Value::asIntList() const {
  if (type_ != Type::IntList) {
    throw std::invalid_argument("value is not an integer list: " +
                                toString());
  }
  return list_;
}

bool Value::operator==(const Value& other) const {
  if (type_ != other.type_) return false;
  switch (type_) {
    case Type::Null:
      return true;
    case Type::Integer:
      return int_ == other.int_;
    case Type::Text:
      return text_ == other.text_;
    case Type::Bytes:
      return bytes_ == other.bytes_;
    case Type::IntList:
      return list_ == other.list_;
  }
  return false;
}

std::string Value::toString() const {
  char buf[64];
  switch (type_) {
    case Type::Null:
      return "null";
    case Type::Integer:
      std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(int_));
      return buf;
    case Type::Text:
      return text_;
    case Type::Bytes:
      std::snprintf(buf, sizeof(buf), "<%zu bytes>", bytes_.size());
      return buf;
    case Type::IntList: {
      std::string s = "[";
      for (size_t i = 0; i < list_.size(); ++i) {
        if (i) s += ", ";
        std::snprintf(buf, sizeof(buf), "%lld",
                      static_cast<long long>(list_[i]));
        s += buf;
      }
      return s + "]";
    }
  }
  return "";
}

std::string Value::toJson() const {
  switch (type_) {
    case Type::Null:
      return "null";
    case Type::Integer:
    case Type::IntList:
      return toString();
    case Type::Text:
      return "\"" + jsonEscape(text_) + "\"";
    case Type::Bytes:
      return "\"" + base64Encode(bytes_) + "\"";
  }
  return "null";
}

std::string jsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20 ||
            static_cast<unsigned char>(c) >= 0x7F) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x",
                        static_cast<unsigned char>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

}  // namespace ocean
