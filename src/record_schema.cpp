#include "ocean_ros_driver/record_schema.hpp"

#include <ros/console.h>

#include <algorithm>
#include <set>
#include <stdexcept>

#include "ocean_ros_driver/base64.hpp"
#include "ocean_ros_driver/bcd_utils.hpp"
#include "ocean_ros_driver/checksum.hpp"

namespace ocean {

const char* toString(SetError e) {
  switch (e) {
    case SetError::None:
      return "ok";
    case SetError::Protected:
      return "protected";
    case SetError::UnknownField:
      return "unknown field";
    case SetError::InvalidValue:
      return "invalid value";
  }
  return "?";
}

const Value* DecodedRecord::find(const std::string& name) const {
  for (const auto& kv : values) {
    if (kv.first == name) return &kv.second;
  }
  return nullptr;
}

RecordSchema::RecordSchema(std::shared_ptr<const RecordLayout> layout)
    : layout_(std::move(layout)) {
  if (!layout_) {
    throw std::logic_error("record schema without a layout");
  }
  const RecordLayout& l = *layout_;

  std::set<std::string> seen;
  size_t pos = l.sync.size();
  for (const FieldDescriptor& f : l.fields) {
    if (f.offset != pos || f.length == 0 || f.codec == nullptr) {
      throw std::logic_error(l.stream + ": field " + f.name +
                             " does not continue the layout at offset " +
                             std::to_string(pos));
    }
    if (!seen.insert(f.name).second) {
      throw std::logic_error(l.stream + ": duplicate field " + f.name);
    }
    pos += f.length;
  }
  if (l.has_checksum) pos += 2;
  if (pos != l.total_length) {
    throw std::logic_error(l.stream + ": fields cover " + std::to_string(pos) +
                           " bytes, record is " +
                           std::to_string(l.total_length));
  }

  for (const BitFieldDescriptor& b : l.bitfields) {
    const FieldDescriptor* parent = findField(b.parent);
    if (parent == nullptr || parent->length != 2 || b.bits.width == 0 ||
        b.bits.lsb + b.bits.width > 16) {
      throw std::logic_error(l.stream + ": bad bit field " + b.name);
    }
    if (!seen.insert(b.name).second) {
      throw std::logic_error(l.stream + ": duplicate field " + b.name);
    }
  }

  for (const FieldDescriptor& f : l.fields) {
    if (!f.codec->spare) config_[f.name] = f.default_value;
  }
}

const FieldDescriptor* RecordSchema::findField(const std::string& name) const {
  for (const FieldDescriptor& f : layout_->fields) {
    if (!f.codec->spare && name == f.name) return &f;
  }
  return nullptr;
}

const BitFieldDescriptor* RecordSchema::findBitField(
    const std::string& name) const {
  for (const BitFieldDescriptor& b : layout_->bitfields) {
    if (name == b.name) return &b;
  }
  return nullptr;
}

Value RecordSchema::bitValue(const BitFieldDescriptor& b) const {
  auto it = config_.find(b.parent);
  if (it == config_.end() || it->second.type() != Value::Type::Integer) {
    return Value();
  }
  Word16 w(static_cast<uint16_t>(it->second.asInt()));
  return Value::integer(w.get(b.bits));
}

DecodedRecord RecordSchema::decode(const uint8_t* raw, size_t len) const {
  const RecordLayout& l = *layout_;
  if (len < l.total_length) {
    throw SampleException(l.stream + ": need " +
                          std::to_string(l.total_length) + " bytes, got " +
                          std::to_string(len));
  }
  if (!std::equal(l.sync.begin(), l.sync.end(), raw)) {
    throw SampleException(l.stream + ": sync bytes do not match");
  }

  DecodedRecord rec;
  rec.stream = l.stream;
  rec.raw.assign(raw, raw + std::min(len, frameLength()));

  for (const FieldDescriptor& f : l.fields) {
    if (f.codec->spare) continue;
    try {
      rec.values.emplace_back(f.name, f.codec->decode(raw + f.offset, f.length));
    } catch (const std::exception& e) {
      ROS_WARN("%s: failed to decode %s (%s)", l.stream.c_str(), f.name,
               e.what());
      rec.values.emplace_back(f.name, Value());
      rec.encoding_errors.push_back(f.name);
    }
  }

  for (const BitFieldDescriptor& b : l.bitfields) {
    const Value* parent = rec.find(b.parent);
    if (parent == nullptr || parent->isNull()) {
      rec.values.emplace_back(b.name, Value());
      rec.encoding_errors.push_back(b.name);
      continue;
    }
    Word16 w(static_cast<uint16_t>(parent->asInt()));
    rec.values.emplace_back(b.name, Value::integer(w.get(b.bits)));
  }

  if (l.derive) l.derive(rec);

  if (l.has_checksum) {
    size_t at = l.total_length - 2;
    rec.checksum_valid =
        validate(kChecksumSeed, raw, at, readU16Le(raw + at));
    if (!rec.checksum_valid) {
      ROS_WARN("%s: checksum mismatch", l.stream.c_str());
    }
  }

  if (l.timestamp) {
    rec.has_internal_timestamp = l.timestamp(raw, len, rec.internal_timestamp);
  }
  return rec;
}

std::vector<uint8_t> RecordSchema::encode(const ValueMap& values) const {
  const RecordLayout& l = *layout_;
  std::vector<uint8_t> out(l.total_length, 0);
  std::copy(l.sync.begin(), l.sync.end(), out.begin());

  for (const FieldDescriptor& f : l.fields) {
    if (f.codec->spare) continue;
    const Value* v = nullptr;
    auto it = values.find(f.name);
    if (it != values.end() && !it->second.isNull()) {
      v = &it->second;
    } else if (!f.default_value.isNull()) {
      v = &f.default_value;
    }
    if (v == nullptr) continue;
    try {
      f.codec->encode(*v, out.data() + f.offset, f.length);
    } catch (const std::exception& e) {
      throw ParameterException(
          l.stream + ": cannot encode " + f.name + " (" + e.what() + ")",
          SetError::InvalidValue);
    }
  }

  for (const BitFieldDescriptor& b : l.bitfields) {
    auto it = values.find(b.name);
    if (it == values.end() || it->second.isNull()) continue;
    const FieldDescriptor* parent = findField(b.parent);
    uint8_t* p = out.data() + parent->offset;
    try {
      int64_t x = it->second.asInt();
      if (x < 0) throw std::out_of_range("negative bit field value");
      Word16 w = Word16(readU16Le(p)).with(b.bits, static_cast<unsigned>(x));
      writeU16Le(p, w.raw());
    } catch (const std::exception& e) {
      throw ParameterException(
          l.stream + ": cannot encode " + b.name + " (" + e.what() + ")",
          SetError::InvalidValue);
    }
  }

  if (l.has_checksum) {
    size_t at = l.total_length - 2;
    writeU16Le(out.data() + at, checksumBytes(kChecksumSeed, out.data(), at));
  }
  return out;
}

ValueMap RecordSchema::getConfig() const {
  ValueMap out = config_;
  for (const BitFieldDescriptor& b : layout_->bitfields) {
    out[b.name] = bitValue(b);
  }
  return out;
}

Value RecordSchema::get(const std::string& name) const {
  if (findField(name)) return config_.at(name);
  if (const BitFieldDescriptor* b = findBitField(name)) return bitValue(*b);
  throw ParameterException(name + " is not a valid parameter",
                           SetError::UnknownField);
}

bool RecordSchema::has(const std::string& name) const {
  return findField(name) != nullptr || findBitField(name) != nullptr;
}

Mutability RecordSchema::mutability(const std::string& name) const {
  if (const FieldDescriptor* f = findField(name)) return f->mutability;
  if (const BitFieldDescriptor* b = findBitField(name)) return b->mutability;
  throw ParameterException(name + " is not a valid parameter",
                           SetError::UnknownField);
}

Lifecycle RecordSchema::lifecycle(const std::string& name) const {
  if (const FieldDescriptor* f = findField(name)) return f->lifecycle;
  if (const BitFieldDescriptor* b = findBitField(name)) return b->lifecycle;
  throw ParameterException(name + " is not a valid parameter",
                           SetError::UnknownField);
}

std::vector<std::string> RecordSchema::names() const {
  std::vector<std::string> out;
  for (const FieldDescriptor& f : layout_->fields) {
    if (!f.codec->spare) out.push_back(f.name);
  }
  for (const BitFieldDescriptor& b : layout_->bitfields) {
    out.push_back(b.name);
  }
  return out;
}

SetError RecordSchema::set(const std::string& name, const Value& value,
                           bool startup) {
  const FieldDescriptor* f = findField(name);
  const BitFieldDescriptor* b = f ? nullptr : findBitField(name);
  if (f == nullptr && b == nullptr) return SetError::UnknownField;

  Mutability m = f ? f->mutability : b->mutability;
  if (m == Mutability::ReadOnly || (m == Mutability::Immutable && !startup)) {
    return SetError::Protected;
  }

  if (f) {
    std::vector<uint8_t> scratch(f->length, 0);
    try {
      f->codec->encode(value, scratch.data(), f->length);
    } catch (const std::exception& e) {
      ROS_DEBUG("%s: rejected %s = %s (%s)", layout_->stream.c_str(), f->name,
                value.toString().c_str(), e.what());
      return SetError::InvalidValue;
    }
    config_[name] = value;
    return SetError::None;
  }

  const Value& parent = config_[b->parent];
  uint16_t raw = 0;
  if (parent.type() == Value::Type::Integer) {
    raw = static_cast<uint16_t>(parent.asInt());
  }
  try {
    int64_t x = value.asInt();
    if (x < 0) throw std::out_of_range("negative bit field value");
    Word16 w = Word16(raw).with(b->bits, static_cast<unsigned>(x));
    config_[b->parent] = Value::integer(w.raw());
  } catch (const std::exception& e) {
    ROS_DEBUG("%s: rejected %s = %s (%s)", layout_->stream.c_str(), b->name,
              value.toString().c_str(), e.what());
    return SetError::InvalidValue;
  }
  return SetError::None;
}

void RecordSchema::hydrate(const uint8_t* raw, size_t len) {
  DecodedRecord rec = decode(raw, len);
  if (!rec.encoding_errors.empty()) {
    throw SampleException(stream() + ": cannot load configuration, " +
                          rec.encoding_errors.front() + " is malformed");
  }
  if (!rec.checksum_valid) {
    throw SampleException(stream() + ": cannot load configuration, " +
                          "checksum mismatch");
  }
  for (const FieldDescriptor& f : layout_->fields) {
    if (f.codec->spare) continue;
    config_[f.name] = *rec.find(f.name);
  }
}

std::vector<uint8_t> RecordSchema::serialize() const { return encode(config_); }

std::string RecordSchema::snapshot() const { return base64Encode(serialize()); }

void RecordSchema::restore(const std::string& encoded) {
  std::vector<uint8_t> raw;
  if (!base64Decode(encoded, raw)) {
    throw ParameterException(stream() + ": snapshot is not valid base64");
  }
  if (raw.size() != layout_->total_length) {
    throw ParameterException(stream() + ": snapshot has " +
                             std::to_string(raw.size()) + " bytes, expected " +
                             std::to_string(layout_->total_length));
  }
  hydrate(raw.data(), raw.size());
}

}  // namespace ocean
