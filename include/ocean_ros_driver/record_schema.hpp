/*!
 *  \file         record_schema.hpp
 *  \author       BW
 *  \date         05/12/2025
 *  \brief        Parameter dictionary over a fixed-layout record.
 *
 *  Ordered field table with sync bytes, length and checksum. Decodes captured frames, encodes parameter sets back into checksummed frames and keeps the current configuration of the record.
 *
 *  \section CodeCopyright Copyright Notice
 *  MIT License
 *
 *  Copyright (C) 2025, BEWIS SENSING. All rights reserved.
 *
 *  Permission is hereby granted, free of charge, to any person obtaining a copy
 *  of this software and associated documentation files (the "Software"), to
 * deal in the Software without restriction, including without limitation the
 * rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
 * sell copies of the Software, and to permit persons to whom the Software is
 *  furnished to do so, subject to the following conditions:
 *
 *  The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 *  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 *  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 *  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 *  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 *  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
 * FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
 * IN THE SOFTWARE.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ocean_ros_driver/exceptions.hpp"
#include "ocean_ros_driver/field_codec.hpp"
#include "ocean_ros_driver/value.hpp"

namespace ocean {

struct DecodedRecord {
  std::string stream;
  // Declaration order; a field that failed to decode is present with a
  // null value and its name is listed in encoding_errors.
  std::vector<std::pair<std::string, Value>> values;
  std::vector<std::string> encoding_errors;
  bool checksum_valid = true;
  bool has_internal_timestamp = false;
  double internal_timestamp = 0.0;  // NTP seconds
  std::vector<uint8_t> raw;

  const Value* find(const std::string& name) const;
};

// Extracts the device timestamp of a frame as NTP seconds.
using TimestampFn = bool (*)(const uint8_t* frame, size_t len, double& ntp);
// Adds values computed from several fields after decoding.
using DeriveFn = void (*)(DecodedRecord& rec);

struct RecordLayout {
  std::string stream;
  std::vector<uint8_t> sync;
  size_t total_length;  // sync + fields + checksum, trailer excluded
  bool has_checksum;
  std::vector<uint8_t> trailer;
  std::vector<FieldDescriptor> fields;
  std::vector<BitFieldDescriptor> bitfields;
  TimestampFn timestamp;
  DeriveFn derive;
};

class RecordSchema {
 public:
  // Throws std::logic_error when the field spans do not tile the record.
  explicit RecordSchema(std::shared_ptr<const RecordLayout> layout);

  const RecordLayout& layout() const { return *layout_; }
  const std::string& stream() const { return layout_->stream; }
  size_t frameLength() const {
    return layout_->total_length + layout_->trailer.size();
  }

  /*!
   * \brief Decodes one frame.
   *
   * Field failures are recorded in the result rather than raised. The
   * checksum is reported in checksum_valid.
   *
   * \throws SampleException when the input is shorter than the record or
   *         does not start with the sync bytes.
   */
  DecodedRecord decode(const uint8_t* raw, size_t len) const;

  /*!
   * \brief Encodes values into a checksummed frame of total_length bytes.
   *
   * Fields are written in declaration order. A field missing from values
   * takes its default, or zeros when it has none. Spare regions are always
   * zero. Bit field entries are merged into their parent word.
   *
   * \throws ParameterException when a value cannot be encoded.
   */
  std::vector<uint8_t> encode(const ValueMap& values) const;

  // Current configuration, bit fields included.
  ValueMap getConfig() const;
  Value get(const std::string& name) const;
  bool has(const std::string& name) const;
  Mutability mutability(const std::string& name) const;
  Lifecycle lifecycle(const std::string& name) const;
  std::vector<std::string> names() const;

  // Read-only fields are never writable; immutable ones only with startup.
  SetError set(const std::string& name, const Value& value,
               bool startup = false);

  // Replaces the configuration with the contents of a device frame.
  void hydrate(const uint8_t* raw, size_t len);
  std::vector<uint8_t> serialize() const;

  // Base64 of serialize(); restore() is its inverse.
  std::string snapshot() const;
  void restore(const std::string& encoded);

 private:
  const FieldDescriptor* findField(const std::string& name) const;
  const BitFieldDescriptor* findBitField(const std::string& name) const;
  Value bitValue(const BitFieldDescriptor& b) const;

  std::shared_ptr<const RecordLayout> layout_;
  ValueMap config_;
};

}  // namespace ocean
