/*!
 *  \file         field_codec.hpp
 *  \author       BW
 *  \date         04/12/2025
 *  \brief        Binary field descriptors and codecs.
 *
 *  Maps a named parameter to a byte range of a fixed-layout record, with the decode and encode functions of its wire type.
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

#include "ocean_ros_driver/value.hpp"

namespace ocean {

enum class Mutability { ReadOnly, ReadWrite, Immutable };
enum class Lifecycle { StartupOnly, DirectAccessEligible, Runtime };

const char* toString(Mutability m);

// Decoders throw std::exception subclasses on malformed bytes.
using DecodeFn = Value (*)(const uint8_t* p, size_t len);
// Encoders write exactly len bytes and throw on a value they cannot encode.
using EncodeFn = void (*)(const Value& v, uint8_t* out, size_t len);

struct FieldCodec {
  DecodeFn decode;
  EncodeFn encode;
  bool spare;  // reserved region, always written as zeros
};

namespace codec {
extern const FieldCodec kU8;
extern const FieldCodec kU16;
extern const FieldCodec kI16;
extern const FieldCodec kU32;
extern const FieldCodec kText;      // null padded, lossy on overflow
extern const FieldCodec kBcdClock;  // 6 BCD bytes as an integer list
extern const FieldCodec kBytes;     // opaque block, published as base64
extern const FieldCodec kSpare;
}  // namespace codec

struct FieldDescriptor {
  const char* name;
  size_t offset;
  size_t length;
  const FieldCodec* codec;
  Mutability mutability;
  Lifecycle lifecycle;
  Value default_value;  // Null when the field has no default
};

struct BitRange {
  unsigned lsb;
  unsigned width;

  uint16_t mask() const {
    return static_cast<uint16_t>(((1u << width) - 1u) << lsb);
  }
};

// A 16-bit register with bit ranges counted from the least significant bit.
class Word16 {
 public:
  explicit Word16(uint16_t raw = 0) : raw_(raw) {}

  uint16_t raw() const { return raw_; }
  unsigned get(BitRange r) const { return (raw_ & r.mask()) >> r.lsb; }

  // Returns a copy with the range replaced; throws std::out_of_range when v
  // does not fit in r.width bits.
  Word16 with(BitRange r, unsigned v) const;

 private:
  uint16_t raw_;
};

// Accessor over a bit range of a parent 16-bit field of the same record.
struct BitFieldDescriptor {
  const char* name;
  const char* parent;
  BitRange bits;
  Mutability mutability;
  Lifecycle lifecycle;
};

}  // namespace ocean
