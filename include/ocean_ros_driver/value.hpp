/*!
 *  \file         value.hpp
 *  \author       BW
 *  \date         04/12/2025
 *  \brief        Decoded parameter value.
 *
 *  Tagged value produced by field decoders and consumed by field encoders.
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

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ocean {

class Value {
 public:
  enum class Type { Null, Integer, Text, Bytes, IntList };

  Value();

  static Value integer(int64_t v);
  static Value text(const std::string& v);
  static Value bytes(const std::vector<uint8_t>& v);
  static Value intList(const std::vector<int64_t>& v);

  Type type() const { return type_; }
  bool isNull() const { return type_ == Type::Null; }

  // Accessors throw std::invalid_argument on a type mismatch.
  int64_t asInt() const;
  const std::string& asText() const;
  const std::vector<uint8_t>& asBytes() const;
  const std::vector<int64_t>& asIntList() const;

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

  // Human readable form for logs.
  std::string toString() const;
  // JSON literal; byte values are base64 strings.
  std::string toJson() const;

 private:
  Type type_;
  int64_t int_;
  std::string text_;
  std::vector<uint8_t> bytes_;
  std::vector<int64_t> list_;
};

using ValueMap = std::map<std::string, Value>;

std::string jsonEscape(const std::string& s);

}  // namespace ocean
