/*!
 *  \file         exceptions.hpp
 *  \author       BW
 *  \date         03/12/2025
 *  \brief        Driver exception hierarchy.
 *
 *  Errors raised by the protocol engine and the instrument bindings.
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

#include <stdexcept>
#include <string>

namespace ocean {

// Outcome of a single parameter write into a record schema.
enum class SetError { None, Protected, UnknownField, InvalidValue };

const char* toString(SetError e);

class DriverException : public std::runtime_error {
 public:
  explicit DriverException(const std::string& what)
      : std::runtime_error(what) {}
};

// A whole record could not be decoded (too short, wrong sync).
class SampleException : public DriverException {
 public:
  explicit SampleException(const std::string& what) : DriverException(what) {}
};

class ParameterException : public DriverException {
 public:
  explicit ParameterException(const std::string& what,
                              SetError reason = SetError::InvalidValue)
      : DriverException(what), reason_(reason) {}
  SetError reason() const { return reason_; }

 private:
  SetError reason_;
};

class TimeoutException : public DriverException {
 public:
  explicit TimeoutException(const std::string& what) : DriverException(what) {}
};

class ProtocolException : public DriverException {
 public:
  explicit ProtocolException(const std::string& what)
      : DriverException(what) {}
};

class StateException : public DriverException {
 public:
  explicit StateException(const std::string& what) : DriverException(what) {}
};

class CommandException : public DriverException {
 public:
  explicit CommandException(const std::string& what) : DriverException(what) {}
};

}  // namespace ocean
