/*!
 *  \file         serial_port.hpp
 *  \author       BW
 *  \date         10/16/2025
 *  \brief        POSIX serial transport.
 *
 *  termios serial port used as the instrument transport.
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
#include <string>
#include <vector>
#include <sys/types.h>
#include <termios.h>

#include "ocean_ros_driver/transport.hpp"

namespace ocean
{
// Serial Port Transport
class SerialPort : public Transport
{
private:
  std::string port_;
  int baud_;
  int fd_;

  // Configures the termios settings for the current file descriptor.
  // Returns true on success.
  bool configureTermios();
  // Maps an integer baud rate to a termios speed_t constant.
  static speed_t mapBaud(int baud);

public:
  explicit SerialPort(std::string port = "/dev/ttyUSB0", int baud = 9600);
  ~SerialPort() override;

  bool openSerial();
  void closeSerial();
  bool reOpenSerial();
  bool isOpen() const { return fd_ >= 0; }
  int fd() const { return fd_; }
  int getBaud() const { return baud_; }
  const std::string& getPort() const { return port_; }

  // Writes exactly len bytes. Returns the number of bytes written, or -1 on
  // error.
  ssize_t writeAll(const uint8_t* data, size_t len);

  // Reads up to max bytes; 0 when nothing arrived within the read timeout.
  ssize_t readSome(uint8_t* buf, size_t max);

  // Transport: throws ProtocolException when the write fails.
  void send(const std::vector<uint8_t>& bytes) override;
};
}
