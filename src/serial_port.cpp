#include "ocean_ros_driver/serial_port.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "ocean_ros_driver/exceptions.hpp"

using ocean::SerialPort;

SerialPort::SerialPort(std::string port, int baud):
  port_(std::move(port)), baud_(baud), fd_(-1) {}

SerialPort::~SerialPort()
{
  closeSerial();
}

speed_t SerialPort::mapBaud(int baud)
{
  // Aquadopp 出厂 9600，可配置到 115200
  switch (baud)
  {
    case 1200:
      return B1200;
    case 2400:
      return B2400;
    case 4800:
      return B4800;
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    default:
      return B9600;
  }
}

bool SerialPort::configureTermios()
{
  termios tio{};
  if (tcgetattr(fd_, &tio) != 0)
  {
    std::perror("tcgetattr");
    return false;
  }

  cfmakeraw(&tio);

  speed_t sp = mapBaud(baud_);
  cfsetispeed(&tio, sp);
  cfsetospeed(&tio, sp);

  // 8N1, no flow control. The instrument sends binary records, so the line
  // discipline must not touch 0x11/0x13.
  tio.c_cflag |= (CLOCAL | CREAD | CS8);
  tio.c_cflag &= ~(PARENB | CSTOPB | CRTSCTS);
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);

  // VMIN = 0, VTIME = 2: read() returns what is available after 0.2 s.
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 2;

  if (tcsetattr(fd_, TCSANOW, &tio) != 0)
  {
    std::perror("tcsetattr");
    return false;
  }

  tcflush(fd_, TCIOFLUSH);
  return true;
}

bool SerialPort::openSerial()
{
  closeSerial();

  fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0)
  {
    std::perror("open");
    return false;
  }
  if (!configureTermios())
  {
    ::close(fd_);
    fd_ = -1;
    return false;
  }
  return true;
}

void SerialPort::closeSerial()
{
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

bool SerialPort::reOpenSerial()
{
  closeSerial();
  return openSerial();
}

ssize_t SerialPort::readSome(uint8_t* buf, size_t max)
{
  if (fd_ < 0)
  {
    return -1;
  }
  // O_NONBLOCK ignores VTIME, wait here instead
  pollfd pfd{fd_, POLLIN, 0};
  int ready = ::poll(&pfd, 1, 200);
  if (ready <= 0)
  {
    return (ready < 0 && errno != EINTR) ? -1 : 0;
  }
  ssize_t n = ::read(fd_, buf, max);
  if (n < 0 && (errno == EAGAIN || errno == EINTR))
  {
    return 0;
  }
  return n;
}

ssize_t SerialPort::writeAll(const uint8_t* data, size_t len)
{
  if (fd_ < 0)
  {
    return -1;
  }
  size_t written = 0;
  while (written < len)
  {
    ssize_t n = ::write(fd_, data + written, len - written);
    if (n < 0)
    {
      if (errno == EAGAIN || errno == EINTR)
      {
        continue;
      }
      return -1;
    }
    written += static_cast<size_t>(n);
  }
  return static_cast<ssize_t>(written);
}

void SerialPort::send(const std::vector<uint8_t>& bytes)
{
  if (writeAll(bytes.data(), bytes.size()) < 0)
  {
    throw ProtocolException("write to " + port_ + " failed: " +
                            std::strerror(errno));
  }
}
