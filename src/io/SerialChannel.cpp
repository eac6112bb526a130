/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps the companion's tty - handles file descriptor, framing, line output and RAII - POSIX compliant
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), close()

// EchoMe headers
#include "io/SerialChannel.hpp"

using namespace echome::io;

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

std::optional<speed_t> SerialChannel::toSpeed(unsigned int baud) {
  switch (baud) {
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
  case 230400:
    return B230400;
  default:
    return std::nullopt;
  }
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from open(" << dev << "): " << strerror(errno) << "\n";
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cflag &= ~(CRTSCTS | PARENB | CSTOPB);
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return true;
}

bool SerialChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\n")) {
    out += "\n";
  }

  // POSIX write loop; EAGAIN waits for POLLOUT but never past kWriteTimeout
  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      int rc = ::poll(&pfd, 1, static_cast<int>(kWriteTimeout.count()));
      if (rc == -1 && errno == EINTR)
        continue;
      if (rc <= 0) {
        std::cerr << "Error: serial write timed out after " << total << "/" << out.size()
                  << " bytes\n";
        return false;
      }
    } else {
      std::cerr << "Error: " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
