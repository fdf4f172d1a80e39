/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx - handles file descriptor, raw byte io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
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
#include <unistd.h> // write(), read(), close()

// PZT headers
#include "io/SerialChannel.hpp"

using namespace pzt::io;

SerialChannel::~SerialChannel() { SerialChannel::close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    SerialChannel::close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  if (fd_ >= 0)
    close();

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "[SerialChannel] error " << errno << " from open(" << dev
              << "): " << strerror(errno) << "\n";
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "[SerialChannel] error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cflag &= ~(PARENB | CSTOPB);
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  // pure polling: read() returns immediately with whatever is buffered
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "[SerialChannel] error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return true;
}

bool SerialChannel::writeBytes(const std::vector<std::uint8_t>& bytes) {

  if (fd_ < 0) {
    return false;
  }

  // POSIX write loop, required if the tty buffer is momentarily full
  std::size_t total = 0;
  while (total < bytes.size()) {
    ssize_t written = ::write(fd_, bytes.data() + total, bytes.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, -1) == -1 && errno != EINTR) {
        std::cerr << "[SerialChannel] poll: " << strerror(errno) << '\n';
        return false;
      }
    } else {
      std::cerr << "[SerialChannel] error " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// SerialChannel::readAvailable
// Waits at most `timeout` for input, then drains everything buffered.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::vector<std::uint8_t>> SerialChannel::readAvailable(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  pollfd pfd{ fd_, POLLIN, 0 };
  int rc = 0;
  do {
    rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (rc == -1 && errno == EINTR);

  if (rc == -1) {
    std::cerr << "[SerialChannel] poll: " << strerror(errno) << '\n';
    return std::nullopt;
  }
  if (rc == 0 || !(pfd.revents & POLLIN))
    return std::nullopt; // nothing pending

  std::vector<std::uint8_t> rx;
  std::uint8_t temp[256];
  for (;;) {
    ssize_t n = ::read(fd_, temp, sizeof(temp));
    if (n > 0) {
      rx.insert(rx.end(), temp, temp + n);
      continue;
    }
    if (n == -1 && errno == EINTR)
      continue;
    if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK))
      break; // drained
    if (n == -1) {
      std::cerr << "[SerialChannel] read: " << strerror(errno) << '\n';
    }
    break; // n == 0: nothing more, or EOF on a vanished device
  }

  if (rx.empty())
    return std::nullopt;
  return rx;
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
