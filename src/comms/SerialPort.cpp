#include "comms/SerialPort.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#include "utils/Log.h"

/*
===============================================================================
  SerialPort.cpp
===============================================================================

  Key behavior:
  - EINTR / EAGAIN are retried, never reported as link failures
  - POLLHUP, POLLERR or a 0-byte read on a readable fd means the device
    went away (USB unplug, Bluetooth drop) and returns -1
  - write() loops over partial writes, waiting for POLLOUT in between
===============================================================================
*/

namespace {

bool baudToSpeed(uint32_t baud, speed_t& out) {
  switch (baud) {
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    default: return false;
  }
}

constexpr int WRITE_POLL_TIMEOUT_MS = 200;

}  // namespace


SerialPort::SerialPort() {}

SerialPort::~SerialPort() {
  close();
}

bool SerialPort::supportedBaud(uint32_t baud) {
  speed_t unused;
  return baudToSpeed(baud, unused);
}

bool SerialPort::open(const std::string& device, uint32_t baud) {
  close();

  speed_t speed;
  if (!baudToSpeed(baud, speed)) {
    LOG_ERROR("serial: unsupported baud %lu", (unsigned long)baud);
    return false;
  }

  const int fd = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    LOG_ERROR("serial: open %s failed: %s", device.c_str(), strerror(errno));
    return false;
  }

  struct termios tio;
  if (tcgetattr(fd, &tio) != 0) {
    LOG_ERROR("serial: tcgetattr %s failed: %s", device.c_str(), strerror(errno));
    ::close(fd);
    return false;
  }

  // Raw 8N1, receiver on, ignore modem control lines, no flow control
  cfmakeraw(&tio);
  tio.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
  tio.c_cflag |= CS8 | CREAD | CLOCAL;
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;

  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);

  if (tcsetattr(fd, TCSANOW, &tio) != 0) {
    LOG_ERROR("serial: tcsetattr %s failed: %s", device.c_str(), strerror(errno));
    ::close(fd);
    return false;
  }

  // Drop whatever the driver buffered before we connected
  tcflush(fd, TCIOFLUSH);

  _fd = fd;
  _device = device;
  LOG_INFO("serial: opened %s @ %lu 8N1", device.c_str(), (unsigned long)baud);
  return true;
}

int SerialPort::read(uint8_t* buf, size_t cap, int timeout_ms) {
  if (_fd < 0 || !buf || cap == 0) return -1;

  struct pollfd pfd;
  pfd.fd = _fd;
  pfd.events = POLLIN;
  pfd.revents = 0;

  int pr;
  do {
    pr = ::poll(&pfd, 1, timeout_ms);
  } while (pr < 0 && errno == EINTR);

  if (pr < 0) {
    LOG_ERROR("serial: poll %s failed: %s", _device.c_str(), strerror(errno));
    return -1;
  }
  if (pr == 0) return 0;

  if (pfd.revents & POLLIN) {
    ssize_t n;
    do {
      n = ::read(_fd, buf, cap);
    } while (n < 0 && errno == EINTR);

    if (n > 0) return (int)n;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return 0;

    if (n == 0) {
      LOG_ERROR("serial: %s closed by peer", _device.c_str());
    } else {
      LOG_ERROR("serial: read %s failed: %s", _device.c_str(), strerror(errno));
    }
    return -1;
  }

  if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
    LOG_ERROR("serial: %s hang-up (revents=0x%x)", _device.c_str(), (unsigned)pfd.revents);
    return -1;
  }

  return 0;
}

bool SerialPort::write(const uint8_t* buf, size_t len) {
  if (_fd < 0 || !buf) return false;

  size_t off = 0;
  while (off < len) {
    const ssize_t n = ::write(_fd, buf + off, len - off);
    if (n > 0) {
      off += (size_t)n;
      continue;
    }

    if (n < 0 && errno == EINTR) continue;

    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      struct pollfd pfd;
      pfd.fd = _fd;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      const int pr = ::poll(&pfd, 1, WRITE_POLL_TIMEOUT_MS);
      if (pr > 0 && (pfd.revents & POLLOUT)) continue;
      if (pr < 0 && errno == EINTR) continue;
      LOG_ERROR("serial: write %s stalled", _device.c_str());
      return false;
    }

    LOG_ERROR("serial: write %s failed: %s", _device.c_str(), strerror(errno));
    return false;
  }

  return true;
}

void SerialPort::close() {
  if (_fd < 0) return;
  ::close(_fd);
  _fd = -1;
  LOG_INFO("serial: closed %s", _device.c_str());
}
