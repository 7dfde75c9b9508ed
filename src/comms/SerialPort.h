#pragma once

#include <string>

#include "Params.h"
#include "comms/ByteStream.h"

/*
===============================================================================
  SerialPort.h
===============================================================================

  PURPOSE
  -------
  POSIX TTY implementation of ByteStream:

    - Opens the device raw 8N1, no flow control, at the requested baud
    - Non-blocking descriptor, reads wait with poll() up to timeout_ms
    - Flushes stale driver input on open (old frames from before connect)

  Both a USB-serial adapter and an HC-05 Bluetooth SPP rfcomm device show
  up as a TTY and behave identically here.

  IMPORTANT
  ---------
  One reader thread and one writer thread may use the same port. Reads and
  writes touch separate kernel queues; LinkSession serializes writers.
===============================================================================
*/

class SerialPort : public ByteStream {
public:
  SerialPort();
  ~SerialPort() override;

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  // Returns false (and logs why) if the device cannot be opened/configured.
  bool open(const std::string& device, uint32_t baud = SERIAL_BAUD);

  bool isOpen() const override { return _fd >= 0; }
  int read(uint8_t* buf, size_t cap, int timeout_ms) override;
  bool write(const uint8_t* buf, size_t len) override;
  void close() override;

  // True if baud maps to a termios speed on this host
  static bool supportedBaud(uint32_t baud);

private:
  int _fd = -1;
  std::string _device;
};
