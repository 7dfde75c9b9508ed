#pragma once

#include <stddef.h>
#include <stdint.h>

/*
===============================================================================
  ByteStream.h
===============================================================================

  PURPOSE
  -------
  Byte-oriented link seen by LinkReader and LinkSession. Plays the role
  the Arduino Stream class plays on the firmware side.

  Implementations:
    - SerialPort (USB-serial or HC-05 SPP virtual port)
    - test fakes that replay scripted chunks

  read() contract:
    > 0   number of bytes copied into buf
    0     timeout, nothing arrived within timeout_ms
    -1    read failure or device gone (fatal for the current connection)
===============================================================================
*/

class ByteStream {
public:
  virtual ~ByteStream() {}

  virtual bool isOpen() const = 0;

  virtual int read(uint8_t* buf, size_t cap, int timeout_ms) = 0;

  // Writes all len bytes or returns false
  virtual bool write(const uint8_t* buf, size_t len) = 0;

  virtual void close() = 0;
};
