#pragma once

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <string>

/*
===============================================================================
  LineAssembler.h
===============================================================================

  PURPOSE
  -------
  Accumulates a byte stream into newline-delimited lines (operator input
  on stdin).

  IMPORTANT
  ---------
  On overflow this class DISCARDS bytes until the next '\n' to resync
  cleanly, so a tail fragment is never handed out as a line.
===============================================================================
*/

class LineAssembler {
public:
  using LineHandler = std::function<void(const char* line, size_t len)>;

  explicit LineAssembler(size_t max_line_bytes = 512);

  // Feeds bytes; calls handler once per complete non-empty line
  void feed(const char* data, size_t len, const LineHandler& handler);

  void reset();

  uint32_t lines() const { return _lines; }
  uint32_t overflows() const { return _ovf; }
  size_t pendingBytes() const { return _buf.size(); }

private:
  size_t _max_line_bytes;
  std::string _buf;

  // When true, we are discarding bytes until newline due to overflow
  bool _dropping = false;

  uint32_t _lines = 0;
  uint32_t _ovf = 0;
};
