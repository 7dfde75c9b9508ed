#include "utils/LineAssembler.h"

#include "utils/Log.h"

/*
  LineAssembler.cpp

  Key behavior:
  - Ignores '\r'
  - '\n' ends a line
  - If a line would exceed max_line_bytes, enters "dropping" mode until
    the next '\n'
*/

LineAssembler::LineAssembler(size_t max_line_bytes)
: _max_line_bytes(max_line_bytes == 0 ? 1 : max_line_bytes)
{
  _buf.reserve(_max_line_bytes);
}

void LineAssembler::reset() {
  _buf.clear();
  _dropping = false;
}

void LineAssembler::feed(const char* data, size_t len, const LineHandler& handler) {
  if (!data) return;

  for (size_t i = 0; i < len; i++) {
    const char ch = data[i];

    if (ch == '\r') continue;

    if (_dropping) {
      // We overflowed earlier; discard until newline to resync
      if (ch == '\n') {
        _dropping = false;
        _buf.clear();
      }
      continue;
    }

    if (ch == '\n') {
      if (!_buf.empty()) {
        _lines++;
        if (handler) handler(_buf.c_str(), _buf.size());
      }
      _buf.clear();
      continue;
    }

    if (_buf.size() < _max_line_bytes) {
      _buf.push_back(ch);
    } else {
      _ovf++;
      _dropping = true;
      LOG_WARN("input: line longer than %u bytes dropped", (unsigned)_max_line_bytes);
      _buf.clear();
    }
  }
}
