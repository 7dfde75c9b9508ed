#include "comms/LinkReader.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "comms/Protocol.h"
#include "utils/Log.h"

/*
===============================================================================
  LinkReader.cpp
===============================================================================

  Key behavior:
  - Frames are purely positional: 15 bytes, no delimiter
  - A bad mode byte costs exactly one byte, not a whole frame
  - One alignment search tries at most RESYNC_MAX_SHIFTS offsets, then
    the RX window is flushed
  - Silence with a partial frame buffered flushes the partial frame
  - A read failure is final for this instance
===============================================================================
*/

const char* toString(PollStatus status) {
  switch (status) {
    case PollStatus::OK:         return "OK";
    case PollStatus::TIMEOUT:    return "TIMEOUT";
    case PollStatus::LINK_ERROR: return "LINK_ERROR";
    case PollStatus::CLOSED:     return "CLOSED";
  }
  return "UNKNOWN";
}


LinkReader::LinkReader(ByteStream& stream)
: LinkReader(stream, Settings(), monotonicUs)
{
}

LinkReader::LinkReader(ByteStream& stream, const Settings& settings, ClockFn clock)
: _stream(stream),
  _settings(settings),
  _clock(clock ? clock : ClockFn(monotonicUs))
{
  if (_settings.read_chunk_bytes == 0) _settings.read_chunk_bytes = SERIAL_READ_CHUNK_BYTES;
  if (_settings.read_timeout_ms < 0) _settings.read_timeout_ms = 0;

  _chunk.resize(_settings.read_chunk_bytes);
  _rx.reserve(RX_FRAME_BYTES * 2 + _settings.read_chunk_bytes);
  memset(_note_buf, 0, sizeof(_note_buf));
}

void LinkReader::note_(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(_note_buf, sizeof(_note_buf), fmt, args);
  va_end(args);
  LOG_DEBUG("link: %s", _note_buf);
}

uint64_t LinkReader::stamp_(uint64_t now_us) {
  // Strictly increasing per reader, even for frames decoded from one chunk
  if (_have_stamp && now_us <= _last_stamp_us) {
    now_us = _last_stamp_us + 1;
  }
  _last_stamp_us = now_us;
  _have_stamp = true;
  return now_us;
}

void LinkReader::discardRx_(const char* why) {
  if (_rx.empty()) return;
  _health.dropped_bytes += (uint32_t)_rx.size();
  note_("%s: dropped %u buffered bytes", why, (unsigned)_rx.size());
  _rx.clear();
}

PollStatus LinkReader::poll(const SampleSink& sink) {
  if (_failed) return PollStatus::LINK_ERROR;
  if (!_stream.isOpen()) return PollStatus::CLOSED;

  const int n = _stream.read(_chunk.data(), _chunk.size(), _settings.read_timeout_ms);
  const uint64_t now_us = _clock();

  PollStatus status;
  if (n < 0) {
    _failed = true;
    _health.read_errors++;
    note_("read failed after %lu frames", (unsigned long)_health.frames_ok);
    LOG_WARN("link: read failure, reader stopped");
    status = PollStatus::LINK_ERROR;
  } else if (n == 0) {
    checkGap(now_us);
    status = PollStatus::TIMEOUT;
  } else {
    feed(_chunk.data(), (size_t)n, now_us);
    status = PollStatus::OK;
  }

  // Samples decoded before a failure are still delivered
  if (sink) {
    TelemetrySample s;
    while (next(s)) {
      sink(s);
    }
  }

  return status;
}

void LinkReader::checkGap(uint64_t now_us) {
  if (_settings.frame_gap_ms == 0) return;
  if (_rx.empty()) return;

  const uint64_t gap_us = (uint64_t)_settings.frame_gap_ms * 1000ULL;
  if (now_us > _last_byte_us && now_us - _last_byte_us > gap_us) {
    _health.truncated_frames++;
    discardRx_("gap flush");
  }
}

void LinkReader::feed(const uint8_t* data, size_t len, uint64_t now_us) {
  if (!data || len == 0) return;

  // Leftover bytes from before a silence belong to a frame that was cut
  checkGap(now_us);

  _health.bytes_in += len;
  _rx.insert(_rx.end(), data, data + len);
  _last_byte_us = now_us;

  process_(now_us);
}

void LinkReader::process_(uint64_t now_us) {
  size_t head = 0;

  // Offsets tried in the current search; every aligned frame ends a search
  size_t shifts = 0;

  while (_rx.size() - head >= RX_FRAME_BYTES) {
    TelemetrySample s;
    const DecodeStatus st =
        protocol::decodeTelemetryFrame(_rx.data() + head, RX_FRAME_BYTES, s);

    if (st == DecodeStatus::OK) {
      if (_searching) {
        note_("resync ok after %u shifts", (unsigned)shifts);
        _searching = false;
      }
      shifts = 0;
      s.received_at_us = stamp_(now_us);
      _pending.push_back(s);
      _health.frames_ok++;
      head += RX_FRAME_BYTES;
      continue;
    }

    // Only INVALID_MODE is possible here, the length is always exact
    _health.invalid_mode++;
    if (!_searching) {
      _searching = true;
      _health.resync_events++;
      LOG_DEBUG("link: bad mode byte 0x%02X, searching alignment", (unsigned)_rx[head]);
    }

    shifts++;
    if (shifts >= RESYNC_MAX_SHIFTS) {
      _rx.erase(_rx.begin(), _rx.begin() + (ptrdiff_t)head);
      head = 0;
      _health.resync_flushes++;
      discardRx_("resync gave up");
      LOG_WARN("link: no frame alignment within %u offsets, RX window flushed",
               (unsigned)RESYNC_MAX_SHIFTS);
      break;
    }

    head++;
    _health.dropped_bytes++;
  }

  if (head > 0) {
    _rx.erase(_rx.begin(), _rx.begin() + (ptrdiff_t)head);
  }
}

bool LinkReader::next(TelemetrySample& out) {
  if (_pending.empty()) return false;
  out = _pending.front();
  _pending.pop_front();
  return true;
}
