#pragma once

#include <stddef.h>
#include <stdint.h>

#include <deque>
#include <functional>
#include <vector>

#include "Params.h"
#include "comms/ByteStream.h"
#include "comms/Messages.h"
#include "utils/Clock.h"

/*
===============================================================================
  LinkReader.h
===============================================================================

  PURPOSE
  -------
  Host-side telemetry reader for one serial connection:

    - Reads raw bytes from a ByteStream (one read per poll() call)
    - Accumulates them into a sliding RX window
    - Decodes every complete 15-byte frame via protocol::decodeTelemetryFrame
    - Stamps each sample with a strictly increasing host time
    - Hands samples to a sink (or queues them for next())
    - Tracks link health counters for status display

  RESYNC
  ------
  The frame has no start marker and no checksum. Alignment is recovered
  from mode-byte plausibility:

    - Decode is attempted at offset 0 of the RX window
    - INVALID_MODE drops exactly one leading byte and retries
    - One search tries at most RESYNC_MAX_SHIFTS offsets; after that the
      whole RX window is discarded. A decoded frame ends the search, so
      a stream that glitches and realigns repeatedly never hits the cap

  A second anchor is the inter-frame silence: a partial frame still
  buffered after frame_gap_ms without new bytes is discarded as truncated.

  KNOWN LIMITATION
  ----------------
  This is a heuristic. A misaligned window whose first byte happens to be
  0..3 decodes "successfully" into garbage. Nothing on the wire can tell
  such a frame apart from a real one.

  LIFETIME
  --------
  One LinkReader per connection. After a read failure the reader stays
  failed; reconnecting means constructing a new one.
===============================================================================
*/

enum class PollStatus : uint8_t {
  OK = 0,       // bytes were read (possibly zero complete frames)
  TIMEOUT,      // nothing arrived within the read timeout
  LINK_ERROR,   // read failure or device gone, reader is finished
  CLOSED,       // stream is not open
};

const char* toString(PollStatus status);

class LinkReader {
public:
  struct Settings {
    int      read_timeout_ms  = SERIAL_READ_TIMEOUT_MS;
    size_t   read_chunk_bytes = SERIAL_READ_CHUNK_BYTES;
    uint32_t frame_gap_ms     = FRAME_GAP_MS;   // 0 disables the gap flush
  };

  struct Health {
    uint64_t bytes_in = 0;
    uint32_t frames_ok = 0;

    uint32_t invalid_mode = 0;       // decode attempts rejected on the mode byte
    uint32_t resync_events = 0;      // times alignment was lost
    uint32_t resync_flushes = 0;     // scan cap reached, RX window discarded
    uint32_t truncated_frames = 0;   // partial frames discarded after a gap
    uint32_t dropped_bytes = 0;      // bytes that never became part of a frame

    uint32_t read_errors = 0;

    // Garbled episodes reported to consumers: one per lost alignment
    // (a flush ends the same episode, so it is not added again) plus one
    // per truncated frame
    uint32_t degraded() const {
      return resync_events + truncated_frames;
    }
  };

  using SampleSink = std::function<void(const TelemetrySample&)>;

  explicit LinkReader(ByteStream& stream);
  LinkReader(ByteStream& stream, const Settings& settings, ClockFn clock);

  LinkReader(const LinkReader&) = delete;
  LinkReader& operator=(const LinkReader&) = delete;

  // One read cycle: blocks at most read_timeout_ms in the stream read,
  // decodes what arrived and delivers every new sample to sink in arrival
  // order. With an empty sink, samples stay queued for next().
  PollStatus poll(const SampleSink& sink);

  // Pushes received bytes through the resync/decode path. poll() calls
  // this; tests and replay tools may call it directly.
  void feed(const uint8_t* data, size_t len, uint64_t now_us);

  // Discards a partial frame if the link has been silent for frame_gap_ms.
  void checkGap(uint64_t now_us);

  // Pops the oldest decoded sample. Returns false when none is queued.
  bool next(TelemetrySample& out);

  size_t pending() const { return _pending.size(); }
  size_t buffered() const { return _rx.size(); }
  bool failed() const { return _failed; }

  const Health& health() const { return _health; }
  const Settings& settings() const { return _settings; }

  // Short description of the most recent link-health event ("" if none)
  const char* lastNote() const { return _note_buf; }

private:
  void process_(uint64_t now_us);
  void discardRx_(const char* why);
  uint64_t stamp_(uint64_t now_us);
  void note_(const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

  ByteStream& _stream;
  Settings _settings;
  ClockFn _clock;

  std::vector<uint8_t> _rx;
  std::vector<uint8_t> _chunk;
  std::deque<TelemetrySample> _pending;

  uint64_t _last_byte_us = 0;
  uint64_t _last_stamp_us = 0;
  bool _have_stamp = false;

  // True while alignment is being searched (set on the first bad mode byte)
  bool _searching = false;

  bool _failed = false;

  Health _health;

  char _note_buf[LINK_NOTE_BYTES];
};
