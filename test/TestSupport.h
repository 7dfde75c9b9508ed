#pragma once

#include <stddef.h>
#include <stdint.h>

#include <chrono>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "Params.h"
#include "comms/ByteStream.h"
#include "comms/Protocol.h"

/*
  Shared helpers for the test suite:
    - makeFrame(): builds a 15-byte telemetry frame
    - FakeStream: ByteStream that replays scripted reads and records writes
    - ScriptedClock: manual time source for LinkReader
*/

struct FrameFields {
  uint8_t  mode = 1;
  uint16_t height_sp = 250;
  uint16_t height_meas = 240;
  uint16_t tof = 1234;
  uint16_t temp_x10 = 235;
  uint16_t valve_sp = 100;
  uint16_t valve_pos = 98;
  uint16_t duty = 512;
};

inline std::vector<uint8_t> makeFrame(const FrameFields& f) {
  std::vector<uint8_t> b(RX_FRAME_BYTES, 0);
  b[0] = f.mode;
  protocol::writeU16BE(&b[1], f.height_sp);
  protocol::writeU16BE(&b[3], f.height_meas);
  protocol::writeU16BE(&b[5], f.tof);
  protocol::writeU16BE(&b[7], f.temp_x10);
  protocol::writeU16BE(&b[9], f.valve_sp);
  protocol::writeU16BE(&b[11], f.valve_pos);
  protocol::writeU16BE(&b[13], f.duty);
  return b;
}

// Frame whose tof field carries an index, handy for order checks
inline std::vector<uint8_t> makeIndexedFrame(uint16_t index) {
  FrameFields f;
  f.tof = index;
  f.mode = (uint8_t)(index % MODE_COUNT);
  return makeFrame(f);
}

inline void append(std::vector<uint8_t>& dst, const std::vector<uint8_t>& src) {
  dst.insert(dst.end(), src.begin(), src.end());
}


class FakeStream : public ByteStream {
public:
  enum class Kind { DATA, TIMEOUT, ERROR };

  // When the script runs out: idle (timeouts) or fail
  explicit FakeStream(bool fail_when_drained = false)
  : _fail_when_drained(fail_when_drained) {}

  void pushData(const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(_mutex);
    Event e;
    e.kind = Kind::DATA;
    e.bytes = bytes;
    _events.push_back(e);
  }

  void pushTimeout() {
    std::lock_guard<std::mutex> lock(_mutex);
    Event e;
    e.kind = Kind::TIMEOUT;
    _events.push_back(e);
  }

  void pushError() {
    std::lock_guard<std::mutex> lock(_mutex);
    Event e;
    e.kind = Kind::ERROR;
    _events.push_back(e);
  }

  bool isOpen() const override {
    std::lock_guard<std::mutex> lock(_mutex);
    return _open;
  }

  int read(uint8_t* buf, size_t cap, int timeout_ms) override {
    std::unique_lock<std::mutex> lock(_mutex);
    _reads++;

    if (_events.empty()) {
      lock.unlock();
      if (_fail_when_drained) return -1;
      // Behave like a quiet port without burning CPU in session tests
      std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms > 0 ? 1 : 0));
      return 0;
    }

    Event& e = _events.front();
    if (e.kind == Kind::TIMEOUT) {
      _events.pop_front();
      return 0;
    }
    if (e.kind == Kind::ERROR) {
      _events.pop_front();
      return -1;
    }

    const size_t n = (e.bytes.size() < cap) ? e.bytes.size() : cap;
    for (size_t i = 0; i < n; i++) buf[i] = e.bytes[i];
    e.bytes.erase(e.bytes.begin(), e.bytes.begin() + (ptrdiff_t)n);
    if (e.bytes.empty()) _events.pop_front();
    return (int)n;
  }

  bool write(const uint8_t* buf, size_t len) override {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_open || _fail_writes) return false;
    _written.insert(_written.end(), buf, buf + len);
    return true;
  }

  void close() override {
    std::lock_guard<std::mutex> lock(_mutex);
    _open = false;
  }

  void setFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(_mutex);
    _fail_writes = fail;
  }

  std::vector<uint8_t> written() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _written;
  }

  size_t reads() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _reads;
  }

private:
  struct Event {
    Kind kind = Kind::DATA;
    std::vector<uint8_t> bytes;
  };

  mutable std::mutex _mutex;
  std::deque<Event> _events;
  std::vector<uint8_t> _written;
  bool _open = true;
  bool _fail_writes = false;
  bool _fail_when_drained;
  size_t _reads = 0;
};


// Manual time source; advance() between polls
struct ScriptedClock {
  uint64_t now_us = 1000000;

  void advanceMs(uint64_t ms) { now_us += ms * 1000ULL; }
};
