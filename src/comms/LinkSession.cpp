#include "comms/LinkSession.h"

#include "utils/Log.h"

/*
===============================================================================
  LinkSession.cpp
===============================================================================

  Key behavior:
  - The reader thread is the only caller of LinkReader and the only
    writer of the SampleWindow
  - Health counters are published under a small lock after every poll,
    so consumers never read the reader's live struct
  - stop() always clears the window; nothing carries over to the next
    connection
===============================================================================
*/

LinkSession::LinkSession(ByteStream& stream,
                         const LinkReader::Settings& settings,
                         int retention_s,
                         ClockFn clock)
: _stream(stream),
  _reader(stream, settings, clock),
  _window(retention_s),
  _stop_requested(false),
  _running(false),
  _link_failed(false)
{
}

LinkSession::~LinkSession() {
  stop();
}

bool LinkSession::start() {
  if (_started) {
    LOG_WARN("session: start() called twice");
    return false;
  }
  if (!_stream.isOpen()) {
    LOG_ERROR("session: stream is not open");
    return false;
  }

  _started = true;
  _stop_requested.store(false);
  _running.store(true);
  _thread = std::thread(&LinkSession::run_, this);
  LOG_INFO("session: reader started (retention %d s)", _window.retentionSeconds());
  return true;
}

void LinkSession::stop() {
  _stop_requested.store(true);
  if (_thread.joinable()) {
    _thread.join();
    LOG_INFO("session: reader stopped");
  }
  _window.clear();
}

void LinkSession::run_() {
  const LinkReader::SampleSink sink = [this](const TelemetrySample& s) {
    _window.append(s);
    if (_hook) _hook(s);
  };

  while (!_stop_requested.load()) {
    const PollStatus st = _reader.poll(sink);

    {
      std::lock_guard<std::mutex> lock(_health_mutex);
      _health = _reader.health();
      _note = _reader.lastNote();
    }

    if (st == PollStatus::LINK_ERROR || st == PollStatus::CLOSED) {
      LOG_ERROR("session: link ended (%s) after %lu frames",
                toString(st), (unsigned long)_reader.health().frames_ok);
      _link_failed.store(true);
      break;
    }
  }

  _running.store(false);
}

bool LinkSession::send(const CommandBytes& bytes) {
  if (_link_failed.load()) {
    LOG_WARN("session: send refused, link failed");
    return false;
  }

  std::lock_guard<std::mutex> lock(_write_mutex);
  if (!_stream.isOpen()) {
    LOG_WARN("session: send refused, stream closed");
    return false;
  }
  if (!_stream.write(bytes.data, CommandBytes::size())) {
    LOG_ERROR("session: command write failed");
    return false;
  }
  return true;
}

LinkReader::Health LinkSession::health() const {
  std::lock_guard<std::mutex> lock(_health_mutex);
  return _health;
}

std::string LinkSession::lastNote() const {
  std::lock_guard<std::mutex> lock(_health_mutex);
  return _note;
}
