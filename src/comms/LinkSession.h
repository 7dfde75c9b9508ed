#pragma once

#include <stdint.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "comms/ByteStream.h"
#include "comms/LinkReader.h"
#include "comms/Messages.h"
#include "data/SampleWindow.h"
#include "utils/Clock.h"

/*
===============================================================================
  LinkSession.h
===============================================================================

  PURPOSE
  -------
  Everything that lives exactly as long as one serial connection:

    - one LinkReader, polled on a dedicated thread
    - one SampleWindow, fed by the reader (single writer)
    - the command write path to the same stream

  USAGE
  -----
    SerialPort port;
    port.open("/dev/ttyUSB0");
    LinkSession session(port, settings, 60);
    session.start();
    ...  session.window().snapshot(), session.health(), session.send(bytes)
    session.stop();     // joins the thread, clears the window

  IMPORTANT
  ---------
  stop() is coarse: the thread notices the flag at the next read boundary
  (at most read_timeout_ms later). A read failure ends the thread and sets
  linkFailed(); the session never retries. Reconnecting means a new
  stream and a new LinkSession.

  The stream must outlive the session.
===============================================================================
*/

class LinkSession {
public:
  // Optional per-sample hook, called on the reader thread after append
  using SampleHook = std::function<void(const TelemetrySample&)>;

  LinkSession(ByteStream& stream,
              const LinkReader::Settings& settings,
              int retention_s,
              ClockFn clock = ClockFn());
  ~LinkSession();

  LinkSession(const LinkSession&) = delete;
  LinkSession& operator=(const LinkSession&) = delete;

  // Must be set before start()
  void setSampleHook(SampleHook hook) { _hook = hook; }

  // Returns false if already started or the stream is closed
  bool start();
  void stop();

  bool running() const { return _running.load(); }
  bool linkFailed() const { return _link_failed.load(); }

  // Writes one encoded command. False if the stream is closed, the link
  // already failed, or the write did not complete.
  bool send(const CommandBytes& bytes);

  SampleWindow& window() { return _window; }
  const SampleWindow& window() const { return _window; }

  // Copy of the reader counters as of the last completed poll
  LinkReader::Health health() const;

  // Copy of the reader's last note ("" if none)
  std::string lastNote() const;

private:
  void run_();

  ByteStream& _stream;
  LinkReader _reader;
  SampleWindow _window;
  SampleHook _hook;

  std::thread _thread;
  std::atomic<bool> _stop_requested;
  std::atomic<bool> _running;
  std::atomic<bool> _link_failed;
  bool _started = false;

  std::mutex _write_mutex;

  mutable std::mutex _health_mutex;
  LinkReader::Health _health;
  std::string _note;
};
