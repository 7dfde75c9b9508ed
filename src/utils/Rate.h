#pragma once

#include <stdint.h>

/*
  Rate

  Fixed-period scheduler for the monitor loop (health reports, status
  refresh). Works on the uint32_t ms values returned by monotonicMs().
*/

class Rate {
public:
  explicit Rate(uint32_t period_ms = 1000) { setPeriodMs(period_ms); }

  void setPeriodMs(uint32_t period_ms) {
    _period_ms = (period_ms == 0) ? 1 : period_ms;
  }

  // Returns true when it's time to run. If true, it schedules the next tick.
  // The first call only arms the timer, so a report goes out one full
  // period after start rather than immediately.
  bool ready(uint32_t now_ms) {
    if (!_initialized) {
      _next_ms = now_ms + _period_ms;
      _initialized = true;
      return false;
    }

    // Safe with monotonicMs() wraparound because of signed subtraction
    if ((int32_t)(now_ms - _next_ms) >= 0) {
      _next_ms = now_ms + _period_ms;
      return true;
    }
    return false;
  }

  // Milliseconds until the next tick is due (0 if due now or not armed)
  uint32_t remainingMs(uint32_t now_ms) const {
    if (!_initialized) return 0;
    const int32_t left = (int32_t)(_next_ms - now_ms);
    return (left > 0) ? (uint32_t)left : 0;
  }

  uint32_t periodMs() const { return _period_ms; }

private:
  uint32_t _period_ms = 1000;
  uint32_t _next_ms = 0;
  bool _initialized = false;
};
