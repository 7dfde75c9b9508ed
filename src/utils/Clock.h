#pragma once

#include <stdint.h>
#include <chrono>
#include <functional>

/*
  Clock.h

  Host monotonic time, the host-side stand-in for millis()/micros().
  Times are measured from an arbitrary steady epoch and never go backwards.
*/

inline uint64_t monotonicUs() {
  using namespace std::chrono;
  return (uint64_t)duration_cast<microseconds>(
      steady_clock::now().time_since_epoch()).count();
}

inline uint32_t monotonicMs() {
  return (uint32_t)(monotonicUs() / 1000ULL);
}

// Injectable time source (tests pass a scripted clock)
using ClockFn = std::function<uint64_t()>;
