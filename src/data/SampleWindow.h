#pragma once

#include <stddef.h>
#include <stdint.h>

#include <deque>
#include <mutex>
#include <vector>

#include "Params.h"
#include "comms/Messages.h"

/*
===============================================================================
  SampleWindow.h
===============================================================================

  PURPOSE
  -------
  Time-windowed buffer of decoded samples for one connection.

    - append() keeps arrival order and evicts everything older than
      (newest received_at - retention) from the front
    - setRetention() changes the window (clamped to [5, 600] s) and
      re-evicts at once; evicted samples are gone for good
    - snapshot() copies the current contents for a consumer

  ACCESS DISCIPLINE
  -----------------
  Single writer (the LinkReader sink on the reader thread), any number of
  readers. Every call takes one short internal lock; readers get a copy and
  never hold the lock while rendering.
===============================================================================
*/

class SampleWindow {
public:
  explicit SampleWindow(int retention_s = RETENTION_DEFAULT_S);

  SampleWindow(const SampleWindow&) = delete;
  SampleWindow& operator=(const SampleWindow&) = delete;

  void append(const TelemetrySample& s);

  // Returns the retention actually applied (after clamping)
  int setRetention(int seconds);
  int retentionSeconds() const;

  std::vector<TelemetrySample> snapshot() const;

  // Copies the newest sample. Returns false if the window is empty.
  bool latest(TelemetrySample& out) const;

  size_t size() const;
  void clear();

  static int clampRetention(int seconds);

private:
  void evict_();

  mutable std::mutex _mutex;
  std::deque<TelemetrySample> _samples;
  int _retention_s;
};
