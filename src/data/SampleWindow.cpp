#include "data/SampleWindow.h"

/*
  SampleWindow.cpp

  Eviction reference is the newest sample's received_at_us, not the wall
  clock at call time, so the window content depends only on what was
  appended. A sample exactly retention old is kept.
*/

SampleWindow::SampleWindow(int retention_s)
: _retention_s(clampRetention(retention_s))
{
}

int SampleWindow::clampRetention(int seconds) {
  if (seconds < RETENTION_MIN_S) return RETENTION_MIN_S;
  if (seconds > RETENTION_MAX_S) return RETENTION_MAX_S;
  return seconds;
}

void SampleWindow::evict_() {
  if (_samples.empty()) return;

  const uint64_t newest_us = _samples.back().received_at_us;
  const uint64_t span_us = (uint64_t)_retention_s * 1000000ULL;
  if (newest_us < span_us) return;

  const uint64_t cutoff_us = newest_us - span_us;
  while (!_samples.empty() && _samples.front().received_at_us < cutoff_us) {
    _samples.pop_front();
  }
}

void SampleWindow::append(const TelemetrySample& s) {
  std::lock_guard<std::mutex> lock(_mutex);
  _samples.push_back(s);
  evict_();
}

int SampleWindow::setRetention(int seconds) {
  std::lock_guard<std::mutex> lock(_mutex);
  _retention_s = clampRetention(seconds);
  evict_();
  return _retention_s;
}

int SampleWindow::retentionSeconds() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _retention_s;
}

std::vector<TelemetrySample> SampleWindow::snapshot() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return std::vector<TelemetrySample>(_samples.begin(), _samples.end());
}

bool SampleWindow::latest(TelemetrySample& out) const {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_samples.empty()) return false;
  out = _samples.back();
  return true;
}

size_t SampleWindow::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _samples.size();
}

void SampleWindow::clear() {
  std::lock_guard<std::mutex> lock(_mutex);
  _samples.clear();
}
