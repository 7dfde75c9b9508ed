#include "comms/CommandDispatcher.h"

#include <math.h>

#include "comms/Protocol.h"
#include "utils/Log.h"

const char* toString(SubmitStatus status) {
  switch (status) {
    case SubmitStatus::OK:            return "OK";
    case SubmitStatus::INVALID_MODE:  return "INVALID_MODE";
    case SubmitStatus::ENCODE_FAILED: return "ENCODE_FAILED";
  }
  return "UNKNOWN";
}

uint16_t CommandDispatcher::clampU16(int32_t v, uint16_t hi) {
  if (v < 0) return 0;
  if (v > (int32_t)hi) return hi;
  return (uint16_t)v;
}

uint16_t CommandDispatcher::percentToRaw(double pct, uint16_t max_raw) {
  if (!(pct >= PERCENT_MIN)) pct = PERCENT_MIN;   // also catches NaN
  if (pct > PERCENT_MAX) pct = PERCENT_MAX;

  // round() is half away from zero; pct is non-negative here
  const long raw = lround(pct * (double)max_raw / 100.0);
  return clampU16((int32_t)raw, max_raw);
}

SubmitResult CommandDispatcher::submit(int32_t mode_input,
                                       int32_t height_input_mm,
                                       int32_t duty_input,
                                       int32_t valve_input) const {
  SubmitResult r;

  Mode mode;
  if (mode_input < 0 || mode_input > 0xFF ||
      !protocol::modeFromRaw((uint8_t)mode_input, mode)) {
    LOG_WARN("cmd: rejected, unknown mode %ld", (long)mode_input);
    r.status = SubmitStatus::INVALID_MODE;
    return r;
  }

  r.cmd.mode             = mode;
  r.cmd.height_target_mm = clampU16(height_input_mm, HEIGHT_MAX_MM);
  r.cmd.duty_target      = clampU16(duty_input, MAX_DUTY_RAW);
  r.cmd.valve_target     = clampU16(valve_input, MAX_VALVE_STEPS);

  if (r.cmd.height_target_mm != height_input_mm ||
      r.cmd.duty_target != duty_input ||
      r.cmd.valve_target != valve_input) {
    LOG_INFO("cmd: clamped input h=%ld d=%ld v=%ld -> h=%u d=%u v=%u",
             (long)height_input_mm, (long)duty_input, (long)valve_input,
             (unsigned)r.cmd.height_target_mm,
             (unsigned)r.cmd.duty_target,
             (unsigned)r.cmd.valve_target);
  }

  const EncodeStatus es = protocol::encodeCommandFrame(r.cmd, r.bytes);
  if (es != EncodeStatus::OK) {
    LOG_ERROR("cmd: encode failed (%s)", toString(es));
    r.status = SubmitStatus::ENCODE_FAILED;
    return r;
  }

  r.status = SubmitStatus::OK;
  return r;
}

SubmitResult CommandDispatcher::submitPercent(int32_t mode_input,
                                              int32_t height_input_mm,
                                              double duty_pct,
                                              double valve_pct) const {
  return submit(mode_input,
                height_input_mm,
                (int32_t)percentToRaw(duty_pct, MAX_DUTY_RAW),
                (int32_t)percentToRaw(valve_pct, MAX_VALVE_STEPS));
}

SubmitResult CommandDispatcher::reset() const {
  return submit((int32_t)Mode::RESET, 0, 0, 0);
}
