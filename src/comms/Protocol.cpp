#include "comms/Protocol.h"

#include <stdio.h>

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements the fixed-size binary frame codec.

  Notes:
  - Temperature is kept as an integer x10 value and converted by splitting
    into whole and tenths, so 235 always becomes 23.5 on every platform.
  - Decode validates everything before writing the output sample.
===============================================================================
*/


/*=============================================================================
  STATUS STRINGS
=============================================================================*/

const char* toString(Mode mode) {
  switch (mode) {
    case Mode::MANUAL: return "MANUAL";
    case Mode::FAN:    return "FAN";
    case Mode::VALVE:  return "VALVE";
    case Mode::RESET:  return "RESET";
  }
  return "UNKNOWN";
}

const char* toString(DecodeStatus status) {
  switch (status) {
    case DecodeStatus::OK:             return "OK";
    case DecodeStatus::INVALID_LENGTH: return "INVALID_LENGTH";
    case DecodeStatus::INVALID_MODE:   return "INVALID_MODE";
  }
  return "UNKNOWN";
}

const char* toString(EncodeStatus status) {
  switch (status) {
    case EncodeStatus::OK:           return "OK";
    case EncodeStatus::PRECONDITION: return "PRECONDITION";
  }
  return "UNKNOWN";
}


namespace protocol {

/*=============================================================================
  SMALL HELPERS
=============================================================================*/

bool modeFromRaw(uint8_t raw, Mode& out_mode) {
  if (raw >= MODE_COUNT) return false;
  out_mode = static_cast<Mode>(raw);
  return true;
}

float temperatureFromX10(uint16_t raw_x10) {
  const uint16_t whole  = raw_x10 / 10;
  const uint16_t tenths = raw_x10 % 10;
  return (float)whole + (float)tenths / 10.0f;
}

size_t formatTemperature(uint16_t raw_x10, char* out, size_t out_len) {
  if (!out || out_len == 0) return 0;

  const int n = snprintf(out, out_len, "%u.%u",
                         (unsigned)(raw_x10 / 10),
                         (unsigned)(raw_x10 % 10));
  if (n < 0) {
    out[0] = '\0';
    return 0;
  }
  return ((size_t)n < out_len) ? (size_t)n : out_len - 1;
}


/*=============================================================================
  DECODE (micro -> host)
=============================================================================*/

DecodeStatus decodeTelemetryFrame(const uint8_t* buf, size_t len,
                                  TelemetrySample& out_sample) {
  if (!buf || len != RX_FRAME_BYTES) return DecodeStatus::INVALID_LENGTH;

  Mode mode;
  if (!modeFromRaw(buf[0], mode)) return DecodeStatus::INVALID_MODE;

  TelemetrySample s;
  s.mode               = mode;
  s.height_setpoint_mm = readU16BE(buf + 1);
  s.height_measured_mm = readU16BE(buf + 3);
  s.tof_average_raw    = readU16BE(buf + 5);
  s.temperature_x10    = readU16BE(buf + 7);
  s.temperature_c      = temperatureFromX10(s.temperature_x10);
  s.valve_setpoint_raw = readU16BE(buf + 9);
  s.valve_position_raw = readU16BE(buf + 11);
  s.duty_raw           = readU16BE(buf + 13);

  out_sample = s;
  return DecodeStatus::OK;
}


/*=============================================================================
  ENCODE (host -> micro)
=============================================================================*/

EncodeStatus encodeCommandFrame(const CommandFrame& cmd, CommandBytes& out) {
  const uint8_t raw_mode = static_cast<uint8_t>(cmd.mode);

  if (raw_mode >= MODE_COUNT)               return EncodeStatus::PRECONDITION;
  if (cmd.height_target_mm > HEIGHT_MAX_MM) return EncodeStatus::PRECONDITION;
  if (cmd.duty_target > MAX_DUTY_RAW)       return EncodeStatus::PRECONDITION;
  if (cmd.valve_target > MAX_VALVE_STEPS)   return EncodeStatus::PRECONDITION;

  out.data[0] = raw_mode;
  writeU16BE(out.data + 1, cmd.height_target_mm);
  writeU16BE(out.data + 3, cmd.duty_target);
  writeU16BE(out.data + 5, cmd.valve_target);

  return EncodeStatus::OK;
}

}  // namespace protocol
