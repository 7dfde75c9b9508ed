#pragma once
#include <stddef.h>
#include <stdint.h>

#include "Params.h"

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Defines telemetry and command data structures exchanged between the
  ball-in-tube microcontroller and the host over the fixed-size binary
  frame protocol.

  Must mirror the firmware frame layout:
    micro -> host : mode, heightSP, heightMeas, tof, temp x10,
                    valveSP, valvePos, duty          (15 bytes)
    host -> micro : mode, heightTarget, dutyTarget,
                    valveTarget                      (7 bytes)

  Notes:
  - All uint16 fields are big-endian on the wire.
  - Values here are raw firmware units. Conversion to percent happens in
    display helpers (see CommandDispatcher.h).
===============================================================================
*/


/*=============================================================================
  MODE
=============================================================================*/

// Control regime of the experiment (raw code on the wire)
enum class Mode : uint8_t {
  MANUAL = 0,
  FAN    = 1,
  VALVE  = 2,
  RESET  = 3,
};

const char* toString(Mode mode);


/*=============================================================================
  TELEMETRY (micro -> host)
=============================================================================*/

struct TelemetrySample {
  Mode mode = Mode::MANUAL;

  uint16_t height_setpoint_mm = 0;
  uint16_t height_measured_mm = 0;
  uint16_t tof_average_raw    = 0;   // opaque timer counts

  uint16_t temperature_x10 = 0;      // tenths of a degree C, as sent
  float    temperature_c   = 0.0f;   // temperature_x10 / 10, exact to 0.1

  uint16_t valve_setpoint_raw = 0;   // steps
  uint16_t valve_position_raw = 0;   // steps
  uint16_t duty_raw           = 0;   // 0..MAX_DUTY_RAW

  // Host monotonic clock at decode time (not transmitted by firmware)
  uint64_t received_at_us = 0;
};


/*=============================================================================
  COMMAND (host -> micro)
=============================================================================*/

struct CommandFrame {
  Mode mode = Mode::MANUAL;

  uint16_t height_target_mm = 0;   // 0..HEIGHT_MAX_MM
  uint16_t duty_target      = 0;   // 0..MAX_DUTY_RAW
  uint16_t valve_target     = 0;   // 0..MAX_VALVE_STEPS
};

// Encoded command, ready to write to the link
struct CommandBytes {
  uint8_t data[TX_FRAME_BYTES] = {0};
  static constexpr size_t size() { return TX_FRAME_BYTES; }
};


/*=============================================================================
  STATUS CODES
=============================================================================*/

// Frame-scoped and non-fatal: the stream continues after any of these
enum class DecodeStatus : uint8_t {
  OK = 0,
  INVALID_LENGTH,
  INVALID_MODE,
};

enum class EncodeStatus : uint8_t {
  OK = 0,
  PRECONDITION,   // a field is outside its domain range
};

const char* toString(DecodeStatus status);
const char* toString(EncodeStatus status);
