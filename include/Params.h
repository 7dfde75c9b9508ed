#pragma once
#include <stddef.h>
#include <stdint.h>

/*
  Params.h

  Purpose:
  Central location for link constants and tunable defaults of the
  ball-in-tube telemetry host.

  Convention:
  - Heights: millimeters (mm)
  - Temperature on the wire: tenths of a degree C
  - Duty: raw fan PWM units (0..MAX_DUTY_RAW)
  - Valve: raw stepper steps (0..MAX_VALVE_STEPS)
  - Host times: ms or us, named with the unit suffix

  Anything in this file that an operator may want to change at runtime
  has a matching key in LinkConfig (config/LinkConfig.h).
*/

/* ============================================================================
   WIRE PROTOCOL
============================================================================ */

// micro -> host: mode(1) + 7 x uint16 big-endian
constexpr size_t RX_FRAME_BYTES = 15;

// host -> micro: mode(1) + height(2) + duty(2) + valve(2), big-endian
constexpr size_t TX_FRAME_BYTES = 7;

// Number of valid mode codes (0=Manual, 1=Fan, 2=Valve, 3=Reset)
constexpr uint8_t MODE_COUNT = 4;

/* ============================================================================
   ENGINEERING LIMITS (firmware side, not negotiable)
============================================================================ */

constexpr uint16_t HEIGHT_MAX_MM   = 500;
constexpr uint16_t MAX_DUTY_RAW    = 1023;   // 10-bit PWM
constexpr uint16_t MAX_VALVE_STEPS = 420;

// Operator entry in percent
constexpr int PERCENT_MIN = 0;
constexpr int PERCENT_MAX = 100;

/* ============================================================================
   SERIAL LINK
============================================================================ */

constexpr uint32_t SERIAL_BAUD = 115200;

// Short poll timeout so the reader thread notices stop() quickly
constexpr int SERIAL_READ_TIMEOUT_MS = 50;

constexpr size_t SERIAL_READ_CHUNK_BYTES = 256;

// Firmware cadence is ~40 ms per frame. Silence longer than this with a
// partial frame buffered means the partial frame is lost.
constexpr uint32_t FRAME_GAP_MS = 40;

// Resync: one alignment search tries at most one frame length of offsets
constexpr size_t RESYNC_MAX_SHIFTS = RX_FRAME_BYTES;

/* ============================================================================
   SAMPLE WINDOW
============================================================================ */

constexpr int RETENTION_MIN_S     = 5;
constexpr int RETENTION_MAX_S     = 600;
constexpr int RETENTION_DEFAULT_S = 60;

/* ============================================================================
   MONITOR / REPORTING
============================================================================ */

constexpr uint32_t HEALTH_REPORT_MS = 1000;

// ArduinoJson pools (slots are ~32 bytes each on a 64-bit host)
constexpr size_t CONFIG_JSON_DOC_BYTES    = 1024;
constexpr size_t OPERATOR_JSON_DOC_BYTES  = 512;
constexpr size_t TELEMETRY_JSON_DOC_BYTES = 1024;

// Length of the LinkReader "last note" buffer (shown in health lines)
constexpr size_t LINK_NOTE_BYTES = 96;
