#pragma once
#include <stddef.h>
#include <stdint.h>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Byte-exact encode/decode helpers for the micro <-> host wire protocol.

  Wire format:
    - Fixed-size binary frames, big-endian, no delimiter, no checksum
    - micro -> host : 15 bytes
        [0]      mode
        [1..2]   height setpoint (mm)
        [3..4]   height measured (mm)
        [5..6]   time-of-flight average (timer counts)
        [7..8]   temperature (tenths of a degree C)
        [9..10]  valve setpoint (steps)
        [11..12] valve position (steps)
        [13..14] fan duty (0..1023)
    - host -> micro : 7 bytes
        [0]      mode
        [1..2]   height target (mm)
        [3..4]   duty target
        [5..6]   valve target (steps)

  A frame either fully decodes or is rejected as a unit.
===============================================================================
*/

namespace protocol {

/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Big-endian uint16 at p[0..1]
inline uint16_t readU16BE(const uint8_t* p) {
  return (uint16_t)(((uint16_t)p[0] << 8) | (uint16_t)p[1]);
}

inline void writeU16BE(uint8_t* p, uint16_t v) {
  p[0] = (uint8_t)(v >> 8);
  p[1] = (uint8_t)(v & 0xFF);
}

// Maps a raw mode byte to Mode. Returns false for unknown codes.
bool modeFromRaw(uint8_t raw, Mode& out_mode);

// Exact x10 fixed-point -> float (whole part + tenths, no float division)
float temperatureFromX10(uint16_t raw_x10);

// Writes "23.5" style text for a tenths-of-degree value. Returns chars written.
size_t formatTemperature(uint16_t raw_x10, char* out, size_t out_len);


/*=============================================================================
  DECODE (micro -> host)
=============================================================================*/

/*
  Decodes one telemetry frame.

  Returns:
    - OK             out_sample holds every field (received_at_us = 0,
                     the caller stamps host time)
    - INVALID_LENGTH len != RX_FRAME_BYTES
    - INVALID_MODE   byte 0 is not a known mode code

  out_sample is only written on OK.
*/
DecodeStatus decodeTelemetryFrame(const uint8_t* buf, size_t len,
                                  TelemetrySample& out_sample);


/*=============================================================================
  ENCODE (host -> micro)
=============================================================================*/

/*
  Serializes an already clamped command. No clamping happens here.

  Returns PRECONDITION (and leaves out untouched) if any field is outside
  its domain range, so an unclamped command can never reach the wire.
*/
EncodeStatus encodeCommandFrame(const CommandFrame& cmd, CommandBytes& out);

}  // namespace protocol
