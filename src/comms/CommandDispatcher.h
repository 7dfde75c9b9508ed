#pragma once

#include <stdint.h>

#include "Params.h"
#include "comms/Messages.h"

/*
===============================================================================
  CommandDispatcher.h
===============================================================================

  PURPOSE
  -------
  Turns operator input into an encoded command frame:

    1. mode must be one of the 4 known codes (INVALID_MODE otherwise)
    2. every numeric field is clamped into its legal range
         height : [0, HEIGHT_MAX_MM]
         duty   : [0, MAX_DUTY_RAW]
         valve  : [0, MAX_VALVE_STEPS]
       clamping is the policy, it never rejects
    3. the clamped command is serialized with protocol::encodeCommandFrame

  Writing the bytes to the link is the caller's job (LinkSession::send).
===============================================================================
*/

enum class SubmitStatus : uint8_t {
  OK = 0,
  INVALID_MODE,
  ENCODE_FAILED,
};

const char* toString(SubmitStatus status);

struct SubmitResult {
  SubmitStatus status = SubmitStatus::INVALID_MODE;
  CommandFrame cmd;      // valid when status == OK
  CommandBytes bytes;    // valid when status == OK

  bool ok() const { return status == SubmitStatus::OK; }
};

class CommandDispatcher {
public:
  // Raw firmware units. Inputs are wide and signed so out-of-range values
  // (negative, > 65535) clamp instead of wrapping.
  SubmitResult submit(int32_t mode_input,
                      int32_t height_input_mm,
                      int32_t duty_input,
                      int32_t valve_input) const;

  // Operator entry in percent for duty and valve. Percent is clamped to
  // [0, 100] and converted with round(pct * MAX / 100).
  SubmitResult submitPercent(int32_t mode_input,
                             int32_t height_input_mm,
                             double duty_pct,
                             double valve_pct) const;

  // mode = RESET, all targets zero
  SubmitResult reset() const;

  static uint16_t clampU16(int32_t v, uint16_t hi);
  static uint16_t percentToRaw(double pct, uint16_t max_raw);
};

/*=============================================================================
  DISPLAY HELPERS (raw -> percent)
=============================================================================*/

inline double dutyPercent(uint16_t duty_raw) {
  return (double)duty_raw * 100.0 / (double)MAX_DUTY_RAW;
}

inline double valvePercent(uint16_t valve_steps) {
  return (double)valve_steps * 100.0 / (double)MAX_VALVE_STEPS;
}
