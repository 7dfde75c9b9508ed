#pragma once

#include <stddef.h>
#include <stdint.h>

#include <ostream>

#include "comms/CommandDispatcher.h"
#include "comms/LinkReader.h"
#include "comms/Messages.h"

/*
===============================================================================
  JsonLines.h
===============================================================================

  PURPOSE
  -------
  Newline-delimited JSON surface of the monitor (one object per line).

  Host -> consumer (stdout):
    {"type":"telemetry", ...}   one decoded sample
    {"type":"health", ...}      link-health counters + window state
    {"type":"sent","hex":"..."} an encoded command went out
    {"type":"error", ...}       operator input was rejected

  Operator -> host (stdin):
    {"type":"cmd","mode":1,"height_mm":250,"duty":512,"valve":100}
    {"type":"cmd_pct","mode":2,"height_mm":250,"duty_pct":50,"valve_pct":25}
    {"type":"reset"}
    {"type":"retention","seconds":120}

  Field names are the consumer contract; keep them stable.
===============================================================================
*/

namespace protocol {

/*=============================================================================
  OPERATOR INPUT
=============================================================================*/

enum class OperatorKind : uint8_t {
  NONE = 0,
  CMD_RAW,
  CMD_PERCENT,
  RESET,
  RETENTION,
};

struct OperatorInput {
  OperatorKind kind = OperatorKind::NONE;

  int32_t mode = 0;
  int32_t height_mm = 0;

  int32_t duty = 0;          // CMD_RAW
  int32_t valve = 0;         // CMD_RAW

  double duty_pct = 0.0;     // CMD_PERCENT
  double valve_pct = 0.0;    // CMD_PERCENT

  int32_t retention_s = 0;   // RETENTION
};


/*=============================================================================
  ENCODE (host -> consumer)
=============================================================================*/

// Writes one line each (includes trailing '\n')
void encodeSampleLine(const TelemetrySample& s, std::ostream& out);

void encodeHealthLine(const LinkReader::Health& h,
                      size_t window_samples,
                      int retention_s,
                      const char* note,
                      std::ostream& out);

void encodeSentLine(const SubmitResult& r, std::ostream& out);

void encodeErrorLine(const char* reason, const char* detail, std::ostream& out);

// "01 00 FA 02 00 00 64" (uppercase, space separated). Returns chars written.
size_t formatHex(const uint8_t* data, size_t len, char* out, size_t out_len);


/*=============================================================================
  DECODE (operator -> host)
=============================================================================*/

/*
  Parses one operator line.

  Returns:
    - true if decoded into out_input (kind != NONE)
    - false on bad JSON, an unknown type, a missing required field or a
      non-numeric value in a numeric field
      (err_reason, if given, points at a static description)
*/
bool decodeOperatorLine(const char* line, OperatorInput& out_input,
                        const char** err_reason = nullptr);

}  // namespace protocol
