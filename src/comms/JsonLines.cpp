#include "comms/JsonLines.h"

#include <math.h>
#include <stdio.h>
#include <string.h>

#include <ArduinoJson.h>

#include "Params.h"
#include "comms/Protocol.h"

/*
===============================================================================
  JsonLines.cpp
===============================================================================

  Notes:
  - Encoding and decoding both go through ArduinoJson fixed-size documents.
  - Temperature is emitted twice: the exact text form ("23.5") and the
    float, so consumers never need to redo the x10 scaling.
  - Numeric operator fields are read as double and clamped into int32
    range before the dispatcher clamps them into engineering limits.
===============================================================================
*/


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

static int32_t toClampedI32(double v) {
  if (isnan(v)) return 0;
  if (v <= -2147483648.0) return INT32_MIN;
  if (v >= 2147483647.0) return INT32_MAX;
  return (int32_t)lround(v);
}

static void fail_(const char** err_reason, const char* why) {
  if (err_reason) *err_reason = why;
}

// Reads obj[key] into out if present. A key holding anything but a
// number fails with bad_reason.
static bool optionalNumber_(JsonObject obj, const char* key, double& out,
                            const char* bad_reason, const char** err_reason) {
  if (!obj.containsKey(key)) return true;

  JsonVariant v = obj[key];
  if (!v.is<double>()) {
    fail_(err_reason, bad_reason);
    return false;
  }
  out = v.as<double>();
  return true;
}


namespace protocol {

size_t formatHex(const uint8_t* data, size_t len, char* out, size_t out_len) {
  if (!out || out_len == 0) return 0;
  out[0] = '\0';
  if (!data) return 0;

  size_t pos = 0;
  for (size_t i = 0; i < len; i++) {
    // "XX" plus a separator, plus room for the terminator
    if (pos + 3 + 1 > out_len) break;
    if (i > 0) out[pos++] = ' ';
    snprintf(out + pos, out_len - pos, "%02X", (unsigned)data[i]);
    pos += 2;
  }
  out[pos] = '\0';
  return pos;
}


/*=============================================================================
  ENCODE (host -> consumer)
=============================================================================*/

void encodeSampleLine(const TelemetrySample& s, std::ostream& out) {
  StaticJsonDocument<TELEMETRY_JSON_DOC_BYTES> doc;

  char temp_text[16];
  formatTemperature(s.temperature_x10, temp_text, sizeof(temp_text));

  doc["type"] = "telemetry";
  doc["t_us"] = s.received_at_us;
  doc["mode"] = static_cast<uint8_t>(s.mode);
  doc["mode_name"] = toString(s.mode);

  JsonObject height = doc.createNestedObject("height");
  height["setpoint_mm"] = s.height_setpoint_mm;
  height["measured_mm"] = s.height_measured_mm;

  doc["tof_raw"] = s.tof_average_raw;

  JsonObject temp = doc.createNestedObject("temperature");
  temp["x10"] = s.temperature_x10;
  temp["c"] = s.temperature_c;
  temp["text"] = temp_text;   // char* is copied into the document

  JsonObject valve = doc.createNestedObject("valve");
  valve["setpoint_raw"] = s.valve_setpoint_raw;
  valve["position_raw"] = s.valve_position_raw;
  valve["position_pct"] = valvePercent(s.valve_position_raw);

  JsonObject fan = doc.createNestedObject("fan");
  fan["duty_raw"] = s.duty_raw;
  fan["duty_pct"] = dutyPercent(s.duty_raw);

  serializeJson(doc, out);
  out << '\n';
}

void encodeHealthLine(const LinkReader::Health& h,
                      size_t window_samples,
                      int retention_s,
                      const char* note,
                      std::ostream& out) {
  StaticJsonDocument<TELEMETRY_JSON_DOC_BYTES> doc;

  doc["type"] = "health";
  doc["bytes_in"] = h.bytes_in;
  doc["frames_ok"] = h.frames_ok;
  doc["degraded"] = h.degraded();

  JsonObject detail = doc.createNestedObject("detail");
  detail["invalid_mode"] = h.invalid_mode;
  detail["resync_events"] = h.resync_events;
  detail["resync_flushes"] = h.resync_flushes;
  detail["truncated_frames"] = h.truncated_frames;
  detail["dropped_bytes"] = h.dropped_bytes;
  detail["read_errors"] = h.read_errors;

  JsonObject window = doc.createNestedObject("window");
  window["samples"] = window_samples;
  window["retention_s"] = retention_s;

  if (note && note[0] != '\0')
    doc["note"] = note;
  else
    doc["note"] = nullptr;

  serializeJson(doc, out);
  out << '\n';
}

void encodeSentLine(const SubmitResult& r, std::ostream& out) {
  StaticJsonDocument<OPERATOR_JSON_DOC_BYTES> doc;

  char hex[TX_FRAME_BYTES * 3 + 1];
  formatHex(r.bytes.data, CommandBytes::size(), hex, sizeof(hex));

  doc["type"] = "sent";
  doc["mode"] = static_cast<uint8_t>(r.cmd.mode);
  doc["height_mm"] = r.cmd.height_target_mm;
  doc["duty"] = r.cmd.duty_target;
  doc["valve"] = r.cmd.valve_target;
  doc["hex"] = hex;

  serializeJson(doc, out);
  out << '\n';
}

void encodeErrorLine(const char* reason, const char* detail, std::ostream& out) {
  StaticJsonDocument<OPERATOR_JSON_DOC_BYTES> doc;

  doc["type"] = "error";
  doc["reason"] = reason ? reason : "unknown";
  if (detail)
    doc["detail"] = detail;
  else
    doc["detail"] = nullptr;

  serializeJson(doc, out);
  out << '\n';
}


/*=============================================================================
  DECODE (operator -> host)
=============================================================================*/

bool decodeOperatorLine(const char* line, OperatorInput& out_input,
                        const char** err_reason) {
  out_input = OperatorInput();   // reset everything
  if (!line) {
    fail_(err_reason, "empty line");
    return false;
  }

  StaticJsonDocument<OPERATOR_JSON_DOC_BYTES> doc;

  if (deserializeJson(doc, line)) {
    fail_(err_reason, "bad json");
    return false;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) {
    fail_(err_reason, "not an object");
    return false;
  }

  const char* type = obj["type"];
  if (!type) {
    fail_(err_reason, "missing type");
    return false;
  }

  if (strcmp(type, "reset") == 0) {
    out_input.kind = OperatorKind::RESET;
    return true;
  }

  if (strcmp(type, "retention") == 0) {
    if (!obj["seconds"].is<double>()) {
      fail_(err_reason, "missing seconds");
      return false;
    }
    out_input.retention_s = toClampedI32(obj["seconds"].as<double>());
    out_input.kind = OperatorKind::RETENTION;
    return true;
  }

  const bool raw = strcmp(type, "cmd") == 0;
  const bool pct = strcmp(type, "cmd_pct") == 0;
  if (!raw && !pct) {
    fail_(err_reason, "unknown type");
    return false;
  }

  // Mode is required and must be an integer; range is checked by the dispatcher
  if (!obj["mode"].is<long>()) {
    fail_(err_reason, "missing mode");
    return false;
  }
  out_input.mode = toClampedI32(obj["mode"].as<double>());

  // Optional numeric fields default to 0; a present non-number rejects the line
  double height = 0.0, first = 0.0, second = 0.0;
  if (!optionalNumber_(obj, "height_mm", height, "bad height_mm", err_reason)) return false;

  if (raw) {
    if (!optionalNumber_(obj, "duty", first, "bad duty", err_reason)) return false;
    if (!optionalNumber_(obj, "valve", second, "bad valve", err_reason)) return false;
    out_input.duty = toClampedI32(first);
    out_input.valve = toClampedI32(second);
    out_input.kind = OperatorKind::CMD_RAW;
  } else {
    if (!optionalNumber_(obj, "duty_pct", first, "bad duty_pct", err_reason)) return false;
    if (!optionalNumber_(obj, "valve_pct", second, "bad valve_pct", err_reason)) return false;
    out_input.duty_pct = first;
    out_input.valve_pct = second;
    out_input.kind = OperatorKind::CMD_PERCENT;
  }
  out_input.height_mm = toClampedI32(height);

  return true;
}

}  // namespace protocol
