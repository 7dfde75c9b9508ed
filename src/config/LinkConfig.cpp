#include "config/LinkConfig.h"

#include <fstream>
#include <sstream>

#include <ArduinoJson.h>

#include "comms/SerialPort.h"
#include "data/SampleWindow.h"

/*
  LinkConfig.cpp

  Every key is validated into a scratch copy first; cfg is only replaced
  once the whole document checked out.
*/

const char* toString(ConfigStatus status) {
  switch (status) {
    case ConfigStatus::OK:          return "OK";
    case ConfigStatus::FILE_ERROR:  return "FILE_ERROR";
    case ConfigStatus::PARSE_ERROR: return "PARSE_ERROR";
    case ConfigStatus::BAD_VALUE:   return "BAD_VALUE";
  }
  return "UNKNOWN";
}

LinkReader::Settings LinkConfig::readerSettings() const {
  LinkReader::Settings s;
  s.read_timeout_ms  = read_timeout_ms;
  s.read_chunk_bytes = read_chunk_bytes;
  s.frame_gap_ms     = frame_gap_ms;
  return s;
}

static ConfigStatus bad_(std::string* err, const char* key, const char* why) {
  if (err) {
    *err = key;
    *err += ": ";
    *err += why;
  }
  return ConfigStatus::BAD_VALUE;
}

ConfigStatus parseLinkConfig(const char* json, LinkConfig& cfg, std::string* err) {
  if (!json) {
    if (err) *err = "empty document";
    return ConfigStatus::PARSE_ERROR;
  }

  StaticJsonDocument<CONFIG_JSON_DOC_BYTES> doc;

  DeserializationError de = deserializeJson(doc, json);
  if (de) {
    if (err) *err = de.c_str();
    return ConfigStatus::PARSE_ERROR;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) {
    if (err) *err = "top level is not an object";
    return ConfigStatus::PARSE_ERROR;
  }

  LinkConfig next = cfg;

  if (obj.containsKey("device")) {
    const char* dev = obj["device"];
    if (!dev) return bad_(err, "device", "expected string");
    next.device = dev;
  }

  if (obj.containsKey("baud")) {
    if (!obj["baud"].is<uint32_t>()) return bad_(err, "baud", "expected unsigned integer");
    next.baud = obj["baud"].as<uint32_t>();
    if (!SerialPort::supportedBaud(next.baud)) return bad_(err, "baud", "unsupported rate");
  }

  if (obj.containsKey("retention_s")) {
    if (!obj["retention_s"].is<int>()) return bad_(err, "retention_s", "expected integer");
    next.retention_s = SampleWindow::clampRetention(obj["retention_s"].as<int>());
  }

  if (obj.containsKey("read_timeout_ms")) {
    if (!obj["read_timeout_ms"].is<int>()) return bad_(err, "read_timeout_ms", "expected integer");
    next.read_timeout_ms = obj["read_timeout_ms"].as<int>();
    if (next.read_timeout_ms <= 0) return bad_(err, "read_timeout_ms", "must be > 0");
  }

  if (obj.containsKey("read_chunk_bytes")) {
    if (!obj["read_chunk_bytes"].is<uint32_t>()) return bad_(err, "read_chunk_bytes", "expected unsigned integer");
    next.read_chunk_bytes = obj["read_chunk_bytes"].as<uint32_t>();
    if (next.read_chunk_bytes < RX_FRAME_BYTES) return bad_(err, "read_chunk_bytes", "smaller than one frame");
  }

  if (obj.containsKey("frame_gap_ms")) {
    if (!obj["frame_gap_ms"].is<uint32_t>()) return bad_(err, "frame_gap_ms", "expected unsigned integer");
    next.frame_gap_ms = obj["frame_gap_ms"].as<uint32_t>();
  }

  if (obj.containsKey("health_report_ms")) {
    if (!obj["health_report_ms"].is<uint32_t>()) return bad_(err, "health_report_ms", "expected unsigned integer");
    next.health_report_ms = obj["health_report_ms"].as<uint32_t>();
    if (next.health_report_ms == 0) return bad_(err, "health_report_ms", "must be > 0");
  }

  if (obj.containsKey("log_level")) {
    const char* lvl = obj["log_level"];
    if (!parseLogLevel(lvl, next.log_level)) return bad_(err, "log_level", "expected error|warn|info|debug");
  }

  cfg = next;
  return ConfigStatus::OK;
}

ConfigStatus loadLinkConfig(const std::string& path, LinkConfig& cfg, std::string* err) {
  std::ifstream in(path.c_str());
  if (!in) {
    if (err) *err = "cannot open " + path;
    return ConfigStatus::FILE_ERROR;
  }

  std::stringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    if (err) *err = "read error on " + path;
    return ConfigStatus::FILE_ERROR;
  }

  const std::string text = ss.str();
  return parseLinkConfig(text.c_str(), cfg, err);
}
