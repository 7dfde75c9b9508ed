#pragma once

#include <stdint.h>

#include <string>

#include "Params.h"
#include "comms/LinkReader.h"
#include "utils/Log.h"

/*
===============================================================================
  LinkConfig.h
===============================================================================

  PURPOSE
  -------
  Runtime settings of the monitor. Defaults come from Params.h; an
  optional JSON file overrides any subset of keys:

    {
      "device": "/dev/rfcomm0",
      "baud": 115200,
      "retention_s": 120,
      "read_timeout_ms": 50,
      "read_chunk_bytes": 256,
      "frame_gap_ms": 40,
      "health_report_ms": 1000,
      "log_level": "info"
    }

  Unknown keys are ignored. A key with the wrong type or an impossible
  value fails the whole load (nothing is half-applied).
===============================================================================
*/

enum class ConfigStatus : uint8_t {
  OK = 0,
  FILE_ERROR,
  PARSE_ERROR,
  BAD_VALUE,
};

const char* toString(ConfigStatus status);

struct LinkConfig {
  std::string device;                    // empty = must come from --device
  uint32_t baud = SERIAL_BAUD;
  int retention_s = RETENTION_DEFAULT_S;

  int read_timeout_ms = SERIAL_READ_TIMEOUT_MS;
  uint32_t read_chunk_bytes = (uint32_t)SERIAL_READ_CHUNK_BYTES;
  uint32_t frame_gap_ms = FRAME_GAP_MS;

  uint32_t health_report_ms = HEALTH_REPORT_MS;
  LogLevel log_level = LogLevel::INFO;

  LinkReader::Settings readerSettings() const;
};

/*
  Parses a JSON document over the values already in cfg.

  On failure cfg is unchanged and err (if given) names the offending key.
*/
ConfigStatus parseLinkConfig(const char* json, LinkConfig& cfg, std::string* err = nullptr);

// Reads the file at path and calls parseLinkConfig
ConfigStatus loadLinkConfig(const std::string& path, LinkConfig& cfg, std::string* err = nullptr);
