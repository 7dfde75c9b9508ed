/*
  tubelink monitor (host side of the ball-in-tube experiment)

  Purpose:
  Headless link monitor between the microcontroller and an operator or a
  display process.

  For now:
  - RX: LinkSession reads 15-byte telemetry frames on its own thread and
        prints one JSON line per decoded sample to stdout
  - TX: operator commands arrive as JSON lines on stdin, are clamped by
        CommandDispatcher and written to the link as 7-byte frames
  - Link health is printed every health_report_ms

  Usage:
    tubelink_monitor --device /dev/ttyUSB0 [--config link.json]
                     [--retention 120] [--log-level debug] [--no-samples]

  Exit codes:
    0  stopped by signal or end of input with --exit-on-eof
    1  bad arguments / config / device
    2  link failed while running
*/

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <iostream>
#include <mutex>
#include <string>

#include "Params.h"

#include "comms/CommandDispatcher.h"
#include "comms/JsonLines.h"
#include "comms/LinkSession.h"
#include "comms/SerialPort.h"
#include "config/LinkConfig.h"
#include "utils/Clock.h"
#include "utils/LineAssembler.h"
#include "utils/Log.h"
#include "utils/Rate.h"


/*=============================================================================
  GLOBALS
=============================================================================*/

static volatile sig_atomic_t g_stop = 0;

// stdout is shared by the reader thread (samples) and the main loop
static std::mutex g_out_mutex;

// Upper bound on one main-loop wait so signals are noticed promptly
static const int MAIN_LOOP_MAX_WAIT_MS = 100;

static void onSignal(int) {
  g_stop = 1;
}

struct Options {
  std::string device;
  std::string config_path;
  int retention_s = -1;            // -1 = keep config value
  std::string log_level;
  bool print_samples = true;
  bool exit_on_eof = false;
};

static void printUsage(const char* argv0) {
  fprintf(stderr,
          "usage: %s --device PATH [--config FILE] [--retention SECONDS]\n"
          "          [--log-level error|warn|info|debug] [--no-samples] [--exit-on-eof]\n",
          argv0);
}

static bool parseArgs(int argc, char** argv, Options& opt) {
  for (int i = 1; i < argc; i++) {
    const char* a = argv[i];
    const bool has_value = (i + 1 < argc);

    if (strcmp(a, "--device") == 0 && has_value) {
      opt.device = argv[++i];
    } else if (strcmp(a, "--config") == 0 && has_value) {
      opt.config_path = argv[++i];
    } else if (strcmp(a, "--retention") == 0 && has_value) {
      char* end = nullptr;
      const long v = strtol(argv[++i], &end, 10);
      if (!end || *end != '\0') {
        fprintf(stderr, "--retention: not a number: %s\n", argv[i]);
        return false;
      }
      opt.retention_s = (int)v;
    } else if (strcmp(a, "--log-level") == 0 && has_value) {
      opt.log_level = argv[++i];
    } else if (strcmp(a, "--no-samples") == 0) {
      opt.print_samples = false;
    } else if (strcmp(a, "--exit-on-eof") == 0) {
      opt.exit_on_eof = true;
    } else {
      fprintf(stderr, "unknown or incomplete argument: %s\n", a);
      return false;
    }
  }
  return true;
}


/*=============================================================================
  OPERATOR INPUT
=============================================================================*/

static void handleOperatorLine(const char* line,
                               const CommandDispatcher& dispatcher,
                               LinkSession& session) {
  protocol::OperatorInput in;
  const char* why = nullptr;

  if (!protocol::decodeOperatorLine(line, in, &why)) {
    std::lock_guard<std::mutex> lock(g_out_mutex);
    protocol::encodeErrorLine("bad_input", why, std::cout);
    std::cout.flush();
    return;
  }

  if (in.kind == protocol::OperatorKind::RETENTION) {
    const int applied = session.window().setRetention(in.retention_s);
    LOG_INFO("window: retention set to %d s", applied);
    return;
  }

  SubmitResult r;
  if (in.kind == protocol::OperatorKind::RESET) {
    r = dispatcher.reset();
  } else if (in.kind == protocol::OperatorKind::CMD_PERCENT) {
    r = dispatcher.submitPercent(in.mode, in.height_mm, in.duty_pct, in.valve_pct);
  } else {
    r = dispatcher.submit(in.mode, in.height_mm, in.duty, in.valve);
  }

  std::lock_guard<std::mutex> lock(g_out_mutex);
  if (!r.ok()) {
    protocol::encodeErrorLine("rejected", toString(r.status), std::cout);
  } else if (!session.send(r.bytes)) {
    protocol::encodeErrorLine("link", "write failed", std::cout);
  } else {
    protocol::encodeSentLine(r, std::cout);
  }
  std::cout.flush();
}


/*=============================================================================
  MAIN
=============================================================================*/

int main(int argc, char** argv) {
  Options opt;
  if (!parseArgs(argc, argv, opt)) {
    printUsage(argv[0]);
    return 1;
  }

  // Config: Params.h defaults <- config file <- command line
  LinkConfig cfg;
  if (!opt.config_path.empty()) {
    std::string err;
    const ConfigStatus cs = loadLinkConfig(opt.config_path, cfg, &err);
    if (cs != ConfigStatus::OK) {
      LOG_ERROR("config: %s (%s)", toString(cs), err.c_str());
      return 1;
    }
  }
  if (!opt.device.empty()) cfg.device = opt.device;
  if (opt.retention_s >= 0) cfg.retention_s = SampleWindow::clampRetention(opt.retention_s);
  if (!opt.log_level.empty() && !parseLogLevel(opt.log_level.c_str(), cfg.log_level)) {
    LOG_ERROR("config: unknown log level '%s'", opt.log_level.c_str());
    return 1;
  }
  setLogLevel(cfg.log_level);

  if (cfg.device.empty()) {
    printUsage(argv[0]);
    return 1;
  }

  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  // Serial Comms Setup
  SerialPort port;
  if (!port.open(cfg.device, cfg.baud)) {
    return 1;
  }

  LinkSession session(port, cfg.readerSettings(), cfg.retention_s);
  if (opt.print_samples) {
    session.setSampleHook([](const TelemetrySample& s) {
      std::lock_guard<std::mutex> lock(g_out_mutex);
      protocol::encodeSampleLine(s, std::cout);
      std::cout.flush();
    });
  }

  if (!session.start()) {
    port.close();
    return 1;
  }

  CommandDispatcher dispatcher;
  LineAssembler stdin_lines;
  bool stdin_open = true;

  Rate health_rate(cfg.health_report_ms);

  int exit_code = 0;

  while (!g_stop) {
    if (session.linkFailed()) {
      LOG_ERROR("link to %s lost", cfg.device.c_str());
      exit_code = 2;
      break;
    }

    const uint32_t now_ms = monotonicMs();

    // Health tick: counters + window state
    if (health_rate.ready(now_ms)) {
      const LinkReader::Health h = session.health();
      const std::string note = session.lastNote();
      std::lock_guard<std::mutex> lock(g_out_mutex);
      protocol::encodeHealthLine(h, session.window().size(),
                                 session.window().retentionSeconds(),
                                 note.c_str(), std::cout);
      std::cout.flush();
    }

    int wait_ms = (int)health_rate.remainingMs(monotonicMs());
    if (wait_ms <= 0 || wait_ms > MAIN_LOOP_MAX_WAIT_MS) wait_ms = MAIN_LOOP_MAX_WAIT_MS;

    if (!stdin_open) {
      if (opt.exit_on_eof) break;
      usleep((useconds_t)wait_ms * 1000);
      continue;
    }

    // Operator input tick
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;

    const int pr = ::poll(&pfd, 1, wait_ms);
    if (pr < 0) {
      if (errno == EINTR) continue;
      LOG_ERROR("stdin: poll failed: %s", strerror(errno));
      stdin_open = false;
      continue;
    }
    if (pr == 0) continue;

    char buf[256];
    const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n > 0) {
      stdin_lines.feed(buf, (size_t)n, [&](const char* line, size_t) {
        handleOperatorLine(line, dispatcher, session);
      });
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
      LOG_INFO("stdin closed, no more operator commands");
      stdin_open = false;
    }
  }

  session.stop();
  port.close();
  return exit_code;
}
