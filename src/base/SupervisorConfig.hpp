#ifndef __HB_SUPERVISOR_CONFIG__
#define __HB_SUPERVISOR_CONFIG__

#include "Headers.hpp"

namespace hb {
/** @brief Port pool policy shared by every dev server. */
struct PortConfig {
  int base = 3000;
  int end = 9999;
  set<int> reserved = {3000, 3001};
  // Skip candidates that some process outside the supervisor already holds.
  bool probe = true;
  int maxProbes = 64;
};

struct DevServerConfig {
  string command = "npm start";
  string host = "localhost";
  // `{port}` is replaced with the leased port before matching.
  vector<string> readinessPatterns = {"webpack compiled",
                                      "compiled successfully",
                                      "localhost:{port}"};
  chrono::milliseconds readinessTimeout = chrono::milliseconds(30000);
  chrono::milliseconds grace = chrono::milliseconds(5000);
  size_t errorTailBytes = 4096;
};

struct SessionConfig {
  // Empty means $SHELL, falling back to /bin/sh.
  string shell;
  chrono::milliseconds grace = chrono::milliseconds(5000);
  int rows = 24;
  int cols = 80;

  /** @brief The configured shell, then $SHELL, then /bin/sh. */
  string resolveShell() const;
};

struct BrokerConfig {
  chrono::milliseconds coalesceWindow = chrono::milliseconds(50);
  chrono::milliseconds inputPause = chrono::milliseconds(25);
  size_t maxBatchBytes = 64 * 1024;
  size_t maxBufferedBytes = 1024 * 1024;
};

struct DebugConfig {
  int verbose = 0;
  string logsize = "20971520";
  bool silent = false;
};

/**
 * @brief Everything the daemon reads from its INI file.
 *
 * Defaults are usable as-is; `loadFromIni` only overrides keys that are
 * present.
 */
struct SupervisorConfig {
  PortConfig ports;
  DevServerConfig devServer;
  SessionConfig session;
  BrokerConfig broker;
  DebugConfig debug;

  /**
   * @brief Overlays values from an INI file.
   * @return false if the file cannot be loaded or a value does not parse.
   */
  bool loadFromIni(const string& filename);

  /** @brief Same as `loadFromIni` but reads INI text from memory. */
  bool loadFromString(const string& iniText);
};
}  // namespace hb

#endif  // __HB_SUPERVISOR_CONFIG__
