#ifndef __HB_LOG_HANDLER__
#define __HB_LOG_HANDLER__

#include "Headers.hpp"
#include "SupervisorConfig.hpp"

namespace hb {
/**
 * @brief Configures easylogging++ for the daemon, the CLI and the tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging, optionally writing stderr to disk.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Applies the `[Debug]` section: verbosity and the silent switch.
   * @param verboseOverride Used instead of `debug.verbose` when >= 0.
   */
  static void applyDebugConfig(el::Configurations *defaultConf,
                               const DebugConfig &debug,
                               int verboseOverride = -1);

  /** @brief Pre-roll-out callback: removes the full log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the `stdout` logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace hb
#endif  // __HB_LOG_HANDLER__
