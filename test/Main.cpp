#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace hb;

int main(int argc, char **argv) {
  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  HandleTerminate();
  // Writes to a closed command socket must fail instead of killing the run.
  ::signal(SIGPIPE, SIG_IGN);

  // HARBOR_TEST_VERBOSE=4 traces every read and write.
  DebugConfig debug;
  const char *verbose = ::getenv("HARBOR_TEST_VERBOSE");
  if (verbose) {
    debug.verbose = atoi(verbose);
  }
  LogHandler::applyDebugConfig(&defaultConf, debug);

  string logDirectoryPattern =
      GetTempDirectory() + string("harbor_test_XXXXXXXX");
  char *created = mkdtemp(&logDirectoryPattern[0]);
  FATAL_FAIL(created == NULL ? -1 : 0);
  string logDirectory(created);
  LogHandler::setupLogFiles(&defaultConf, logDirectory, "harbor-test", false,
                            false);
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  if (result != 0 && !listOnly) {
    // Keep the daemon-side log around for the failure.
    CLOG(INFO, "stdout") << "Test log kept in " << logDirectory << endl;
  } else {
    fs::remove_all(logDirectory);
  }
  return result;
}
