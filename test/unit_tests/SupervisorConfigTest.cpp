#include "SupervisorConfig.hpp"

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace hb;

TEST_CASE("SupervisorConfig defaults", "[SupervisorConfig]") {
  SupervisorConfig config;
  REQUIRE(config.ports.base == 3000);
  REQUIRE(config.ports.end == 9999);
  REQUIRE(config.ports.reserved == set<int>({3000, 3001}));
  REQUIRE(config.devServer.readinessTimeout == chrono::milliseconds(30000));
  REQUIRE(config.devServer.grace == chrono::milliseconds(5000));
  REQUIRE(config.broker.coalesceWindow == chrono::milliseconds(50));
}

TEST_CASE("SupervisorConfig reads every section", "[SupervisorConfig]") {
  SupervisorConfig config;
  REQUIRE(config.loadFromString("[Ports]\n"
                                "base = 4000\n"
                                "end = 4100\n"
                                "reserved = 4000, 4001 ,4050\n"
                                "probe = 0\n"
                                "[DevServer]\n"
                                "command = yarn dev\n"
                                "readiness = ready in, http://localhost:{port}\n"
                                "readiness_timeout_ms = 12000\n"
                                "grace_ms = 750\n"
                                "[Session]\n"
                                "shell = /bin/bash\n"
                                "rows = 50\n"
                                "cols = 200\n"
                                "[Broker]\n"
                                "coalesce_ms = 16\n"
                                "max_buffered_bytes = 4096\n"
                                "[Debug]\n"
                                "verbose = 3\n"
                                "silent = 1\n"));
  REQUIRE(config.ports.base == 4000);
  REQUIRE(config.ports.end == 4100);
  REQUIRE(config.ports.reserved == set<int>({4000, 4001, 4050}));
  REQUIRE_FALSE(config.ports.probe);
  REQUIRE(config.devServer.command == "yarn dev");
  REQUIRE(config.devServer.readinessPatterns ==
          vector<string>({"ready in", "http://localhost:{port}"}));
  REQUIRE(config.devServer.readinessTimeout == chrono::milliseconds(12000));
  REQUIRE(config.devServer.grace == chrono::milliseconds(750));
  REQUIRE(config.session.shell == "/bin/bash");
  REQUIRE(config.session.rows == 50);
  REQUIRE(config.session.cols == 200);
  REQUIRE(config.broker.coalesceWindow == chrono::milliseconds(16));
  REQUIRE(config.broker.maxBufferedBytes == 4096);
  REQUIRE(config.debug.verbose == 3);
  REQUIRE(config.debug.silent);

  // Untouched keys keep their defaults.
  REQUIRE(config.broker.inputPause == chrono::milliseconds(25));
  REQUIRE(config.session.grace == chrono::milliseconds(5000));
}

TEST_CASE("SupervisorConfig rejects bad values", "[SupervisorConfig]") {
  SupervisorConfig config;

  SECTION("Not a number") {
    REQUIRE_FALSE(config.loadFromString("[Ports]\nbase = lots\n"));
  }

  SECTION("Inverted port range") {
    REQUIRE_FALSE(config.loadFromString("[Ports]\nbase = 5000\nend = 4000\n"));
  }

  SECTION("Port past the top of the range") {
    REQUIRE_FALSE(config.loadFromString("[Ports]\nend = 70000\n"));
  }

  SECTION("Negative duration") {
    REQUIRE_FALSE(
        config.loadFromString("[DevServer]\nreadiness_timeout_ms = -1\n"));
  }

  SECTION("Zero buffer") {
    REQUIRE_FALSE(config.loadFromString("[Broker]\nmax_batch_bytes = 0\n"));
  }

  SECTION("Bad reserved entry") {
    REQUIRE_FALSE(config.loadFromString("[Ports]\nreserved = 3000,abc\n"));
  }
}

TEST_CASE("SupervisorConfig loads from a file", "[SupervisorConfig]") {
  string directory = makeTempDirectory("harbor_config");
  string path = directory + "/harbor.cfg";
  {
    ofstream out(path);
    out << "[Ports]\nbase = 5000\n";
  }
  SupervisorConfig config;
  REQUIRE(config.loadFromIni(path));
  REQUIRE(config.ports.base == 5000);
  REQUIRE_FALSE(config.loadFromIni(directory + "/missing.cfg"));
  fs::remove_all(directory);
}

TEST_CASE("SupervisorConfig resolves the shell", "[SupervisorConfig]") {
  SupervisorConfig config;
  config.session.shell = "/bin/zsh";
  REQUIRE(config.session.resolveShell() == "/bin/zsh");

  config.session.shell.clear();
  const char* saved = ::getenv("SHELL");
  string previous = saved ? saved : "";
  ::setenv("SHELL", "/usr/bin/fish", 1);
  REQUIRE(config.session.resolveShell() == "/usr/bin/fish");
  ::unsetenv("SHELL");
  REQUIRE(config.session.resolveShell() == "/bin/sh");
  if (saved) {
    ::setenv("SHELL", previous.c_str(), 1);
  }
}

TEST_CASE("LogHandler applies the debug section", "[SupervisorConfig]") {
  auto previous = el::Loggers::verboseLevel();
  el::Configurations conf;
  conf.setToDefault();
  DebugConfig debug;
  debug.verbose = 2;

  LogHandler::applyDebugConfig(&conf, debug);
  REQUIRE(el::Loggers::verboseLevel() == 2);
  REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::Enabled)
              ->value() == "true");

  // The command line wins.
  debug.silent = true;
  LogHandler::applyDebugConfig(&conf, debug, 5);
  REQUIRE(el::Loggers::verboseLevel() == 5);
  REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::Enabled)
              ->value() == "false");

  el::Loggers::setVerboseLevel(previous);
}
