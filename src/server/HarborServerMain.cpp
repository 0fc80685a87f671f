#include <cxxopts.hpp>

#include "HarborServer.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "SupervisorConfig.hpp"
#include "SupervisorRuntime.hpp"

using namespace hb;

namespace {
volatile sig_atomic_t shutdownRequested = 0;

void requestShutdown(int) { shutdownRequested = 1; }
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  hb::HandleTerminate();

  cxxopts::Options options("harbord",
                           "Supervises dev servers and terminal sessions");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("socket", "Path of the command socket",
         cxxopts::value<string>()->default_value(
             HarborServer::getDefaultSocketPath()))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("port-base", "First port handed to dev servers",
         cxxopts::value<int>()->default_value("0"))  //
        ("logtostdout", "log to stdout")             //
        ("logdir", "Directory for log files",
         cxxopts::value<string>()->default_value(GetTempDirectory() +
                                                 "harbor"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "harbord version " << HB_VERSION << endl;
      exit(0);
    }

    SupervisorConfig config;
    if (result.count("cfgfile")) {
      string cfgfilename = result["cfgfile"].as<string>();
      if (!config.loadFromIni(cfgfilename)) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
    }

    // Command line wins over the config file
    if (result.count("port-base")) {
      int portBase = result["port-base"].as<int>();
      if (portBase <= 0 || portBase > config.ports.end) {
        CLOG(INFO, "stdout") << "Invalid --port-base: " << portBase << endl;
        exit(1);
      }
      config.ports.base = portBase;
    }
    LogHandler::applyDebugConfig(
        &defaultConf, config.debug,
        result.count("verbose") ? result["verbose"].as<int>() : -1);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "harbord", result.count("logtostdout") > 0,
                              !result.count("logtostdout"),
                              config.debug.logsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("harbord-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    ::signal(SIGINT, requestShutdown);
    ::signal(SIGTERM, requestShutdown);
    ::signal(SIGPIPE, SIG_IGN);

    shared_ptr<SupervisorRuntime> runtime(new SupervisorRuntime(config));
    runtime->start();

    shared_ptr<SocketHandler> pipeSocketHandler(new PipeSocketHandler());
    shared_ptr<HarborServer> server(new HarborServer(
        pipeSocketHandler, result["socket"].as<string>(), runtime));
    try {
      server->start();
    } catch (const std::runtime_error &re) {
      STERROR << "Cannot start the command channel: " << re.what();
      runtime->shutdown();
      exit(1);
    }

    LOG(INFO) << "harbord " << HB_VERSION << " running, pid " << getpid();
    while (!shutdownRequested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG(INFO) << "Got shutdown signal";
    server->stop();
    runtime->shutdown();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
