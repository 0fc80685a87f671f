#include <cxxopts.hpp>

#include "HarborClient.hpp"
#include "HarborServer.hpp"
#include "JsonLib.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"

using namespace hb;

namespace {
const char* USAGE =
    "Commands:\n"
    "  start <owner> [--cwd DIR] [--name NAME] [--port PORT]\n"
    "  stop <owner>\n"
    "  status <owner>\n"
    "  list\n"
    "  open [--session ID] [--cwd DIR] [--context KEY=VALUE ...]\n"
    "  write <session> <data>\n"
    "  resize <session> <rows> <cols>\n"
    "  kill <session>\n"
    "  attach <source>     stream output until the source exits\n"
    "  watch               stream progress and exit events\n";

volatile sig_atomic_t interrupted = 0;

void onInterrupt(int) { interrupted = 1; }

int printReply(const CommandReply& reply) {
  CLOG(INFO, "stdout") << toJsonLine(toJson(reply)) << endl;
  return isOk(reply) ? 0 : 2;
}

/** @brief Prints pushed events until `stop` says so or Ctrl-C. */
void streamEvents(HarborClient* client,
                  const function<bool(const Packet&)>& stop) {
  Packet packet;
  while (!interrupted) {
    if (!client->nextEvent(&packet, 250)) {
      continue;
    }
    json j;
    switch (packet.getHeader()) {
      case PROGRESS_EVENT:
        j = toJson(packet.getProto<ProgressEvent>());
        break;
      case OUTPUT_EVENT:
        j = toJson(packet.getProto<OutputEvent>());
        break;
      case EXIT_EVENT:
        j = toJson(packet.getProto<ExitEvent>());
        break;
      default:
        LOG(WARNING) << "Unexpected packet type " << int(packet.getHeader());
        continue;
    }
    CLOG(INFO, "stdout") << toJsonLine(j) << endl;
    if (stop(packet)) {
      return;
    }
  }
}

int runCommand(HarborClient* client, const string& command,
               const vector<string>& args, const cxxopts::ParseResult& result) {
  auto requireArgs = [&](size_t count) {
    if (args.size() < count) {
      throw cxxopts::OptionException("Missing arguments for " + command);
    }
  };

  if (command == "start") {
    requireArgs(1);
    StartServerRequest request;
    request.set_ownerid(args[0]);
    request.set_workingdirectory(result["cwd"].as<string>());
    request.set_projectname(result.count("name") ? result["name"].as<string>()
                                                 : args[0]);
    if (result.count("port")) {
      request.set_preferredport(result["port"].as<int>());
    }
    return printReply(client->call(START_SERVER, request));
  }
  if (command == "stop") {
    requireArgs(1);
    StopServerRequest request;
    request.set_ownerid(args[0]);
    return printReply(client->call(STOP_SERVER, request));
  }
  if (command == "status") {
    requireArgs(1);
    GetStatusRequest request;
    request.set_ownerid(args[0]);
    return printReply(client->call(GET_STATUS, request));
  }
  if (command == "list") {
    return printReply(client->call(LIST, ListRequest()));
  }
  if (command == "open") {
    SessionOpenRequest request;
    if (result.count("session")) {
      request.set_sessionid(result["session"].as<string>());
    }
    request.set_workingdirectory(result["cwd"].as<string>());
    if (result.count("context")) {
      for (const auto& pair : result["context"].as<vector<string>>()) {
        auto equals = pair.find('=');
        if (equals == string::npos) {
          throw cxxopts::OptionException("Context must be KEY=VALUE: " +
                                         pair);
        }
        KeyValue* kv = request.add_context();
        kv->set_key(pair.substr(0, equals));
        kv->set_value(pair.substr(equals + 1));
      }
    }
    return printReply(client->call(SESSION_OPEN, request));
  }
  if (command == "write") {
    requireArgs(2);
    SessionWriteRequest request;
    request.set_sessionid(args[0]);
    string data = args[1];
    if (result.count("newline")) {
      data += "\n";
    }
    request.set_data(data);
    return printReply(client->call(SESSION_WRITE, request));
  }
  if (command == "resize") {
    requireArgs(3);
    SessionResizeRequest request;
    request.set_sessionid(args[0]);
    request.set_rows(stoi(args[1]));
    request.set_cols(stoi(args[2]));
    return printReply(client->call(SESSION_RESIZE, request));
  }
  if (command == "kill") {
    requireArgs(1);
    SessionKillRequest request;
    request.set_sessionid(args[0]);
    return printReply(client->call(SESSION_KILL, request));
  }
  if (command == "attach") {
    requireArgs(1);
    AttachRequest request;
    request.set_sourceid(args[0]);
    auto reply = client->call(ATTACH, request);
    if (!isOk(reply)) {
      return printReply(reply);
    }
    string sourceId = args[0];
    streamEvents(client, [sourceId](const Packet& packet) {
      return packet.getHeader() == EXIT_EVENT &&
             packet.getProto<ExitEvent>().sourceid() == sourceId;
    });
    return 0;
  }
  if (command == "watch") {
    streamEvents(client, [](const Packet&) { return false; });
    return 0;
  }
  throw cxxopts::OptionException("Unknown command: " + command);
}
}  // namespace

int main(int argc, char** argv) {
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger("default", defaultConf);
  LogHandler::setupStdoutLogger();

  hb::HandleTerminate();
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  cxxopts::Options options("harborctl", "Talks to a running harbord");
  options.positional_help("<command> [args...]");
  int exitCode = 0;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("socket", "Path of the command socket",
         cxxopts::value<string>()->default_value(
             HarborServer::getDefaultSocketPath()))  //
        ("cwd", "Working directory for start/open",
         cxxopts::value<string>()->default_value(
             fs::current_path().string()))                           //
        ("name", "Project name for start", cxxopts::value<string>())  //
        ("port", "Preferred port for start", cxxopts::value<int>())   //
        ("session", "Session id for open", cxxopts::value<string>())  //
        ("context", "KEY=VALUE added to the session environment",
         cxxopts::value<vector<string>>())                         //
        ("n,newline", "Append a newline to write data")           //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("command", "Command", cxxopts::value<string>())      //
        ("args", "Arguments", cxxopts::value<vector<string>>())  //
        ;
    options.parse_positional({"command", "args"});

    auto result = options.parse(argc, argv);

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "harborctl version " << HB_VERSION << endl;
      exit(0);
    }
    if (result.count("help") || !result.count("command")) {
      CLOG(INFO, "stdout") << options.help({}) << "\n" << USAGE << endl;
      exit(result.count("help") ? 0 : 1);
    }
    el::Loggers::setVerboseLevel(result["verbose"].as<int>());

    ::signal(SIGINT, onInterrupt);

    vector<string> args;
    if (result.count("args")) {
      args = result["args"].as<vector<string>>();
    }

    shared_ptr<SocketHandler> pipeSocketHandler(new PipeSocketHandler());
    HarborClient client(pipeSocketHandler, result["socket"].as<string>(), 1);
    exitCode = runCommand(&client, result["command"].as<string>(), args,
                          result);
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << "\n" << USAGE << endl;
    exit(1);
  } catch (const std::exception& e) {
    CLOG(ERROR, "stdout") << "harborctl: " << e.what() << endl;
    exit(1);
  }
  return exitCode;
}
