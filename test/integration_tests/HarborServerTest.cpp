#include "HarborClient.hpp"
#include "HarborServer.hpp"
#include "PipeSocketHandler.hpp"
#include "SupervisorRuntime.hpp"
#include "TestHeaders.hpp"

namespace hb {
namespace {
const int64_t EVENT_TIMEOUT_MS = 10000;

class HarborServerFixture {
 public:
  HarborServerFixture() {
    directory = makeTempDirectory("harbor_server");
    socketPath = directory + "/harbor.ipc";
    SupervisorConfig config = makeTestConfig();
    config.devServer.command = "echo \"ready on $PORT\"; exec sleep 30";
    runtime.reset(new SupervisorRuntime(config));
    runtime->start();
    serverSocketHandler.reset(new PipeSocketHandler());
    server.reset(new HarborServer(serverSocketHandler, socketPath, runtime));
    server->start();
    clientSocketHandler.reset(new PipeSocketHandler());
  }

  ~HarborServerFixture() {
    server->stop();
    runtime->shutdown();
    fs::remove_all(directory);
  }

  shared_ptr<HarborClient> connect() {
    return shared_ptr<HarborClient>(
        new HarborClient(clientSocketHandler, socketPath));
  }

  string directory;
  string socketPath;
  shared_ptr<SupervisorRuntime> runtime;
  shared_ptr<PipeSocketHandler> serverSocketHandler;
  shared_ptr<PipeSocketHandler> clientSocketHandler;
  shared_ptr<HarborServer> server;
};

// Reads pushed events until one satisfies `matches`.
bool waitForEvent(shared_ptr<HarborClient> client,
                  function<bool(const Packet&)> matches) {
  auto deadline = chrono::steady_clock::now() +
                  chrono::milliseconds(EVENT_TIMEOUT_MS);
  Packet packet;
  while (chrono::steady_clock::now() < deadline) {
    if (!client->nextEvent(&packet, 100)) {
      continue;
    }
    if (matches(packet)) {
      return true;
    }
  }
  return false;
}

bool waitForOutput(shared_ptr<HarborClient> client, const string& sourceId,
                   const string& text, string* seen) {
  return waitForEvent(client, [&](const Packet& packet) {
    if (packet.getHeader() != OUTPUT_EVENT) {
      return false;
    }
    auto event = packet.getProto<OutputEvent>();
    if (event.sourceid() != sourceId) {
      return false;
    }
    *seen += event.payload();
    return seen->find(text) != string::npos;
  });
}

bool waitForExit(shared_ptr<HarborClient> client, const string& sourceId) {
  return waitForEvent(client, [&](const Packet& packet) {
    return packet.getHeader() == EXIT_EVENT &&
           packet.getProto<ExitEvent>().sourceid() == sourceId;
  });
}

SessionOpenRequest openRequest(const string& sessionId) {
  SessionOpenRequest request;
  request.set_sessionid(sessionId);
  return request;
}

SessionWriteRequest writeRequest(const string& sessionId, const string& data) {
  SessionWriteRequest request;
  request.set_sessionid(sessionId);
  request.set_data(data);
  return request;
}

AttachRequest attachRequest(const string& sourceId) {
  AttachRequest request;
  request.set_sourceid(sourceId);
  return request;
}
}  // namespace

TEST_CASE("HarborServer drives a dev server over the socket",
          "[HarborServer][integration]") {
  HarborServerFixture f;
  auto client = f.connect();

  StartServerRequest start;
  start.set_ownerid("web");
  start.set_projectname("Web");
  CommandReply started = client->call(START_SERVER, start);
  REQUIRE(isOk(started));
  REQUIRE(started.requestid() == "1");
  REQUIRE(started.server().status() == RUNNING);
  int port = started.server().port();
  REQUIRE(port > 47100);

  // Progress was pushed while the start was in flight.
  vector<ProcessStatus> statuses;
  REQUIRE(waitForEvent(client, [&statuses](const Packet& packet) {
    if (packet.getHeader() == PROGRESS_EVENT) {
      statuses.push_back(packet.getProto<ProgressEvent>().status());
    }
    return statuses.size() == 2;
  }));
  REQUIRE(statuses == vector<ProcessStatus>({STARTING, RUNNING}));

  GetStatusRequest status;
  status.set_ownerid("web");
  CommandReply current = client->call(GET_STATUS, status);
  REQUIRE(current.server().port() == port);

  CommandReply listed = client->call(LIST, ListRequest());
  REQUIRE(listed.servers_size() == 1);
  REQUIRE(listed.servers(0).ownerid() == "web");

  StopServerRequest stop;
  stop.set_ownerid("web");
  CommandReply stopped = client->call(STOP_SERVER, stop);
  REQUIRE(isOk(stopped));
  REQUIRE(stopped.server().status() == STOPPED);
  REQUIRE(waitForExit(client, "web"));
  REQUIRE(client->call(LIST, ListRequest()).servers_size() == 0);
}

TEST_CASE("HarborServer streams session output to attached clients",
          "[HarborServer][integration]") {
  HarborServerFixture f;
  auto client = f.connect();

  REQUIRE(isOk(client->call(SESSION_OPEN, openRequest("term"))));
  REQUIRE(isOk(client->call(ATTACH, attachRequest("term"))));
  REQUIRE(isOk(client->call(
      SESSION_WRITE, writeRequest("term", "echo out-$HARBOR_SESSION_ID\n"))));

  string seen;
  REQUIRE(waitForOutput(client, "term", "out-term", &seen));

  SessionResizeRequest resize;
  resize.set_sessionid("term");
  resize.set_rows(30);
  resize.set_cols(100);
  REQUIRE(isOk(client->call(SESSION_RESIZE, resize)));
  resize.set_rows(0);
  REQUIRE(client->call(SESSION_RESIZE, resize).error() == INVALID_REQUEST);

  SessionKillRequest kill;
  kill.set_sessionid("term");
  CommandReply killed = client->call(SESSION_KILL, kill);
  REQUIRE(isOk(killed));
  REQUIRE(killed.session().status() == STOPPED);
  REQUIRE(waitForExit(client, "term"));

  CommandReply late = client->call(SESSION_WRITE, writeRequest("term", "ls\n"));
  REQUIRE(late.error() == UNKNOWN_SESSION);
}

TEST_CASE("HarborServer rejects attaching to an unknown source",
          "[HarborServer][integration]") {
  HarborServerFixture f;
  auto client = f.connect();
  CommandReply reply = client->call(ATTACH, attachRequest("ghost"));
  REQUIRE(reply.error() == UNKNOWN_SESSION);
}

TEST_CASE("HarborServer sessions survive their client",
          "[HarborServer][integration]") {
  HarborServerFixture f;
  {
    auto first = f.connect();
    REQUIRE(isOk(first->call(SESSION_OPEN, openRequest("keep"))));
    REQUIRE(isOk(first->call(ATTACH, attachRequest("keep"))));
  }

  auto second = f.connect();
  CommandReply listed = second->call(LIST, ListRequest());
  REQUIRE(listed.sessions_size() == 1);
  REQUIRE(listed.sessions(0).sessionid() == "keep");
  REQUIRE(listed.sessions(0).status() == RUNNING);

  // Output produced with nobody attached is replayed on attach.
  REQUIRE(isOk(second->call(
      SESSION_WRITE, writeRequest("keep", "echo kept-$HARBOR_SESSION_ID\n"))));
  REQUIRE(isOk(second->call(ATTACH, attachRequest("keep"))));
  string seen;
  REQUIRE(waitForOutput(second, "keep", "kept-keep", &seen));
}

TEST_CASE("HarborServer drops only the client that sends garbage",
          "[HarborServer][integration]") {
  HarborServerFixture f;
  auto good = f.connect();
  auto bad = f.connect();
  REQUIRE(isOk(good->call(SESSION_OPEN, openRequest("safe"))));

  f.clientSocketHandler->writePacket(bad->getFd(), Packet(uint8_t(99), "junk"));
  REQUIRE_THROWS(bad->call(LIST, ListRequest(), 2000));

  CommandReply listed = good->call(LIST, ListRequest());
  REQUIRE(isOk(listed));
  REQUIRE(listed.sessions_size() == 1);
  REQUIRE(listed.sessions(0).status() == RUNNING);
}

TEST_CASE("SupervisorRuntime answers commands from other threads",
          "[SupervisorRuntime][integration]") {
  SupervisorConfig config = makeTestConfig();
  config.devServer.command = "echo \"ready on $PORT\"; exec sleep 30";
  SupervisorRuntime runtime(config);
  runtime.start();

  StartServerRequest start;
  start.set_ownerid("api");
  CommandReply started = runtime.startServer(start).get();
  REQUIRE(isOk(started));
  REQUIRE(isOk(runtime.openSession(openRequest("shell")).get()));
  REQUIRE(runtime.listAll().get().servers_size() == 1);
  REQUIRE(runtime.serverStatus("api").get().server().status() == RUNNING);
  pid_t serverPid = started.server().pid();

  // Shutdown takes everything down with it.
  runtime.shutdown();
  REQUIRE(::kill(serverPid, 0) != 0);
  REQUIRE(runtime.listAll().get().error() == INVALID_REQUEST);
}

TEST_CASE("SupervisorRuntime refuses commands overtaken by shutdown",
          "[SupervisorRuntime][integration]") {
  SupervisorConfig config = makeTestConfig();
  config.devServer.command = "echo \"ready on $PORT\"; exec sleep 30";
  SupervisorRuntime runtime(config);
  runtime.start();

  // Hold the control thread so the command stays queued.
  promise<void> release;
  shared_future<void> released = release.get_future().share();
  runtime.getLoop()->post([released]() { released.wait(); });

  StartServerRequest start;
  start.set_ownerid("late");
  future<CommandReply> late = runtime.startServer(start);

  thread stopper([&runtime]() { runtime.shutdown(); });
  while (runtime.isRunning()) {
    this_thread::sleep_for(chrono::milliseconds(1));
  }
  release.set_value();

  CommandReply reply = late.get();
  REQUIRE(reply.error() == INVALID_REQUEST);
  stopper.join();
  REQUIRE(runtime.getSupervisor()->list().empty());
}
}  // namespace hb
