#include "SupervisorRuntime.hpp"

namespace hb {
SupervisorRuntime::SupervisorRuntime(const SupervisorConfig& _config)
    : config(_config),
      loop(new EventLoop()),
      portAllocator(new PortAllocator(config.ports)),
      broker(new IOBroker(loop, config.broker)),
      terminator(new ProcessTerminator(loop)),
      supervisor(new ProcessSupervisor(loop, portAllocator, broker, terminator,
                                       config.devServer)),
      sessions(new SessionManager(loop, broker, terminator, config.session)),
      listeners(new EventFanout()),
      running(false),
      shutdownDone(false) {
  supervisor->setListener(listeners);
  sessions->setListener(listeners);
}

SupervisorRuntime::~SupervisorRuntime() { shutdown(); }

void SupervisorRuntime::start() {
  lock_guard<mutex> guard(lifecycleMutex);
  if (running || shutdownDone) {
    return;
  }
  running = true;
  loopThread.reset(new thread([this]() {
    el::Helpers::setThreadName("harbor-loop");
    LOG(INFO) << "Control thread started";
    loop->run();
    LOG(INFO) << "Control thread stopped";
  }));
}

void SupervisorRuntime::shutdown() {
  lock_guard<mutex> guard(lifecycleMutex);
  if (shutdownDone) {
    return;
  }
  shutdownDone = true;
  if (!running) {
    return;
  }
  if (loopThread->get_id() == this_thread::get_id()) {
    STERROR << "shutdown() called from the control thread";
    return;
  }

  LOG(INFO) << "Shutting down supervision";
  // New commands are refused from here on.
  running = false;
  auto stopped = make_shared<promise<void>>();
  future<void> stoppedFuture = stopped->get_future();
  loop->post([this, stopped]() {
    stopEverything([stopped]() { stopped->set_value(); });
  });
  // Bounded by the grace periods and the terminator's fallback timers.
  stoppedFuture.wait();

  loop->stop();
  loopThread->join();
  loopThread.reset();
  LOG(INFO) << "Supervision shut down";
}

void SupervisorRuntime::stopEverything(function<void()> done) {
  auto remaining = make_shared<int>(2);
  auto oneDone = [remaining, done]() {
    if (--(*remaining) == 0) {
      done();
    }
  };
  supervisor->stopAll(oneDone);
  sessions->killAll(oneDone);
}

future<CommandReply> SupervisorRuntime::submit(Command command) {
  auto result = make_shared<promise<CommandReply>>();
  future<CommandReply> resultFuture = result->get_future();
  if (!running) {
    result->set_value(
        makeErrorReply(INVALID_REQUEST, "Supervisor is not running"));
    return resultFuture;
  }
  loop->post([this, command, result]() {
    // Shutdown may have begun between the check above and now.
    if (!running) {
      result->set_value(
          makeErrorReply(INVALID_REQUEST, "Supervisor is shutting down"));
      return;
    }
    command([result](const CommandReply& reply) { result->set_value(reply); });
  });
  return resultFuture;
}

future<CommandReply> SupervisorRuntime::startServer(
    const StartServerRequest& request) {
  return submit([this, request](CommandCallback done) {
    supervisor->start(request, done);
  });
}

future<CommandReply> SupervisorRuntime::stopServer(const string& ownerId) {
  return submit(
      [this, ownerId](CommandCallback done) { supervisor->stop(ownerId, done); });
}

future<CommandReply> SupervisorRuntime::serverStatus(const string& ownerId) {
  return submit([this, ownerId](CommandCallback done) {
    done(supervisor->status(ownerId));
  });
}

future<CommandReply> SupervisorRuntime::openSession(
    const SessionOpenRequest& request) {
  return submit([this, request](CommandCallback done) {
    sessions->open(request, done);
  });
}

future<CommandReply> SupervisorRuntime::writeSession(const string& sessionId,
                                                     const string& data) {
  return submit([this, sessionId, data](CommandCallback done) {
    done(sessions->write(sessionId, data));
  });
}

future<CommandReply> SupervisorRuntime::resizeSession(const string& sessionId,
                                                      int rows, int cols) {
  return submit([this, sessionId, rows, cols](CommandCallback done) {
    done(sessions->resize(sessionId, rows, cols));
  });
}

future<CommandReply> SupervisorRuntime::killSession(const string& sessionId) {
  return submit([this, sessionId](CommandCallback done) {
    sessions->kill(sessionId, done);
  });
}

future<CommandReply> SupervisorRuntime::listAll() {
  return submit([this](CommandCallback done) { done(listReply()); });
}

CommandReply SupervisorRuntime::listReply() const {
  CommandReply reply = makeOkReply();
  for (const auto& server : supervisor->list()) {
    *reply.add_servers() = server;
  }
  for (const auto& session : sessions->list()) {
    *reply.add_sessions() = session;
  }
  return reply;
}

void SupervisorRuntime::runOnLoop(function<void()> task) {
  if (!loopThread || loopThread->get_id() == this_thread::get_id()) {
    task();
    return;
  }
  auto finished = make_shared<promise<void>>();
  future<void> finishedFuture = finished->get_future();
  loop->post([task, finished]() {
    task();
    finished->set_value();
  });
  finishedFuture.wait();
}

void SupervisorRuntime::addListener(shared_ptr<EventListener> listener) {
  runOnLoop([this, listener]() { listeners->add(listener); });
}

void SupervisorRuntime::removeListener(shared_ptr<EventListener> listener) {
  runOnLoop([this, listener]() { listeners->remove(listener); });
}
}  // namespace hb
