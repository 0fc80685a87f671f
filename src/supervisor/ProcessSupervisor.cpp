#include "ProcessSupervisor.hpp"

namespace hb {
ServerSnapshot DevServerProcess::snapshot() const {
  ServerSnapshot s;
  s.set_ownerid(ownerId);
  s.set_status(status);
  if (pid > 0) {
    s.set_pid(pid);
  }
  if (port > 0) {
    s.set_port(port);
    s.set_url(url);
  }
  if (startedAtMs) {
    s.set_startedatms(startedAtMs);
  }
  if (lastErrorCode != NO_ERROR) {
    s.set_lasterrorcode(lastErrorCode);
    s.set_lasterror(lastError);
  }
  return s;
}

ProcessSupervisor::ProcessSupervisor(shared_ptr<EventLoop> _loop,
                                     shared_ptr<PortAllocator> _portAllocator,
                                     shared_ptr<IOBroker> _broker,
                                     shared_ptr<ProcessTerminator> _terminator,
                                     const DevServerConfig& _config)
    : loop(_loop),
      portAllocator(_portAllocator),
      broker(_broker),
      terminator(_terminator),
      healthMonitor(new HealthMonitor(_loop)),
      config(_config),
      nextGeneration(0) {}

ProcessSupervisor::~ProcessSupervisor() {
  for (auto& it : servers) {
    auto entry = it.second;
    if (entry->pid <= 0 || entry->status == FAILED) {
      continue;
    }
    LOG(WARNING) << "Supervisor destroyed with " << it.first
                 << " still alive, killing pid " << entry->pid;
    loop->unwatchChild(entry->pid);
    if (::kill(-entry->pid, SIGKILL) < 0) {
      LOG(WARNING) << "Could not kill " << entry->pid << ": "
                   << strerror(GetErrno());
    }
    if (entry->child) {
      loop->removeReader(entry->child->getStdoutFd());
      loop->removeReader(entry->child->getStderrFd());
    }
    releasePort(entry);
  }
}

shared_ptr<DevServerProcess> ProcessSupervisor::lookup(
    const string& ownerId, int64_t generation) const {
  auto it = servers.find(ownerId);
  if (it == servers.end() || it->second->generation != generation) {
    return shared_ptr<DevServerProcess>();
  }
  return it->second;
}

map<string, string> ProcessSupervisor::buildEnvironment(
    const DevServerProcess& entry) const {
  map<string, string> env;
  string port = to_string(entry.port);
  env["PORT"] = port;
  env["BROWSER"] = "none";
  env["CI"] = "false";
  env["HARBOR_PROJECT_ID"] = entry.ownerId;
  env["HARBOR_PROJECT_NAME"] = entry.projectName;
  env["HARBOR_PROJECT_PATH"] = entry.workingDirectory;
  env["HARBOR_PORT"] = port;
  return env;
}

void ProcessSupervisor::start(const StartServerRequest& request,
                              CommandCallback done) {
  const string& ownerId = request.ownerid();
  if (ownerId.empty()) {
    done(makeErrorReply(INVALID_REQUEST, "Missing owner id"));
    return;
  }
  auto it = servers.find(ownerId);
  if (it != servers.end()) {
    ProcessStatus current = it->second->status;
    if (current != STOPPED && current != FAILED) {
      CommandReply reply = makeErrorReply(
          ALREADY_RUNNING,
          "Dev server for " + ownerId + " is " + statusName(current));
      *reply.mutable_server() = it->second->snapshot();
      done(reply);
      return;
    }
    // Retrying after a failure starts from a clean slate.
    servers.erase(it);
  }

  auto entry = make_shared<DevServerProcess>();
  entry->ownerId = ownerId;
  entry->workingDirectory = request.workingdirectory();
  entry->projectName = request.projectname();
  if (entry->projectName.empty()) {
    entry->projectName = fs::path(entry->workingDirectory).filename().string();
  }
  entry->generation = ++nextGeneration;
  entry->pendingStart = done;
  servers[ownerId] = entry;
  int64_t generation = entry->generation;

  int preferred = request.preferredport();
  if (preferred <= 0) {
    auto last = lastPorts.find(ownerId);
    if (last != lastPorts.end()) {
      preferred = last->second;
    }
  }
  int port = portAllocator->allocate(request.portbase(), request.portend(),
                                     preferred);
  if (port < 0) {
    finishFailure(entry, PORT_EXHAUSTED, "No free port for " + ownerId, false);
    return;
  }
  entry->port = port;
  entry->url = "http://" + config.host + ":" + to_string(port);

  broker->openSource(ownerId);
  broker->clearTaps(ownerId);
  broker->addTap(ownerId, [this, ownerId, generation](const OutputEvent& e) {
    onOutputEvent(ownerId, generation, e);
  });

  entry->child.reset(new ChildProcess());
  string error;
  if (!entry->child->spawn(config.command, entry->workingDirectory,
                           buildEnvironment(*entry), &error)) {
    finishFailure(entry, SPAWN_FAILURE, error, false);
    return;
  }
  entry->pid = entry->child->getPid();
  entry->startedAtMs = nowMs();
  entry->status = STARTING;
  LOG(INFO) << "Starting dev server for " << ownerId << " on port " << port
            << " (pid " << entry->pid << ")";
  emitProgress(*entry);

  int stdoutFd = entry->child->getStdoutFd();
  int stderrFd = entry->child->getStderrFd();
  loop->addReader(stdoutFd, [this, ownerId, generation, stdoutFd]() {
    onOutputReadable(ownerId, generation, stdoutFd);
  });
  loop->addReader(stderrFd, [this, ownerId, generation, stderrFd]() {
    onOutputReadable(ownerId, generation, stderrFd);
  });
  loop->watchChild(entry->pid, [this, ownerId, generation](int waitStatus) {
    onChildExit(ownerId, generation, ExitStatus::fromWaitStatus(waitStatus));
  });
  healthMonitor->arm(
      ownerId, config.readinessPatterns, port, config.readinessTimeout,
      [this, ownerId, generation]() { onReady(ownerId, generation); },
      [this, ownerId, generation](ErrorCode code, const string& message) {
        onStartFailed(ownerId, generation, code, message);
      });
}

void ProcessSupervisor::stop(const string& ownerId, CommandCallback done) {
  auto it = servers.find(ownerId);
  if (it == servers.end()) {
    CommandReply reply = makeOkReply();
    reply.mutable_server()->set_ownerid(ownerId);
    reply.mutable_server()->set_status(STOPPED);
    reply.set_message("not running");
    done(reply);
    return;
  }
  auto entry = it->second;
  switch (entry->status) {
    case STOPPED:
    case FAILED:
    case EXITED: {
      servers.erase(it);
      broker->removeSource(ownerId);
      CommandReply reply = makeOkReply();
      *reply.mutable_server() = entry->snapshot();
      reply.mutable_server()->set_status(STOPPED);
      done(reply);
      return;
    }
    case STOPPING:
      entry->pendingStops.push_back(done);
      return;
    case STARTING:
      // The pending start resolves once the process is gone.
      healthMonitor->disarm(ownerId);
      entry->pendingStops.push_back(done);
      beginStop(entry);
      return;
    case RUNNING:
      entry->pendingStops.push_back(done);
      beginStop(entry);
      return;
  }
}

CommandReply ProcessSupervisor::status(const string& ownerId) const {
  CommandReply reply = makeOkReply();
  auto it = servers.find(ownerId);
  if (it == servers.end()) {
    reply.mutable_server()->set_ownerid(ownerId);
    reply.mutable_server()->set_status(STOPPED);
    reply.set_message("not running");
    return reply;
  }
  *reply.mutable_server() = it->second->snapshot();
  return reply;
}

vector<ServerSnapshot> ProcessSupervisor::list() const {
  vector<ServerSnapshot> snapshots;
  for (auto& it : servers) {
    snapshots.push_back(it.second->snapshot());
  }
  return snapshots;
}

int ProcessSupervisor::liveCount() const {
  int count = 0;
  for (auto& it : servers) {
    ProcessStatus s = it.second->status;
    if (s == STARTING || s == RUNNING || s == STOPPING) {
      count++;
    }
  }
  return count;
}

void ProcessSupervisor::stopAll(function<void()> done) {
  vector<string> owners;
  for (auto& it : servers) {
    ProcessStatus s = it.second->status;
    if (s == STARTING || s == RUNNING || s == STOPPING) {
      owners.push_back(it.first);
    }
  }
  if (owners.empty()) {
    done();
    return;
  }
  LOG(INFO) << "Stopping " << owners.size() << " dev server(s)";
  auto remaining = make_shared<int>(owners.size());
  for (const auto& ownerId : owners) {
    stop(ownerId, [remaining, done](const CommandReply& reply) {
      if (--(*remaining) == 0) {
        done();
      }
    });
  }
}

void ProcessSupervisor::onOutputReadable(const string& ownerId,
                                         int64_t generation, int fd) {
  auto entry = lookup(ownerId, generation);
  if (!entry || !entry->child) {
    loop->removeReader(fd);
    return;
  }
  string data;
  bool open = readAvailable(fd, &data);
  if (!data.empty()) {
    VLOG(4) << "Read " << data.size() << " bytes from " << ownerId;
    broker->publish(ownerId, data);
  }
  if (!open) {
    loop->removeReader(fd);
    if (fd == entry->child->getStdoutFd()) {
      entry->child->closeStdout();
    } else if (fd == entry->child->getStderrFd()) {
      entry->child->closeStderr();
    }
  }
}

void ProcessSupervisor::onOutputEvent(const string& ownerId,
                                      int64_t generation,
                                      const OutputEvent& event) {
  auto entry = lookup(ownerId, generation);
  if (!entry) {
    return;
  }
  if (!event.gap()) {
    entry->errorTail.append(event.payload());
    if (entry->errorTail.size() > config.errorTailBytes) {
      entry->errorTail.erase(0,
                             entry->errorTail.size() - config.errorTailBytes);
    }
  }
  healthMonitor->consume(event);
}

void ProcessSupervisor::onReady(const string& ownerId, int64_t generation) {
  auto entry = lookup(ownerId, generation);
  if (!entry || entry->status != STARTING) {
    return;
  }
  entry->status = RUNNING;
  LOG(INFO) << "Dev server for " << ownerId << " is ready at " << entry->url;
  emitProgress(*entry);
  CommandCallback callback = entry->pendingStart;
  entry->pendingStart = nullptr;
  if (callback) {
    CommandReply reply = makeOkReply();
    *reply.mutable_server() = entry->snapshot();
    callback(reply);
  }
}

void ProcessSupervisor::onStartFailed(const string& ownerId,
                                      int64_t generation, ErrorCode code,
                                      const string& message) {
  auto entry = lookup(ownerId, generation);
  if (!entry || entry->status != STARTING) {
    return;
  }
  if (code == UNEXPECTED_EXIT) {
    // Reached from onChildExit: the process is already reaped.
    finishFailure(entry, code, message, true);
    return;
  }
  LOG(WARNING) << "Dev server for " << ownerId << " failed to start: "
               << message;
  entry->status = STOPPING;
  emitProgress(*entry);
  terminator->terminate(
      entry->pid, config.grace,
      [this, ownerId, generation, code, message](const ExitStatus& exit) {
        auto entry = lookup(ownerId, generation);
        if (!entry) {
          return;
        }
        entry->exitStatus = exit;
        finishFailure(entry, code, message, true);
      });
}

void ProcessSupervisor::onChildExit(const string& ownerId, int64_t generation,
                                    const ExitStatus& exitStatus) {
  auto entry = lookup(ownerId, generation);
  if (!entry) {
    return;
  }
  entry->exitStatus = exitStatus;
  // Drain first: the last output may still hold the readiness marker.
  detachOutput(entry);
  if (entry->status == STARTING) {
    healthMonitor->processExited(ownerId, exitStatus.describe());
  } else if (entry->status == RUNNING) {
    LOG(WARNING) << "Dev server for " << ownerId
                 << " exited unexpectedly: " << exitStatus.describe();
    finishFailure(entry, UNEXPECTED_EXIT,
                  "Dev server " + exitStatus.describe(), true);
  }
}

void ProcessSupervisor::beginStop(shared_ptr<DevServerProcess> entry) {
  entry->status = STOPPING;
  LOG(INFO) << "Stopping dev server for " << entry->ownerId << " (pid "
            << entry->pid << ")";
  emitProgress(*entry);
  string ownerId = entry->ownerId;
  int64_t generation = entry->generation;
  terminator->terminate(entry->pid, config.grace,
                        [this, ownerId, generation](const ExitStatus& exit) {
                          onStopped(ownerId, generation, exit);
                        });
}

void ProcessSupervisor::onStopped(const string& ownerId, int64_t generation,
                                  const ExitStatus& exitStatus) {
  auto entry = lookup(ownerId, generation);
  if (!entry) {
    return;
  }
  entry->exitStatus = exitStatus;
  detachOutput(entry);
  broker->clearTaps(ownerId);
  releasePort(entry);
  entry->status = STOPPED;
  emitProgress(*entry);
  emitExit(*entry, "stopped");
  broker->removeSource(ownerId);

  ServerSnapshot snapshot = entry->snapshot();
  snapshot.clear_pid();
  servers.erase(ownerId);

  if (entry->pendingStart) {
    CommandReply reply = makeOkReply();
    *reply.mutable_server() = snapshot;
    reply.set_message("Stopped before ready");
    CommandCallback callback = entry->pendingStart;
    entry->pendingStart = nullptr;
    callback(reply);
  }
  for (auto& callback : entry->pendingStops) {
    CommandReply reply = makeOkReply();
    *reply.mutable_server() = snapshot;
    callback(reply);
  }
  entry->pendingStops.clear();
}

void ProcessSupervisor::detachOutput(shared_ptr<DevServerProcess> entry) {
  if (!entry->child) {
    return;
  }
  for (int fd : {entry->child->getStdoutFd(), entry->child->getStderrFd()}) {
    if (fd < 0) {
      continue;
    }
    loop->removeReader(fd);
    string data;
    readAvailable(fd, &data);
    if (!data.empty()) {
      broker->publish(entry->ownerId, data);
    }
  }
  entry->child->closeStdout();
  entry->child->closeStderr();
  broker->flush(entry->ownerId);
}

void ProcessSupervisor::releasePort(shared_ptr<DevServerProcess> entry) {
  if (entry->port <= 0) {
    return;
  }
  portAllocator->release(entry->port);
  lastPorts[entry->ownerId] = entry->port;
}

void ProcessSupervisor::finishFailure(shared_ptr<DevServerProcess> entry,
                                      ErrorCode code, const string& message,
                                      bool processStarted) {
  detachOutput(entry);
  healthMonitor->disarm(entry->ownerId);
  broker->clearTaps(entry->ownerId);
  releasePort(entry);

  entry->status = FAILED;
  entry->lastErrorCode = code;
  entry->lastError = message;
  if (!entry->errorTail.empty()) {
    entry->lastError += "\n" + entry->errorTail;
  }
  LOG(WARNING) << "Dev server for " << entry->ownerId << " failed ("
               << errorCodeName(code) << "): " << message;
  emitProgress(*entry, code, entry->lastError);
  if (processStarted) {
    emitExit(*entry, message);
    // Anything the command left running goes down with it.
    terminator->sweepGroup(entry->pid, config.grace);
  }
  // The tombstone keeps neither the reaped pid nor the released port.
  entry->pid = -1;
  entry->port = -1;
  entry->url.clear();

  if (entry->pendingStart) {
    CommandReply reply = makeErrorReply(code, entry->lastError);
    *reply.mutable_server() = entry->snapshot();
    CommandCallback callback = entry->pendingStart;
    entry->pendingStart = nullptr;
    callback(reply);
  }
  if (!entry->pendingStops.empty()) {
    // A stop raced the failure; it consumes the tombstone.
    ServerSnapshot snapshot = entry->snapshot();
    snapshot.set_status(STOPPED);
    auto it = servers.find(entry->ownerId);
    if (it != servers.end() && it->second == entry) {
      servers.erase(it);
      broker->removeSource(entry->ownerId);
    }
    vector<CommandCallback> stops;
    stops.swap(entry->pendingStops);
    for (auto& callback : stops) {
      CommandReply reply = makeOkReply();
      *reply.mutable_server() = snapshot;
      callback(reply);
    }
  }
}

void ProcessSupervisor::emitProgress(const DevServerProcess& entry,
                                     ErrorCode error, const string& message) {
  if (!listener) {
    return;
  }
  listener->onProgress(makeProgressEvent(entry.ownerId, DEV_SERVER,
                                         entry.status, error, message));
}

void ProcessSupervisor::emitExit(const DevServerProcess& entry,
                                 const string& reason) {
  if (!listener) {
    return;
  }
  ExitEvent event;
  event.set_sourceid(entry.ownerId);
  event.set_kind(DEV_SERVER);
  event.set_exitcode(entry.exitStatus.exitCode);
  event.set_signal(entry.exitStatus.signal);
  event.set_reason(reason);
  listener->onExit(event);
}
}  // namespace hb
