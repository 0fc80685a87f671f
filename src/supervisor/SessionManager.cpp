#include "SessionManager.hpp"

#include "ChildProcess.hpp"

namespace hb {
SessionSnapshot TerminalSession::snapshot() const {
  SessionSnapshot s;
  s.set_sessionid(sessionId);
  s.set_status(status);
  if (pid > 0) {
    s.set_pid(pid);
  }
  s.set_workingdirectory(workingDirectory);
  s.set_createdatms(createdAtMs);
  s.set_bytesin(bytesIn);
  s.set_bytesout(bytesOut);
  s.set_commandsexecuted(commandsExecuted);
  for (auto& it : context) {
    KeyValue* kv = s.add_context();
    kv->set_key(it.first);
    kv->set_value(it.second);
  }
  return s;
}

SessionManager::SessionManager(shared_ptr<EventLoop> _loop,
                               shared_ptr<IOBroker> _broker,
                               shared_ptr<ProcessTerminator> _terminator,
                               const SessionConfig& _config)
    : loop(_loop),
      broker(_broker),
      terminator(_terminator),
      config(_config),
      nextGeneration(0) {
  shell = config.resolveShell();
}

SessionManager::~SessionManager() {
  for (auto& it : sessions) {
    auto session = it.second;
    if (session->status != RUNNING && session->status != STOPPING) {
      continue;
    }
    LOG(WARNING) << "Session manager destroyed with " << it.first
                 << " still alive, killing pid " << session->pid;
    loop->unwatchChild(session->pid);
    if (::kill(-session->pid, SIGKILL) < 0) {
      LOG(WARNING) << "Could not kill " << session->pid << ": "
                   << strerror(GetErrno());
    }
    if (session->terminal && session->terminal->getFd() >= 0) {
      loop->removeReader(session->terminal->getFd());
      loop->removeWriter(session->terminal->getFd());
    }
  }
}

shared_ptr<TerminalSession> SessionManager::lookup(const string& sessionId,
                                                   int64_t generation) const {
  auto it = sessions.find(sessionId);
  if (it == sessions.end() || it->second->generation != generation) {
    return shared_ptr<TerminalSession>();
  }
  return it->second;
}

void SessionManager::open(const SessionOpenRequest& request,
                          CommandCallback done) {
  string sessionId = request.sessionid();
  if (sessionId.empty()) {
    sessionId = sole::uuid4().str();
  }
  auto it = sessions.find(sessionId);
  if (it != sessions.end()) {
    if (it->second->status != EXITED) {
      CommandReply reply =
          makeErrorReply(DUPLICATE_SESSION, "Session " + sessionId +
                                                " is already " +
                                                statusName(it->second->status));
      *reply.mutable_session() = it->second->snapshot();
      done(reply);
      return;
    }
    VLOG(1) << "Replacing exited session " << sessionId;
    broker->removeSource(sessionId);
    sessions.erase(it);
  }

  auto session = make_shared<TerminalSession>();
  session->sessionId = sessionId;
  session->workingDirectory = request.workingdirectory();
  for (const auto& kv : request.context()) {
    session->context[kv.key()] = kv.value();
  }
  session->generation = ++nextGeneration;
  int64_t generation = session->generation;

  map<string, string> env = session->context;
  env["HARBOR_SESSION_ID"] = sessionId;
  if (!session->workingDirectory.empty()) {
    env["HARBOR_PROJECT_PATH"] = session->workingDirectory;
  }

  session->terminal.reset(new PseudoTerminal());
  string error;
  if (!session->terminal->spawn(shell, session->workingDirectory, env,
                                config.rows, config.cols, &error)) {
    session->status = FAILED;
    emitProgress(*session, SPAWN_FAILURE, error);
    CommandReply reply = makeErrorReply(SPAWN_FAILURE, error);
    *reply.mutable_session() = session->snapshot();
    done(reply);
    return;
  }
  session->pid = session->terminal->getPid();
  session->createdAtMs = nowMs();
  session->status = RUNNING;
  sessions[sessionId] = session;
  LOG(INFO) << "Opened session " << sessionId << " (pid " << session->pid
            << ") in " << session->workingDirectory;

  broker->openSource(sessionId);
  broker->openInput(sessionId, [this, sessionId, generation](
                                   const string& data, bool complete) {
    onInput(sessionId, generation, data, complete);
  });
  loop->addReader(session->terminal->getFd(), [this, sessionId, generation]() {
    onTerminalReadable(sessionId, generation);
  });
  loop->watchChild(session->pid, [this, sessionId, generation](int waitStatus) {
    onChildExit(sessionId, generation, ExitStatus::fromWaitStatus(waitStatus));
  });

  emitProgress(*session);
  CommandReply reply = makeOkReply();
  *reply.mutable_session() = session->snapshot();
  done(reply);
}

CommandReply SessionManager::checkWritable(
    const string& sessionId, shared_ptr<TerminalSession>* session) const {
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return makeErrorReply(UNKNOWN_SESSION, "No session " + sessionId);
  }
  *session = it->second;
  switch (it->second->status) {
    case EXITED:
      return makeErrorReply(SESSION_CLOSED,
                            "Session " + sessionId + " has exited");
    case STOPPING:
      return makeErrorReply(WRITE_AFTER_CLOSE,
                            "Session " + sessionId + " is being killed");
    default:
      break;
  }
  return makeOkReply();
}

CommandReply SessionManager::write(const string& sessionId,
                                   const string& data) {
  shared_ptr<TerminalSession> session;
  CommandReply reply = checkWritable(sessionId, &session);
  if (!isOk(reply)) {
    return reply;
  }
  session->bytesIn += data.size();
  broker->write(sessionId, data);
  return reply;
}

CommandReply SessionManager::resize(const string& sessionId, int rows,
                                    int cols) {
  if (rows <= 0 || cols <= 0) {
    return makeErrorReply(INVALID_REQUEST, "Invalid terminal size " +
                                               to_string(rows) + "x" +
                                               to_string(cols));
  }
  shared_ptr<TerminalSession> session;
  CommandReply reply = checkWritable(sessionId, &session);
  if (reply.error() == WRITE_AFTER_CLOSE) {
    // Resizing a dying session is harmless; just skip it.
    return makeOkReply();
  }
  if (!isOk(reply)) {
    return reply;
  }
  VLOG(1) << "Resizing session " << sessionId << " to " << rows << "x" << cols;
  session->terminal->setSize(rows, cols);
  return reply;
}

void SessionManager::kill(const string& sessionId, CommandCallback done) {
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    CommandReply reply = makeOkReply();
    reply.mutable_session()->set_sessionid(sessionId);
    reply.mutable_session()->set_status(STOPPED);
    done(reply);
    return;
  }
  auto session = it->second;
  switch (session->status) {
    case RUNNING:
      break;
    case STOPPING:
      session->pendingKills.push_back(done);
      return;
    default: {
      broker->removeSource(sessionId);
      sessions.erase(it);
      CommandReply reply = makeOkReply();
      *reply.mutable_session() = session->snapshot();
      reply.mutable_session()->set_status(STOPPED);
      done(reply);
      return;
    }
  }

  LOG(INFO) << "Killing session " << sessionId << " (pid " << session->pid
            << ")";
  // Pending input still reaches the shell before it goes away.
  broker->closeInput(sessionId);
  session->status = STOPPING;
  session->pendingKills.push_back(done);
  emitProgress(*session);
  // Closing the master hangs up the terminal, which interactive shells
  // honor even when they ignore SIGTERM.
  detachTerminal(session);
  int64_t generation = session->generation;
  terminator->terminate(session->pid, config.grace,
                        [this, sessionId, generation](const ExitStatus& exit) {
                          onKilled(sessionId, generation, exit);
                        });
}

void SessionManager::killAll(function<void()> done) {
  vector<string> live;
  vector<string> tombstones;
  for (auto& it : sessions) {
    if (it.second->status == RUNNING || it.second->status == STOPPING) {
      live.push_back(it.first);
    } else {
      tombstones.push_back(it.first);
    }
  }
  for (const auto& sessionId : tombstones) {
    broker->removeSource(sessionId);
    sessions.erase(sessionId);
  }
  if (live.empty()) {
    done();
    return;
  }
  LOG(INFO) << "Killing " << live.size() << " session(s)";
  auto remaining = make_shared<int>(live.size());
  for (const auto& sessionId : live) {
    kill(sessionId, [remaining, done](const CommandReply& reply) {
      if (--(*remaining) == 0) {
        done();
      }
    });
  }
}

CommandReply SessionManager::status(const string& sessionId) const {
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return makeErrorReply(UNKNOWN_SESSION, "No session " + sessionId);
  }
  CommandReply reply = makeOkReply();
  *reply.mutable_session() = it->second->snapshot();
  return reply;
}

vector<SessionSnapshot> SessionManager::list() const {
  vector<SessionSnapshot> snapshots;
  for (auto& it : sessions) {
    snapshots.push_back(it.second->snapshot());
  }
  return snapshots;
}

int SessionManager::liveCount() const {
  int count = 0;
  for (auto& it : sessions) {
    if (it.second->status == RUNNING || it.second->status == STOPPING) {
      count++;
    }
  }
  return count;
}

void SessionManager::onTerminalReadable(const string& sessionId,
                                        int64_t generation) {
  auto session = lookup(sessionId, generation);
  if (!session || !session->terminal || session->terminal->getFd() < 0) {
    return;
  }
  int fd = session->terminal->getFd();
  string data;
  bool open = readAvailable(fd, &data);
  if (!data.empty()) {
    session->bytesOut += data.size();
    VLOG(4) << "Read " << data.size() << " bytes from session " << sessionId;
    broker->publish(sessionId, data);
  }
  if (!open) {
    // The reaper reports the exit itself.
    loop->removeReader(fd);
  }
}

void SessionManager::onTerminalWritable(const string& sessionId,
                                        int64_t generation) {
  auto session = lookup(sessionId, generation);
  if (!session) {
    return;
  }
  flushToTerminal(session);
}

void SessionManager::onInput(const string& sessionId, int64_t generation,
                             const string& data, bool complete) {
  auto session = lookup(sessionId, generation);
  if (!session || !session->terminal || session->terminal->getFd() < 0) {
    VLOG(1) << "Dropping input for closed session " << sessionId;
    return;
  }
  if (complete) {
    session->commandsExecuted++;
  }
  session->toTerminal.enqueue(data);
  flushToTerminal(session);
}

void SessionManager::flushToTerminal(shared_ptr<TerminalSession> session) {
  int fd = session->terminal ? session->terminal->getFd() : -1;
  if (fd < 0) {
    session->toTerminal.clear();
    return;
  }
  bool ok = session->toTerminal.flush(
      [fd](const char* data, size_t count) { return ::write(fd, data, count); });
  if (!ok) {
    LOG(WARNING) << "Write to session " << session->sessionId
                 << " failed: " << strerror(GetErrno());
    session->toTerminal.clear();
  }
  if (session->toTerminal.hasPendingData()) {
    if (!loop->hasWriter(fd)) {
      string sessionId = session->sessionId;
      int64_t generation = session->generation;
      loop->addWriter(fd, [this, sessionId, generation]() {
        onTerminalWritable(sessionId, generation);
      });
    }
  } else {
    loop->removeWriter(fd);
  }
}

void SessionManager::detachTerminal(shared_ptr<TerminalSession> session) {
  if (!session->terminal || session->terminal->getFd() < 0) {
    return;
  }
  int fd = session->terminal->getFd();
  loop->removeReader(fd);
  loop->removeWriter(fd);
  string data;
  readAvailable(fd, &data);
  if (!data.empty()) {
    session->bytesOut += data.size();
    broker->publish(session->sessionId, data);
  }
  session->toTerminal.clear();
  session->terminal->closeFd();
  broker->flush(session->sessionId);
}

void SessionManager::onChildExit(const string& sessionId, int64_t generation,
                                 const ExitStatus& exitStatus) {
  auto session = lookup(sessionId, generation);
  if (!session) {
    return;
  }
  session->exitStatus = exitStatus;
  session->status = EXITED;
  detachTerminal(session);
  broker->closeInput(sessionId);
  LOG(INFO) << "Session " << sessionId << " " << exitStatus.describe();
  emitProgress(*session, NO_ERROR, exitStatus.describe());
  emitExit(*session, "exited");
}

void SessionManager::onKilled(const string& sessionId, int64_t generation,
                              const ExitStatus& exitStatus) {
  auto session = lookup(sessionId, generation);
  if (!session) {
    return;
  }
  session->exitStatus = exitStatus;
  detachTerminal(session);
  session->status = STOPPED;
  emitProgress(*session);
  emitExit(*session, "killed");

  SessionSnapshot snapshot = session->snapshot();
  sessions.erase(sessionId);
  broker->removeSource(sessionId);
  for (auto& callback : session->pendingKills) {
    CommandReply reply = makeOkReply();
    *reply.mutable_session() = snapshot;
    callback(reply);
  }
  session->pendingKills.clear();
}

void SessionManager::emitProgress(const TerminalSession& session,
                                  ErrorCode error, const string& message) {
  if (!listener) {
    return;
  }
  listener->onProgress(makeProgressEvent(session.sessionId, TERMINAL_SESSION,
                                         session.status, error, message));
}

void SessionManager::emitExit(const TerminalSession& session,
                              const string& reason) {
  if (!listener) {
    return;
  }
  ExitEvent event;
  event.set_sourceid(session.sessionId);
  event.set_kind(TERMINAL_SESSION);
  event.set_exitcode(session.exitStatus.exitCode);
  event.set_signal(session.exitStatus.signal);
  event.set_reason(reason);
  listener->onExit(event);
}
}  // namespace hb
