#include "HarborServer.hpp"

namespace hb {
namespace {
const size_t READ_CHUNK = 64 * 1024;
// Control packets are never refused, but a client that lets this much pile
// up is not reading and gets disconnected.
const size_t SLOW_CLIENT_FACTOR = 4;
}  // namespace

bool HarborServer::ClientSink::deliver(const OutputEvent& event) {
  auto owner = server.lock();
  if (!owner) {
    return false;
  }
  return owner->deliverOutput(clientId, event);
}

HarborServer::HarborServer(shared_ptr<SocketHandler> _socketHandler,
                           const string& _socketPath,
                           shared_ptr<SupervisorRuntime> _runtime)
    : socketHandler(_socketHandler),
      socketPath(_socketPath),
      runtime(_runtime),
      listenFd(-1),
      nextClientId(1) {}

HarborServer::~HarborServer() {
  if (listenFd >= 0) {
    STERROR << "HarborServer destroyed while still listening on "
            << socketPath;
  }
}

string HarborServer::getDefaultSocketPath() {
  return GetTempDirectory() + "harbor." + to_string(::getuid()) + ".ipc";
}

void HarborServer::start() {
  if (listenFd >= 0) {
    return;
  }
  listenFd = socketHandler->listen(socketPath);
  weak_ptr<HarborServer> weakSelf = shared_from_this();
  runtime->runOnLoop([this, weakSelf]() {
    runtime->getLoop()->addReader(listenFd, [weakSelf]() {
      auto self = weakSelf.lock();
      if (self) {
        self->acceptClients();
      }
    });
  });
  runtime->addListener(shared_from_this());
  LOG(INFO) << "Command channel ready on " << socketPath;
}

void HarborServer::stop() {
  if (listenFd < 0) {
    return;
  }
  runtime->removeListener(shared_from_this());
  runtime->runOnLoop([this]() {
    vector<int64_t> ids;
    for (auto& it : clients) {
      ids.push_back(it.first);
    }
    for (int64_t id : ids) {
      closeClient(id, "server stopping");
    }
    runtime->getLoop()->removeReader(listenFd);
  });
  socketHandler->stopListening(socketPath);
  listenFd = -1;
  LOG(INFO) << "Command channel closed";
}

void HarborServer::acceptClients() {
  while (true) {
    int fd = socketHandler->accept(listenFd);
    if (fd < 0) {
      return;
    }
    auto client = make_shared<Client>();
    client->id = nextClientId++;
    client->fd = fd;
    client->sink.reset(new ClientSink(shared_from_this(), client->id));
    clients[client->id] = client;
    LOG(INFO) << "Client " << client->id << " connected on fd " << fd;

    int64_t clientId = client->id;
    weak_ptr<HarborServer> weakSelf = shared_from_this();
    runtime->getLoop()->addReader(fd, [weakSelf, clientId]() {
      auto self = weakSelf.lock();
      if (self) {
        self->onClientReadable(clientId);
      }
    });
  }
}

void HarborServer::onClientReadable(int64_t clientId) {
  auto client = findClient(clientId);
  if (!client) {
    return;
  }
  string chunk(READ_CHUNK, '\0');
  ssize_t rc = socketHandler->read(client->fd, &chunk[0], chunk.size());
  if (rc == 0) {
    closeClient(clientId, "disconnected");
    return;
  }
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return;
    }
    closeClient(clientId, string("read failed: ") + strerror(localErrno));
    return;
  }
  client->framer.append(chunk.data(), rc);

  try {
    Packet packet;
    while (client->framer.next(&packet)) {
      handlePacket(client, packet);
      if (!findClient(clientId)) {
        return;
      }
    }
  } catch (const std::runtime_error& re) {
    STERROR << "Dropping client " << clientId << ": " << re.what();
    closeClient(clientId, re.what());
  }
}

void HarborServer::handlePacket(shared_ptr<Client> client,
                                const Packet& packet) {
  VLOG(2) << "Client " << client->id
          << " sent packet type " << int(packet.getHeader());
  auto supervisor = runtime->getSupervisor();
  auto sessions = runtime->getSessions();
  auto broker = runtime->getBroker();

  switch (packet.getHeader()) {
    case START_SERVER: {
      auto request = packet.getProto<StartServerRequest>();
      supervisor->start(request, replyTo(client->id, request.requestid()));
      break;
    }
    case STOP_SERVER: {
      auto request = packet.getProto<StopServerRequest>();
      supervisor->stop(request.ownerid(),
                       replyTo(client->id, request.requestid()));
      break;
    }
    case GET_STATUS: {
      auto request = packet.getProto<GetStatusRequest>();
      replyTo(client->id, request.requestid())(
          supervisor->status(request.ownerid()));
      break;
    }
    case SESSION_OPEN: {
      auto request = packet.getProto<SessionOpenRequest>();
      sessions->open(request, replyTo(client->id, request.requestid()));
      break;
    }
    case SESSION_WRITE: {
      auto request = packet.getProto<SessionWriteRequest>();
      replyTo(client->id, request.requestid())(
          sessions->write(request.sessionid(), request.data()));
      break;
    }
    case SESSION_RESIZE: {
      auto request = packet.getProto<SessionResizeRequest>();
      replyTo(client->id, request.requestid())(sessions->resize(
          request.sessionid(), request.rows(), request.cols()));
      break;
    }
    case SESSION_KILL: {
      auto request = packet.getProto<SessionKillRequest>();
      sessions->kill(request.sessionid(),
                     replyTo(client->id, request.requestid()));
      break;
    }
    case ATTACH: {
      auto request = packet.getProto<AttachRequest>();
      auto reply = replyTo(client->id, request.requestid());
      if (!broker->hasSource(request.sourceid())) {
        reply(makeErrorReply(UNKNOWN_SESSION,
                             "No output source " + request.sourceid()));
        break;
      }
      // The reply goes out ahead of the replayed backlog.
      reply(makeOkReply());
      client->attached.insert(request.sourceid());
      broker->attach(request.sourceid(), client->sink);
      break;
    }
    case DETACH: {
      auto request = packet.getProto<AttachRequest>();
      broker->detach(request.sourceid(), client->sink.get());
      client->attached.erase(request.sourceid());
      replyTo(client->id, request.requestid())(makeOkReply());
      break;
    }
    case LIST: {
      auto request = packet.getProto<ListRequest>();
      replyTo(client->id, request.requestid())(runtime->listReply());
      break;
    }
    default: {
      throw std::runtime_error("Unknown packet header: " +
                               to_string(int(packet.getHeader())));
    }
  }
}

CommandCallback HarborServer::replyTo(int64_t clientId,
                                      const string& requestId) {
  weak_ptr<HarborServer> weakSelf = shared_from_this();
  return [weakSelf, clientId, requestId](const CommandReply& reply) {
    auto self = weakSelf.lock();
    if (!self) {
      return;
    }
    auto client = self->findClient(clientId);
    if (!client) {
      VLOG(1) << "Reply for " << requestId << " has no client anymore";
      return;
    }
    CommandReply withId = reply;
    withId.set_requestid(requestId);
    self->sendPacket(client, Packet::fromProto(COMMAND_REPLY, withId));
  };
}

void HarborServer::onProgress(const ProgressEvent& event) {
  Packet packet = Packet::fromProto(PROGRESS_EVENT, event);
  for (auto& it : clients) {
    sendPacket(it.second, packet);
  }
}

void HarborServer::onExit(const ExitEvent& event) {
  Packet packet = Packet::fromProto(EXIT_EVENT, event);
  for (auto& it : clients) {
    sendPacket(it.second, packet);
  }
}

bool HarborServer::deliverOutput(int64_t clientId, const OutputEvent& event) {
  auto client = findClient(clientId);
  if (!client) {
    return false;
  }
  if (!client->outgoing.canAcceptMore()) {
    // The broker keeps the event and offers it again on resume().
    return false;
  }
  client->outgoing.enqueue(
      SocketHandler::encodePacket(Packet::fromProto(OUTPUT_EVENT, event)));
  scheduleFlush(client);
  return true;
}

void HarborServer::sendPacket(shared_ptr<Client> client,
                              const Packet& packet) {
  client->outgoing.enqueue(SocketHandler::encodePacket(packet));
  if (client->outgoing.size() >
      client->outgoing.capacity() * SLOW_CLIENT_FACTOR) {
    closeClientLater(client->id, "client is not reading");
    return;
  }
  scheduleFlush(client);
}

void HarborServer::scheduleFlush(shared_ptr<Client> client) {
  auto loop = runtime->getLoop();
  if (loop->hasWriter(client->fd)) {
    return;
  }
  // Writes happen from the loop, never from inside a broker callback.
  int64_t clientId = client->id;
  weak_ptr<HarborServer> weakSelf = shared_from_this();
  loop->addWriter(client->fd, [weakSelf, clientId]() {
    auto self = weakSelf.lock();
    if (self) {
      self->onClientWritable(clientId);
    }
  });
}

void HarborServer::onClientWritable(int64_t clientId) {
  auto client = findClient(clientId);
  if (!client) {
    return;
  }
  int fd = client->fd;
  bool ok = client->outgoing.flush([this, fd](const char* data, size_t count) {
    return socketHandler->write(fd, data, count);
  });
  if (!ok) {
    auto localErrno = GetErrno();
    closeClient(clientId, string("write failed: ") + strerror(localErrno));
    return;
  }
  if (!client->outgoing.hasPendingData()) {
    runtime->getLoop()->removeWriter(fd);
  }
  if (client->outgoing.canAcceptMore()) {
    runtime->getBroker()->resume(client->sink.get());
  }
}

void HarborServer::closeClientLater(int64_t clientId, const string& reason) {
  weak_ptr<HarborServer> weakSelf = shared_from_this();
  runtime->getLoop()->post([weakSelf, clientId, reason]() {
    auto self = weakSelf.lock();
    if (self) {
      self->closeClient(clientId, reason);
    }
  });
}

void HarborServer::closeClient(int64_t clientId, const string& reason) {
  auto it = clients.find(clientId);
  if (it == clients.end()) {
    return;
  }
  auto client = it->second;
  clients.erase(it);
  LOG(INFO) << "Closing client " << clientId << ": " << reason;

  // Servers and sessions the client started keep running.
  runtime->getBroker()->detachAll(client->sink.get());
  auto loop = runtime->getLoop();
  loop->removeReader(client->fd);
  loop->removeWriter(client->fd);
  socketHandler->close(client->fd);
}

shared_ptr<HarborServer::Client> HarborServer::findClient(
    int64_t clientId) const {
  auto it = clients.find(clientId);
  if (it == clients.end()) {
    return shared_ptr<Client>();
  }
  return it->second;
}
}  // namespace hb
