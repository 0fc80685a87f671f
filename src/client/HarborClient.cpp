#include "HarborClient.hpp"

namespace hb {
namespace {
// Once a packet has started arriving the rest must follow promptly.
const int64_t PACKET_BODY_TIMEOUT_MS = 5000;
}  // namespace

HarborClient::HarborClient(shared_ptr<SocketHandler> _socketHandler,
                           const string& socketPath, int connectRetries)
    : socketHandler(_socketHandler), fd(-1), nextRequestId(1) {
  for (int retry = 0; retry < connectRetries; retry++) {
    fd = socketHandler->connect(socketPath);
    if (fd >= 0) {
      return;
    }
    sleep(1);
  }
  throw std::runtime_error("Connect to harbord failed: " + socketPath);
}

HarborClient::~HarborClient() {
  if (fd >= 0) {
    socketHandler->close(fd);
  }
}

bool HarborClient::nextEvent(Packet* event, int64_t timeoutMs) {
  if (!events.empty()) {
    *event = events.front();
    events.pop_front();
    return true;
  }
  auto deadline =
      chrono::steady_clock::now() + chrono::milliseconds(timeoutMs);
  Packet packet;
  while (readUntil(&packet, deadline)) {
    if (packet.getHeader() == COMMAND_REPLY) {
      VLOG(1) << "Dropping reply with no pending call";
      continue;
    }
    *event = packet;
    return true;
  }
  return false;
}

CommandReply HarborClient::waitForReply(const string& requestId,
                                        int64_t timeoutMs) {
  auto deadline =
      chrono::steady_clock::now() + chrono::milliseconds(timeoutMs);
  Packet packet;
  while (readUntil(&packet, deadline)) {
    if (packet.getHeader() != COMMAND_REPLY) {
      events.push_back(packet);
      continue;
    }
    auto reply = packet.getProto<CommandReply>();
    if (reply.requestid() == requestId) {
      return reply;
    }
    VLOG(1) << "Ignoring reply for request " << reply.requestid();
  }
  throw std::runtime_error("Timed out waiting for reply to request " +
                           requestId);
}

bool HarborClient::readUntil(Packet* packet,
                             chrono::steady_clock::time_point deadline) {
  while (true) {
    while (!socketHandler->hasData(fd)) {
      if (chrono::steady_clock::now() >= deadline) {
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (socketHandler->readPacket(fd, packet, PACKET_BODY_TIMEOUT_MS)) {
      return true;
    }
  }
}
}  // namespace hb
