#ifndef __HB_HARBOR_CLIENT__
#define __HB_HARBOR_CLIENT__

#include "Headers.hpp"
#include "Packet.hpp"
#include "SocketHandler.hpp"

namespace hb {
/**
 * @brief Blocking command-channel client.
 *
 * Events that arrive while a call waits for its reply are queued and handed
 * out by `nextEvent`, in arrival order.
 */
class HarborClient {
 public:
  /** @throws std::runtime_error if the daemon cannot be reached. */
  HarborClient(shared_ptr<SocketHandler> _socketHandler,
               const string& socketPath, int connectRetries = 5);
  ~HarborClient();

  /**
   * @brief Sends one request and waits for the reply with its request id.
   * @throws std::runtime_error on timeout or a broken connection.
   */
  template <typename T>
  CommandReply call(HarborPacketType type, T request,
                    int64_t timeoutMs = DEFAULT_TIMEOUT_MS) {
    string requestId = to_string(nextRequestId++);
    request.set_requestid(requestId);
    socketHandler->writePacket(fd, Packet::fromProto(type, request));
    return waitForReply(requestId, timeoutMs);
  }

  /**
   * @brief Pops the next pushed event.
   * @return false if nothing arrived within `timeoutMs`.
   */
  bool nextEvent(Packet* event, int64_t timeoutMs);

  int getFd() const { return fd; }

  static const int64_t DEFAULT_TIMEOUT_MS = 60 * 1000;

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int fd;
  int64_t nextRequestId;
  deque<Packet> events;

  CommandReply waitForReply(const string& requestId, int64_t timeoutMs);
  /** @return false if no packet started arriving before the deadline. */
  bool readUntil(Packet* packet, chrono::steady_clock::time_point deadline);
};
}  // namespace hb

#endif  // __HB_HARBOR_CLIENT__
