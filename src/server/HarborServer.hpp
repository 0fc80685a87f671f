#ifndef __HB_HARBOR_SERVER__
#define __HB_HARBOR_SERVER__

#include "EventListener.hpp"
#include "Headers.hpp"
#include "IOBroker.hpp"
#include "Packet.hpp"
#include "PacketFramer.hpp"
#include "SocketHandler.hpp"
#include "SupervisorRuntime.hpp"
#include "WriteBuffer.hpp"

namespace hb {
/**
 * @brief Serves the command channel on a UNIX domain socket.
 *
 * Runs entirely on the runtime's control thread. Every request gets exactly
 * one COMMAND_REPLY carrying its request id. Progress and exit events go to
 * every client; output goes to the clients attached to the source. A
 * misbehaving client is disconnected without affecting anything it started.
 */
class HarborServer : public EventListener,
                     public enable_shared_from_this<HarborServer> {
 public:
  HarborServer(shared_ptr<SocketHandler> _socketHandler,
               const string& _socketPath,
               shared_ptr<SupervisorRuntime> _runtime);
  virtual ~HarborServer();

  /**
   * @brief Starts listening and registers with the runtime.
   * @throws std::runtime_error if the socket cannot be bound.
   */
  void start();

  /** @brief Disconnects every client and stops listening. */
  void stop();

  /** @brief `<tmpdir>/harbor.<uid>.ipc` */
  static string getDefaultSocketPath();

  int clientCount() const { return int(clients.size()); }

  virtual void onProgress(const ProgressEvent& event);
  virtual void onExit(const ExitEvent& event);

 protected:
  /** @brief Pushes attached output into one client's write buffer. */
  class ClientSink : public OutputSink {
   public:
    ClientSink(weak_ptr<HarborServer> _server, int64_t _clientId)
        : server(_server), clientId(_clientId) {}

    virtual bool deliver(const OutputEvent& event);

   protected:
    weak_ptr<HarborServer> server;
    int64_t clientId;
  };

  struct Client {
    int64_t id;
    int fd;
    PacketFramer framer;
    WriteBuffer outgoing;
    shared_ptr<ClientSink> sink;
    set<string> attached;
  };

  shared_ptr<SocketHandler> socketHandler;
  string socketPath;
  shared_ptr<SupervisorRuntime> runtime;
  int listenFd;
  int64_t nextClientId;
  map<int64_t, shared_ptr<Client>> clients;

  void acceptClients();
  void onClientReadable(int64_t clientId);
  void onClientWritable(int64_t clientId);
  void handlePacket(shared_ptr<Client> client, const Packet& packet);
  CommandCallback replyTo(int64_t clientId, const string& requestId);

  bool deliverOutput(int64_t clientId, const OutputEvent& event);
  /** @brief Queues a control packet; these are never refused. */
  void sendPacket(shared_ptr<Client> client, const Packet& packet);
  void scheduleFlush(shared_ptr<Client> client);
  void closeClient(int64_t clientId, const string& reason);
  void closeClientLater(int64_t clientId, const string& reason);
  shared_ptr<Client> findClient(int64_t clientId) const;
};
}  // namespace hb

#endif  // __HB_HARBOR_SERVER__
