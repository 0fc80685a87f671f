#ifndef __HB_PIPE_SOCKET_HANDLER__
#define __HB_PIPE_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace hb {
/**
 * @brief SocketHandler over UNIX domain stream sockets addressed by path.
 *
 * All descriptors are non-blocking; the daemon drives them from the event
 * loop and clients block through `readAll`/`writeAllOrThrow`.
 */
class PipeSocketHandler : public SocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler();

  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);

  virtual int connect(const string& path);
  virtual int listen(const string& path);
  virtual int accept(int fd);
  virtual void stopListening(const string& path);
  virtual void close(int fd);

 protected:
  void initSocket(int fd);

  /** @brief Listening descriptors keyed by socket path. */
  map<string, int> pipeServerSockets;
  /** @brief Connected descriptors this handler is responsible for. */
  set<int> activeSockets;
  recursive_mutex globalMutex;
};
}  // namespace hb

#endif  // __HB_PIPE_SOCKET_HANDLER__
