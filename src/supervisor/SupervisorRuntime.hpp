#ifndef __HB_SUPERVISOR_RUNTIME__
#define __HB_SUPERVISOR_RUNTIME__

#include "EventListener.hpp"
#include "EventLoop.hpp"
#include "HarborError.hpp"
#include "Headers.hpp"
#include "IOBroker.hpp"
#include "PortAllocator.hpp"
#include "ProcessSupervisor.hpp"
#include "ProcessTerminator.hpp"
#include "SessionManager.hpp"
#include "SupervisorConfig.hpp"

namespace hb {
/**
 * @brief Runs the supervision core on its own control thread.
 *
 * Every command is posted to the loop and completes through a future, so
 * it may be called from any thread. Code already running on the loop (the
 * command server, listeners) uses the components directly.
 */
class SupervisorRuntime {
 public:
  explicit SupervisorRuntime(const SupervisorConfig& _config);
  ~SupervisorRuntime();

  /** @brief Starts the control thread. */
  void start();

  /**
   * @brief Stops every server and session, waits for their exits, then
   * joins the control thread. Safe to call more than once.
   */
  void shutdown();

  bool isRunning() const { return running; }

  future<CommandReply> startServer(const StartServerRequest& request);
  future<CommandReply> stopServer(const string& ownerId);
  future<CommandReply> serverStatus(const string& ownerId);
  future<CommandReply> openSession(const SessionOpenRequest& request);
  future<CommandReply> writeSession(const string& sessionId,
                                    const string& data);
  future<CommandReply> resizeSession(const string& sessionId, int rows,
                                     int cols);
  future<CommandReply> killSession(const string& sessionId);
  future<CommandReply> listAll();

  /** @brief Runs `task` on the control thread and waits for it. */
  void runOnLoop(function<void()> task);

  /** @brief Listeners are called on the control thread. */
  void addListener(shared_ptr<EventListener> listener);
  void removeListener(shared_ptr<EventListener> listener);

  shared_ptr<EventLoop> getLoop() { return loop; }
  shared_ptr<PortAllocator> getPortAllocator() { return portAllocator; }
  shared_ptr<IOBroker> getBroker() { return broker; }
  shared_ptr<ProcessSupervisor> getSupervisor() { return supervisor; }
  shared_ptr<SessionManager> getSessions() { return sessions; }
  const SupervisorConfig& getConfig() const { return config; }

  /** @brief Builds a `list` reply; loop thread only. */
  CommandReply listReply() const;

 protected:
  typedef function<void(CommandCallback)> Command;

  SupervisorConfig config;
  shared_ptr<EventLoop> loop;
  shared_ptr<PortAllocator> portAllocator;
  shared_ptr<IOBroker> broker;
  shared_ptr<ProcessTerminator> terminator;
  shared_ptr<ProcessSupervisor> supervisor;
  shared_ptr<SessionManager> sessions;
  shared_ptr<EventFanout> listeners;

  shared_ptr<thread> loopThread;
  atomic<bool> running;
  bool shutdownDone;
  mutex lifecycleMutex;

  future<CommandReply> submit(Command command);
  /** @brief Drives everything down on the loop; loop thread only. */
  void stopEverything(function<void()> done);
};
}  // namespace hb

#endif  // __HB_SUPERVISOR_RUNTIME__
