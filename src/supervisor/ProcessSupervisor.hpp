#ifndef __HB_PROCESS_SUPERVISOR__
#define __HB_PROCESS_SUPERVISOR__

#include "ChildProcess.hpp"
#include "EventListener.hpp"
#include "EventLoop.hpp"
#include "HarborError.hpp"
#include "HealthMonitor.hpp"
#include "Headers.hpp"
#include "IOBroker.hpp"
#include "PortAllocator.hpp"
#include "ProcessTerminator.hpp"
#include "SupervisorConfig.hpp"

namespace hb {
/** @brief One supervised dev server, keyed by its owner (project) id. */
struct DevServerProcess {
  string ownerId;
  string workingDirectory;
  string projectName;
  ProcessStatus status = STOPPED;
  pid_t pid = -1;
  int port = -1;
  string url;
  int64_t startedAtMs = 0;
  ErrorCode lastErrorCode = NO_ERROR;
  string lastError;

  // Distinguishes callbacks of an earlier run of the same owner.
  int64_t generation = 0;
  shared_ptr<ChildProcess> child;
  // Last bytes of output, surfaced when the start fails.
  string errorTail;
  ExitStatus exitStatus;
  CommandCallback pendingStart;
  vector<CommandCallback> pendingStops;

  ServerSnapshot snapshot() const;
};

/**
 * @brief Owns the lifecycle of at most one dev server per owner.
 *
 * STOPPED -> STARTING -> RUNNING -> STOPPING -> STOPPED, with FAILED
 * reachable from STARTING and RUNNING. A FAILED entry stays behind as a
 * status tombstone (process reaped, port released) until the next start or
 * stop for the owner. Its buffered output stays in the broker with it; a
 * clean stop or clearing the tombstone drops the buffer.
 *
 * Loop-thread only. `start` completes on readiness or failure, `stop` on
 * confirmed exit.
 */
class ProcessSupervisor {
 public:
  ProcessSupervisor(shared_ptr<EventLoop> _loop,
                    shared_ptr<PortAllocator> _portAllocator,
                    shared_ptr<IOBroker> _broker,
                    shared_ptr<ProcessTerminator> _terminator,
                    const DevServerConfig& _config);
  ~ProcessSupervisor();

  void setListener(shared_ptr<EventListener> _listener) {
    listener = _listener;
  }

  void start(const StartServerRequest& request, CommandCallback done);

  /** @brief Stops the owner's server. Succeeds if nothing is running. */
  void stop(const string& ownerId, CommandCallback done);

  CommandReply status(const string& ownerId) const;

  vector<ServerSnapshot> list() const;

  /** @brief Stops every live server; `done` runs once all exits are seen. */
  void stopAll(function<void()> done);

  int liveCount() const;

 protected:
  shared_ptr<EventLoop> loop;
  shared_ptr<PortAllocator> portAllocator;
  shared_ptr<IOBroker> broker;
  shared_ptr<ProcessTerminator> terminator;
  shared_ptr<HealthMonitor> healthMonitor;
  shared_ptr<EventListener> listener;
  DevServerConfig config;

  map<string, shared_ptr<DevServerProcess>> servers;
  // Port each owner used last, preferred on restart.
  map<string, int> lastPorts;
  int64_t nextGeneration;

  shared_ptr<DevServerProcess> lookup(const string& ownerId,
                                      int64_t generation) const;
  map<string, string> buildEnvironment(const DevServerProcess& entry) const;

  void onOutputReadable(const string& ownerId, int64_t generation, int fd);
  void onOutputEvent(const string& ownerId, int64_t generation,
                     const OutputEvent& event);
  void onReady(const string& ownerId, int64_t generation);
  void onStartFailed(const string& ownerId, int64_t generation,
                     ErrorCode code, const string& message);
  void onChildExit(const string& ownerId, int64_t generation,
                   const ExitStatus& exitStatus);
  void onStopped(const string& ownerId, int64_t generation,
                 const ExitStatus& exitStatus);

  void beginStop(shared_ptr<DevServerProcess> entry);
  void detachOutput(shared_ptr<DevServerProcess> entry);
  void releasePort(shared_ptr<DevServerProcess> entry);
  void finishFailure(shared_ptr<DevServerProcess> entry, ErrorCode code,
                     const string& message, bool processStarted);
  void emitProgress(const DevServerProcess& entry, ErrorCode error = NO_ERROR,
                    const string& message = "");
  void emitExit(const DevServerProcess& entry, const string& reason);
};
}  // namespace hb

#endif  // __HB_PROCESS_SUPERVISOR__
