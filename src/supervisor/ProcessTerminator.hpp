#ifndef __HB_PROCESS_TERMINATOR__
#define __HB_PROCESS_TERMINATOR__

#include "EventLoop.hpp"
#include "Headers.hpp"

namespace hb {
/** @brief How a child process ended. */
struct ExitStatus {
  // Exit code when the process exited normally, otherwise -1.
  int exitCode = -1;
  // Terminating signal, or 0.
  int signal = 0;
  // False when the exit was never observed (fallback completion).
  bool observed = false;

  static ExitStatus fromWaitStatus(int waitStatus);

  string describe() const;
};

/**
 * @brief Graceful-then-forceful termination of a process group.
 *
 * `terminate` sends SIGTERM, escalates to SIGKILL after the grace period and
 * completes once the event loop reaps the child. If the exit is never
 * observed, a fallback timer at twice the grace period completes anyway so
 * that callers can always release what the process held. Once the leader is
 * reaped, whatever is left of its group is swept with `sweepGroup`.
 */
class ProcessTerminator {
 public:
  typedef function<void(const ExitStatus&)> DoneCallback;

  explicit ProcessTerminator(shared_ptr<EventLoop> _loop);
  ~ProcessTerminator();

  /**
   * @brief Terminates `pid` and its process group.
   *
   * Takes over the loop's child watch for `pid`. Calling it again for a pid
   * that is already being terminated only adds `done` to the waiters.
   */
  void terminate(pid_t pid, chrono::milliseconds grace, DoneCallback done);

  bool isTerminating(pid_t pid) const {
    return pending.find(pid) != pending.end();
  }

  /**
   * @brief Signals the members of a group whose leader is already reaped.
   *
   * SIGTERM now, SIGKILL after `grace` if any member is still there. Only the
   * group is signaled: the leader's pid may belong to someone else by now.
   */
  void sweepGroup(pid_t pgid, chrono::milliseconds grace);

  bool isSweeping(pid_t pgid) const {
    return sweeps.find(pgid) != sweeps.end();
  }

 protected:
  struct Pending {
    chrono::milliseconds grace;
    vector<DoneCallback> waiters;
    EventLoop::TimerId killTimer;
    EventLoop::TimerId fallbackTimer;
  };

  shared_ptr<EventLoop> loop;
  map<pid_t, Pending> pending;
  // Groups waiting for their SIGKILL, by group id.
  map<pid_t, EventLoop::TimerId> sweeps;

  void sendSignal(pid_t pid, int sig);
  bool signalGroup(pid_t pgid, int sig);
  void complete(pid_t pid, const ExitStatus& status);
};
}  // namespace hb

#endif  // __HB_PROCESS_TERMINATOR__
