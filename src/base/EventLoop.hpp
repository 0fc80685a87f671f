#ifndef __HB_EVENT_LOOP__
#define __HB_EVENT_LOOP__

#include "Headers.hpp"

namespace hb {
/**
 * @brief The single control thread: a select() loop over descriptors, timers,
 * posted callbacks and child-process exits.
 *
 * Every method except `post()`, `wakeup()` and `stop()` must be called on the
 * thread that drives the loop. Callbacks always run on that thread, one at a
 * time, so state owned by loop clients needs no locking.
 */
class EventLoop {
 public:
  typedef function<void()> Callback;
  /** @brief Receives the raw `waitpid` status, or -1 if it was lost. */
  typedef function<void(int waitStatus)> ChildCallback;
  typedef int64_t TimerId;
  typedef chrono::steady_clock Clock;

  EventLoop();
  ~EventLoop();

  void addReader(int fd, Callback callback);
  void removeReader(int fd);
  void addWriter(int fd, Callback callback);
  void removeWriter(int fd);
  bool hasWriter(int fd) const { return writers.find(fd) != writers.end(); }

  TimerId schedule(chrono::milliseconds delay, Callback callback);
  void cancel(TimerId id);

  /** @brief Queues a callback from any thread and wakes the loop. */
  void post(Callback callback);

  /** @brief Reaps `pid` with WNOHANG on every iteration until it exits. */
  void watchChild(pid_t pid, ChildCallback callback);
  void unwatchChild(pid_t pid);
  bool isWatchingChild(pid_t pid) const {
    return children.find(pid) != children.end();
  }

  /** @brief Runs at most one select() pass plus due timers and posts. */
  void runOnce(chrono::milliseconds maxWait);
  /** @brief Runs until `stop()` is called. */
  void run();
  /**
   * @brief Runs until `predicate` is true or `timeout` elapses.
   * @return the final value of `predicate`.
   */
  bool runUntil(const function<bool()>& predicate,
                chrono::milliseconds timeout);
  /** @brief Thread-safe; `run()` returns after the current pass. */
  void stop();
  bool isStopped() const { return stopped; }

  /** @brief Async-signal-safe wake-up of a blocked select(). */
  void wakeup();

  bool isLoopThread() const;
  Clock::time_point now() const { return Clock::now(); }

 protected:
  /** @brief Upper bound on a select() wait while children are watched. */
  static const int CHILD_POLL_MS = 10;

  map<int, Callback> readers;
  map<int, Callback> writers;
  map<pid_t, ChildCallback> children;

  struct Timer {
    Clock::time_point deadline;
    Callback callback;
  };
  set<pair<Clock::time_point, TimerId>> timerQueue;
  unordered_map<TimerId, Timer> timers;
  TimerId nextTimerId;

  mutex postMutex;
  vector<Callback> posted;
  int wakeupPipe[2];

  atomic<bool> stopped;
  thread::id loopThreadId;
  bool loopThreadKnown;

  void drainWakeupPipe();
  void runPosted();
  void runDueTimers();
  void reapChildren();
};
}  // namespace hb

#endif  // __HB_EVENT_LOOP__
