#ifndef __HB_HEALTH_MONITOR__
#define __HB_HEALTH_MONITOR__

#include "EventLoop.hpp"
#include "Headers.hpp"

namespace hb {
/**
 * @brief Watches a source's output for a readiness marker within a deadline.
 *
 * Each armed source resolves exactly once: ready on the first marker match,
 * failed on deadline expiry or on process exit, whichever happens first.
 * Later output, exits and timer firings for a resolved source are ignored.
 */
class HealthMonitor {
 public:
  typedef function<void()> ReadyCallback;
  typedef function<void(ErrorCode code, const string& message)>
      FailureCallback;

  explicit HealthMonitor(shared_ptr<EventLoop> _loop);
  ~HealthMonitor();

  /**
   * @brief Starts watching `sourceId`, replacing any previous watch.
   * @param patterns Plain substrings; `{port}` is replaced with `port`.
   */
  void arm(const string& sourceId, const vector<string>& patterns, int port,
           chrono::milliseconds deadline, ReadyCallback onReady,
           FailureCallback onFailure);

  /** @brief Drops the watch without resolving it. */
  void disarm(const string& sourceId);

  bool isArmed(const string& sourceId) const {
    return watches.find(sourceId) != watches.end();
  }

  /** @brief Feeds one ordered output event for the source. */
  void consume(const OutputEvent& event);

  /** @brief The process exited; an armed watch fails immediately. */
  void processExited(const string& sourceId, const string& reason);

  /**
   * @brief Removes CSI/OSC escape sequences from `input`.
   * @param pending In: an unterminated sequence left by the previous call.
   * Out: the unterminated tail of this call, if any.
   */
  static string stripAnsi(const string& input, string* pending);

 protected:
  struct Watch {
    vector<string> patterns;
    size_t longestPattern;
    string tail;
    string pendingEscape;
    EventLoop::TimerId timer;
    ReadyCallback onReady;
    FailureCallback onFailure;
  };

  shared_ptr<EventLoop> loop;
  map<string, Watch> watches;

  void fail(const string& sourceId, ErrorCode code, const string& message);
};
}  // namespace hb

#endif  // __HB_HEALTH_MONITOR__
