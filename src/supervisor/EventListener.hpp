#ifndef __HB_EVENT_LISTENER__
#define __HB_EVENT_LISTENER__

#include "Headers.hpp"

namespace hb {
/**
 * @brief Receives lifecycle notifications from the supervisor and the
 * session manager, on the loop thread.
 */
class EventListener {
 public:
  virtual ~EventListener() {}

  virtual void onProgress(const ProgressEvent& event) = 0;

  virtual void onExit(const ExitEvent& event) = 0;
};

/** @brief Forwards every notification to a list of listeners. */
class EventFanout : public EventListener {
 public:
  void add(shared_ptr<EventListener> listener) {
    listeners.push_back(listener);
  }

  void remove(shared_ptr<EventListener> listener) {
    listeners.erase(std::remove(listeners.begin(), listeners.end(), listener),
                    listeners.end());
  }

  virtual void onProgress(const ProgressEvent& event) {
    // A listener may remove itself while being notified.
    auto current = listeners;
    for (auto& listener : current) {
      listener->onProgress(event);
    }
  }

  virtual void onExit(const ExitEvent& event) {
    auto current = listeners;
    for (auto& listener : current) {
      listener->onExit(event);
    }
  }

 protected:
  vector<shared_ptr<EventListener>> listeners;
};

inline ProgressEvent makeProgressEvent(const string& sourceId,
                                       SourceKind kind, ProcessStatus status,
                                       ErrorCode error = NO_ERROR,
                                       const string& message = "") {
  ProgressEvent event;
  event.set_sourceid(sourceId);
  event.set_kind(kind);
  event.set_status(status);
  event.set_timestampms(nowMs());
  event.set_error(error);
  if (!message.empty()) {
    event.set_message(message);
  }
  return event;
}
}  // namespace hb

#endif  // __HB_EVENT_LISTENER__
