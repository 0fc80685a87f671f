#ifndef __HB_TEST_HEADERS__
#define __HB_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch.hpp>

#include "EventListener.hpp"
#include "EventLoop.hpp"
#include "HarborError.hpp"
#include "IOBroker.hpp"
#include "SupervisorConfig.hpp"

namespace hb {
/** @brief Supervisor settings with short deadlines and no OS port probe. */
inline SupervisorConfig makeTestConfig() {
  SupervisorConfig config;
  config.ports.base = 47100;
  config.ports.end = 47199;
  config.ports.reserved = {47100};
  config.ports.probe = false;
  config.devServer.readinessPatterns = {"ready on {port}", "compiled"};
  config.devServer.readinessTimeout = chrono::milliseconds(1500);
  config.devServer.grace = chrono::milliseconds(500);
  config.session.shell = "/bin/sh";
  config.session.grace = chrono::milliseconds(500);
  config.broker.coalesceWindow = chrono::milliseconds(10);
  config.broker.inputPause = chrono::milliseconds(10);
  return config;
}

inline string makeTempDirectory(const string& prefix) {
  string pattern = GetTempDirectory() + prefix + "_XXXXXXXX";
  char* created = mkdtemp(&pattern[0]);
  REQUIRE(created != NULL);
  return string(created);
}

/** @brief Records every lifecycle notification in arrival order. */
class RecordingListener : public EventListener {
 public:
  virtual void onProgress(const ProgressEvent& event) {
    progress.push_back(event);
  }

  virtual void onExit(const ExitEvent& event) { exits.push_back(event); }

  vector<ProcessStatus> statusesFor(const string& sourceId) const {
    vector<ProcessStatus> statuses;
    for (const auto& event : progress) {
      if (event.sourceid() == sourceId) {
        statuses.push_back(event.status());
      }
    }
    return statuses;
  }

  int exitCount(const string& sourceId) const {
    int count = 0;
    for (const auto& event : exits) {
      if (event.sourceid() == sourceId) {
        count++;
      }
    }
    return count;
  }

  vector<ProgressEvent> progress;
  vector<ExitEvent> exits;
};

/** @brief Collects output; can be told to refuse delivery. */
class RecordingSink : public OutputSink {
 public:
  RecordingSink() : congested(false) {}

  virtual bool deliver(const OutputEvent& event) {
    if (congested) {
      return false;
    }
    events.push_back(event);
    return true;
  }

  string payloads() const {
    string all;
    for (const auto& event : events) {
      if (!event.gap()) {
        all += event.payload();
      }
    }
    return all;
  }

  bool congested;
  vector<OutputEvent> events;
};

/** @brief Stores a reply delivered through a CommandCallback. */
struct ReplyCatcher {
  shared_ptr<CommandReply> reply = make_shared<CommandReply>();
  shared_ptr<bool> done = make_shared<bool>(false);

  CommandCallback callback() {
    auto r = reply;
    auto d = done;
    return [r, d](const CommandReply& value) {
      *r = value;
      *d = true;
    };
  }

  bool ready() const { return *done; }
};
}  // namespace hb

#endif  // __HB_TEST_HEADERS__
