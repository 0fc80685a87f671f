#include "HealthMonitor.hpp"

namespace hb {
namespace {
const char ESC = '\x1b';
const char BEL = '\x07';
// Longer unterminated sequences are garbage, not a split escape.
const size_t MAX_PENDING_ESCAPE = 64;
}  // namespace

HealthMonitor::HealthMonitor(shared_ptr<EventLoop> _loop) : loop(_loop) {}

HealthMonitor::~HealthMonitor() {
  for (auto& it : watches) {
    if (it.second.timer) {
      loop->cancel(it.second.timer);
    }
  }
}

void HealthMonitor::arm(const string& sourceId, const vector<string>& patterns,
                        int port, chrono::milliseconds deadline,
                        ReadyCallback onReady, FailureCallback onFailure) {
  disarm(sourceId);

  Watch watch;
  watch.longestPattern = 0;
  for (auto pattern : patterns) {
    while (replace(pattern, "{port}", to_string(port))) {
    }
    if (pattern.empty()) {
      continue;
    }
    watch.longestPattern = max(watch.longestPattern, pattern.size());
    watch.patterns.push_back(pattern);
  }
  watch.onReady = onReady;
  watch.onFailure = onFailure;
  watch.timer = loop->schedule(deadline, [this, sourceId, deadline]() {
    auto it = watches.find(sourceId);
    if (it == watches.end()) {
      return;
    }
    // The timer already fired, nothing to cancel.
    it->second.timer = 0;
    fail(sourceId, HEALTH_CHECK_TIMEOUT,
         "No readiness marker within " + to_string(deadline.count()) + " ms");
  });
  watches[sourceId] = watch;
  VLOG(1) << "Armed readiness watch for " << sourceId << " with "
          << watch.patterns.size() << " markers";
}

void HealthMonitor::disarm(const string& sourceId) {
  auto it = watches.find(sourceId);
  if (it == watches.end()) {
    return;
  }
  if (it->second.timer) {
    loop->cancel(it->second.timer);
  }
  watches.erase(it);
}

void HealthMonitor::consume(const OutputEvent& event) {
  auto it = watches.find(event.sourceid());
  if (it == watches.end() || event.gap()) {
    return;
  }
  Watch& watch = it->second;
  watch.tail += stripAnsi(event.payload(), &watch.pendingEscape);
  for (const auto& pattern : watch.patterns) {
    if (watch.tail.find(pattern) != string::npos) {
      LOG(INFO) << "Readiness marker '" << pattern << "' seen for "
                << event.sourceid();
      ReadyCallback onReady = watch.onReady;
      if (watch.timer) {
        loop->cancel(watch.timer);
      }
      watches.erase(it);
      onReady();
      return;
    }
  }
  // Keep just enough to match a marker split across events.
  size_t keep = watch.longestPattern > 0 ? watch.longestPattern - 1 : 0;
  if (watch.tail.size() > keep) {
    watch.tail.erase(0, watch.tail.size() - keep);
  }
}

void HealthMonitor::processExited(const string& sourceId,
                                  const string& reason) {
  if (!isArmed(sourceId)) {
    return;
  }
  fail(sourceId, UNEXPECTED_EXIT, "Process exited before ready: " + reason);
}

void HealthMonitor::fail(const string& sourceId, ErrorCode code,
                         const string& message) {
  auto it = watches.find(sourceId);
  if (it == watches.end()) {
    return;
  }
  LOG(INFO) << "Readiness failed for " << sourceId << ": " << message;
  FailureCallback onFailure = it->second.onFailure;
  if (it->second.timer) {
    loop->cancel(it->second.timer);
  }
  watches.erase(it);
  onFailure(code, message);
}

string HealthMonitor::stripAnsi(const string& input, string* pending) {
  string s = *pending + input;
  pending->clear();
  string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    if (s[i] != ESC) {
      out.push_back(s[i]);
      i++;
      continue;
    }
    if (i + 1 >= s.size()) {
      *pending = s.substr(i);
      break;
    }
    char kind = s[i + 1];
    if (kind == '[') {
      // CSI: parameter/intermediate bytes then one final byte.
      size_t j = i + 2;
      while (j < s.size() && s[j] >= 0x20 && s[j] <= 0x3f) {
        j++;
      }
      if (j >= s.size()) {
        *pending = s.substr(i);
        break;
      }
      i = j + 1;
    } else if (kind == ']') {
      // OSC: terminated by BEL or ESC backslash.
      size_t j = i + 2;
      bool terminated = false;
      while (j < s.size()) {
        if (s[j] == BEL) {
          j++;
          terminated = true;
          break;
        }
        if (s[j] == ESC && j + 1 < s.size() && s[j + 1] == '\\') {
          j += 2;
          terminated = true;
          break;
        }
        j++;
      }
      if (!terminated) {
        *pending = s.substr(i);
        break;
      }
      i = j;
    } else {
      i += 2;
    }
  }
  if (pending->size() > MAX_PENDING_ESCAPE) {
    pending->clear();
  }
  return out;
}
}  // namespace hb
