#include "HealthMonitor.hpp"

#include "TestHeaders.hpp"

using namespace hb;

namespace {
OutputEvent makeOutput(const string& sourceId, const string& payload,
                       int64_t sequence) {
  OutputEvent event;
  event.set_sourceid(sourceId);
  event.set_payload(payload);
  event.set_sequence(sequence);
  return event;
}

struct Outcome {
  int ready = 0;
  int failed = 0;
  ErrorCode code = NO_ERROR;
  string message;
};
}  // namespace

TEST_CASE("HealthMonitor resolves ready on a marker", "[HealthMonitor]") {
  auto loop = make_shared<EventLoop>();
  HealthMonitor monitor(loop);
  Outcome outcome;
  monitor.arm(
      "web", {"compiled successfully", "localhost:{port}"}, 4100,
      chrono::milliseconds(5000), [&outcome]() { outcome.ready++; },
      [&outcome](ErrorCode code, const string& message) {
        outcome.failed++;
        outcome.code = code;
      });
  REQUIRE(monitor.isArmed("web"));

  monitor.consume(makeOutput("web", "Starting the development server\n", 1));
  REQUIRE(outcome.ready == 0);

  SECTION("Port placeholder is substituted") {
    monitor.consume(makeOutput("web", "listening on localhost:4100\n", 2));
    REQUIRE(outcome.ready == 1);
  }

  SECTION("Marker split across events") {
    monitor.consume(makeOutput("web", "webpack: compiled succ", 2));
    REQUIRE(outcome.ready == 0);
    monitor.consume(makeOutput("web", "essfully in 512ms\n", 3));
    REQUIRE(outcome.ready == 1);
  }

  SECTION("Marker wrapped in color codes") {
    monitor.consume(
        makeOutput("web", "\x1b[32mcompiled \x1b[1msuccessfully\x1b[0m", 2));
    REQUIRE(outcome.ready == 1);
  }

  SECTION("Resolution happens once") {
    monitor.consume(makeOutput("web", "compiled successfully", 2));
    monitor.consume(makeOutput("web", "compiled successfully", 3));
    monitor.processExited("web", "exited with code 0");
    REQUIRE(outcome.ready == 1);
    REQUIRE(outcome.failed == 0);
    REQUIRE_FALSE(monitor.isArmed("web"));
  }

  SECTION("Other sources do not count") {
    monitor.consume(makeOutput("api", "compiled successfully", 1));
    REQUIRE(outcome.ready == 0);
  }

  SECTION("The wrong port does not count") {
    monitor.consume(makeOutput("web", "localhost:4101", 2));
    REQUIRE(outcome.ready == 0);
  }
}

TEST_CASE("HealthMonitor fails on deadline", "[HealthMonitor]") {
  auto loop = make_shared<EventLoop>();
  HealthMonitor monitor(loop);
  Outcome outcome;
  monitor.arm(
      "web", {"ready"}, 4100, chrono::milliseconds(50),
      [&outcome]() { outcome.ready++; },
      [&outcome](ErrorCode code, const string& message) {
        outcome.failed++;
        outcome.code = code;
        outcome.message = message;
      });
  REQUIRE(loop->runUntil([&outcome]() { return outcome.failed > 0; },
                         chrono::milliseconds(2000)));
  REQUIRE(outcome.code == HEALTH_CHECK_TIMEOUT);
  REQUIRE(outcome.ready == 0);

  // Output after resolution is ignored.
  monitor.consume(makeOutput("web", "ready", 1));
  REQUIRE(outcome.ready == 0);
  REQUIRE(outcome.failed == 1);
}

TEST_CASE("HealthMonitor fails on process exit", "[HealthMonitor]") {
  auto loop = make_shared<EventLoop>();
  HealthMonitor monitor(loop);
  Outcome outcome;
  monitor.arm(
      "web", {"ready"}, 4100, chrono::milliseconds(50),
      [&outcome]() { outcome.ready++; },
      [&outcome](ErrorCode code, const string& message) {
        outcome.failed++;
        outcome.code = code;
        outcome.message = message;
      });
  monitor.processExited("web", "exited with code 1");
  REQUIRE(outcome.failed == 1);
  REQUIRE(outcome.code == UNEXPECTED_EXIT);
  REQUIRE(outcome.message.find("exited with code 1") != string::npos);

  // The cancelled deadline never fires.
  loop->runUntil([]() { return false; }, chrono::milliseconds(100));
  REQUIRE(outcome.failed == 1);
}

TEST_CASE("HealthMonitor disarm drops the watch silently",
          "[HealthMonitor]") {
  auto loop = make_shared<EventLoop>();
  HealthMonitor monitor(loop);
  Outcome outcome;
  monitor.arm(
      "web", {"ready"}, 4100, chrono::milliseconds(30),
      [&outcome]() { outcome.ready++; },
      [&outcome](ErrorCode, const string&) { outcome.failed++; });
  monitor.disarm("web");
  loop->runUntil([]() { return false; }, chrono::milliseconds(80));
  monitor.consume(makeOutput("web", "ready", 1));
  REQUIRE(outcome.ready == 0);
  REQUIRE(outcome.failed == 0);
}

TEST_CASE("HealthMonitor stripAnsi handles split sequences",
          "[HealthMonitor]") {
  string pending;
  REQUIRE(HealthMonitor::stripAnsi("plain", &pending) == "plain");
  REQUIRE(pending.empty());

  REQUIRE(HealthMonitor::stripAnsi("a\x1b[3", &pending) == "a");
  REQUIRE(pending == "\x1b[3");
  REQUIRE(HealthMonitor::stripAnsi("1mb", &pending) == "b");
  REQUIRE(pending.empty());

  // OSC title sequence terminated by BEL.
  REQUIRE(HealthMonitor::stripAnsi("\x1b]0;title\x07ok", &pending) == "ok");
}
