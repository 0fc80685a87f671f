#include "ProcessTerminator.hpp"

#include "ChildProcess.hpp"
#include "TestHeaders.hpp"

using namespace hb;

namespace {
shared_ptr<ChildProcess> spawnOrFail(const string& command) {
  shared_ptr<ChildProcess> child(new ChildProcess());
  string error;
  bool spawned = child->spawn(command, "", {}, &error);
  INFO(error);
  REQUIRE(spawned);
  return child;
}
}  // namespace

TEST_CASE("ProcessTerminator stops a cooperative process with SIGTERM",
          "[ProcessTerminator]") {
  auto loop = make_shared<EventLoop>();
  ProcessTerminator terminator(loop);
  auto child = spawnOrFail("exec sleep 30");

  vector<ExitStatus> results;
  terminator.terminate(
      child->getPid(), chrono::milliseconds(2000),
      [&results](const ExitStatus& status) { results.push_back(status); });
  REQUIRE(terminator.isTerminating(child->getPid()));

  REQUIRE(loop->runUntil([&results]() { return !results.empty(); },
                         chrono::milliseconds(5000)));
  REQUIRE(results.size() == 1);
  REQUIRE(results[0].observed);
  REQUIRE(results[0].signal == SIGTERM);
  REQUIRE_FALSE(terminator.isTerminating(child->getPid()));
}

TEST_CASE("ProcessTerminator escalates to SIGKILL after the grace period",
          "[ProcessTerminator]") {
  auto loop = make_shared<EventLoop>();
  ProcessTerminator terminator(loop);
  // An ignored signal stays ignored across exec, so the whole group
  // shrugs off SIGTERM.
  auto child = spawnOrFail("trap '' TERM; while true; do sleep 1; done");
  // Give the shell a moment to install the trap.
  loop->runUntil([]() { return false; }, chrono::milliseconds(200));

  auto started = chrono::steady_clock::now();
  vector<ExitStatus> results;
  terminator.terminate(
      child->getPid(), chrono::milliseconds(300),
      [&results](const ExitStatus& status) { results.push_back(status); });
  REQUIRE(loop->runUntil([&results]() { return !results.empty(); },
                         chrono::milliseconds(5000)));
  REQUIRE(results[0].observed);
  REQUIRE(results[0].signal == SIGKILL);
  REQUIRE(chrono::steady_clock::now() - started >= chrono::milliseconds(300));
}

TEST_CASE("ProcessTerminator shares one termination between callers",
          "[ProcessTerminator]") {
  auto loop = make_shared<EventLoop>();
  ProcessTerminator terminator(loop);
  auto child = spawnOrFail("exec sleep 30");

  int completions = 0;
  auto done = [&completions](const ExitStatus&) { completions++; };
  terminator.terminate(child->getPid(), chrono::milliseconds(1000), done);
  terminator.terminate(child->getPid(), chrono::milliseconds(1000), done);
  REQUIRE(loop->runUntil([&completions]() { return completions == 2; },
                         chrono::milliseconds(5000)));
  loop->runUntil([]() { return false; }, chrono::milliseconds(50));
  REQUIRE(completions == 2);
}

TEST_CASE("ProcessTerminator completes even when the exit is never seen",
          "[ProcessTerminator]") {
  auto loop = make_shared<EventLoop>();
  ProcessTerminator terminator(loop);
  auto child = spawnOrFail("exec sleep 30");
  pid_t pid = child->getPid();

  // Someone else reaps the process first.
  REQUIRE(::kill(pid, SIGKILL) == 0);
  int status;
  REQUIRE(::waitpid(pid, &status, 0) == pid);

  vector<ExitStatus> results;
  terminator.terminate(
      pid, chrono::milliseconds(100),
      [&results](const ExitStatus& status) { results.push_back(status); });
  REQUIRE(loop->runUntil([&results]() { return !results.empty(); },
                         chrono::milliseconds(3000)));
  REQUIRE_FALSE(results[0].observed);
  REQUIRE(results[0].describe() == "exit not observed");
}

TEST_CASE("ProcessTerminator has nothing to sweep once the group is gone",
          "[ProcessTerminator]") {
  auto loop = make_shared<EventLoop>();
  ProcessTerminator terminator(loop);
  auto child = spawnOrFail("exit 0");
  pid_t pid = child->getPid();
  int status;
  REQUIRE(::waitpid(pid, &status, 0) == pid);

  terminator.sweepGroup(pid, chrono::milliseconds(100));
  REQUIRE_FALSE(terminator.isSweeping(pid));
}

TEST_CASE("ExitStatus describes how a process ended", "[ProcessTerminator]") {
  ExitStatus lost = ExitStatus::fromWaitStatus(-1);
  REQUIRE_FALSE(lost.observed);

  pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    _exit(3);
  }
  int waitStatus;
  REQUIRE(::waitpid(pid, &waitStatus, 0) == pid);
  ExitStatus exited = ExitStatus::fromWaitStatus(waitStatus);
  REQUIRE(exited.observed);
  REQUIRE(exited.exitCode == 3);
  REQUIRE(exited.signal == 0);
  REQUIRE(exited.describe() == "exited with code 3");
}
