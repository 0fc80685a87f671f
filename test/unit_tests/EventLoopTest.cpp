#include "EventLoop.hpp"

#include "TestHeaders.hpp"

using namespace hb;

TEST_CASE("EventLoop runs timers in deadline order", "[EventLoop]") {
  EventLoop loop;
  vector<int> fired;
  loop.schedule(chrono::milliseconds(30), [&fired]() { fired.push_back(3); });
  loop.schedule(chrono::milliseconds(10), [&fired]() { fired.push_back(1); });
  auto cancelled =
      loop.schedule(chrono::milliseconds(20), [&fired]() { fired.push_back(2); });
  loop.cancel(cancelled);

  REQUIRE(loop.runUntil([&fired]() { return fired.size() == 2; },
                        chrono::milliseconds(2000)));
  REQUIRE(fired == vector<int>({1, 3}));
}

TEST_CASE("EventLoop runs callbacks posted from other threads",
          "[EventLoop]") {
  EventLoop loop;
  atomic<int> count(0);
  thread poster([&loop, &count]() {
    for (int i = 0; i < 10; i++) {
      loop.post([&count]() { count++; });
    }
  });
  poster.join();
  REQUIRE(loop.runUntil([&count]() { return count == 10; },
                        chrono::milliseconds(2000)));
}

TEST_CASE("EventLoop dispatches readable descriptors", "[EventLoop]") {
  EventLoop loop;
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  string received;
  loop.addReader(fds[0], [&]() {
    char buf[16];
    ssize_t rc = ::read(fds[0], buf, sizeof(buf));
    if (rc > 0) {
      received.append(buf, rc);
    }
  });
  REQUIRE(::write(fds[1], "ping", 4) == 4);
  REQUIRE(loop.runUntil([&]() { return received == "ping"; },
                        chrono::milliseconds(2000)));

  loop.removeReader(fds[0]);
  REQUIRE(::write(fds[1], "more", 4) == 4);
  loop.runOnce(chrono::milliseconds(20));
  REQUIRE(received == "ping");
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("EventLoop reports child exit status", "[EventLoop]") {
  EventLoop loop;
  pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    _exit(7);
  }
  int status = -2;
  loop.watchChild(pid, [&status](int waitStatus) { status = waitStatus; });
  REQUIRE(loop.runUntil([&status]() { return status != -2; },
                        chrono::milliseconds(5000)));
  REQUIRE(WIFEXITED(status));
  REQUIRE(WEXITSTATUS(status) == 7);
  REQUIRE_FALSE(loop.isWatchingChild(pid));
}
