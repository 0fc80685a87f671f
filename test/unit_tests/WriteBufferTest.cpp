#include "WriteBuffer.hpp"

#include "TestHeaders.hpp"

using namespace hb;

namespace {
string peekAll(const WriteBuffer &buffer) {
  size_t count;
  const char *data = buffer.peekData(&count);
  return data ? string(data, count) : string();
}
}  // namespace

TEST_CASE("WriteBuffer keeps queued bytes in order", "[WriteBuffer]") {
  WriteBuffer buffer;
  REQUIRE_FALSE(buffer.hasPendingData());
  REQUIRE(peekAll(buffer).empty());

  // Empty chunks never become a zero-length write.
  buffer.enqueue("");
  REQUIRE_FALSE(buffer.hasPendingData());

  buffer.enqueue("ls -la\n");
  buffer.enqueue("pwd\n");
  REQUIRE(buffer.size() == 11);
  REQUIRE(peekAll(buffer) == "ls -la\n");

  buffer.consume(3);
  REQUIRE(peekAll(buffer) == "-la\n");

  // Crosses into the second chunk.
  buffer.consume(6);
  REQUIRE(buffer.size() == 2);
  REQUIRE(peekAll(buffer) == "d\n");

  buffer.clear();
  REQUIRE(buffer.size() == 0);
  REQUIRE(buffer.canAcceptMore());
}

TEST_CASE("WriteBuffer backpressure", "[WriteBuffer]") {
  WriteBuffer buffer(1024);

  SECTION("canAcceptMore turns false at capacity") {
    buffer.enqueue(string(1024, 'x'));
    REQUIRE(buffer.canAcceptMore() == false);
    REQUIRE(buffer.size() == 1024);

    buffer.consume(100);
    REQUIRE(buffer.canAcceptMore() == true);
  }

  SECTION("Enqueue past capacity is still accepted") {
    buffer.enqueue(string(1000, 'x'));
    buffer.enqueue(string(1000, 'y'));
    REQUIRE(buffer.size() == 2000);
    REQUIRE(buffer.canAcceptMore() == false);
  }
}

TEST_CASE("WriteBuffer flush", "[WriteBuffer]") {
  WriteBuffer buffer;
  buffer.enqueue("hello ");
  buffer.enqueue("world");

  SECTION("Writer that takes everything drains the buffer") {
    string sink;
    bool ok = buffer.flush([&sink](const char *data, size_t count) {
      sink.append(data, count);
      return ssize_t(count);
    });
    REQUIRE(ok);
    REQUIRE(sink == "hello world");
    REQUIRE(buffer.hasPendingData() == false);
  }

  SECTION("Partial writes keep the remainder in order") {
    string sink;
    bool ok = buffer.flush([&sink](const char *data, size_t count) {
      if (sink.size() >= 4) {
        SetErrno(EAGAIN);
        return ssize_t(-1);
      }
      sink.append(data, 2);
      return ssize_t(2);
    });
    REQUIRE(ok);
    REQUIRE(sink == "hell");
    REQUIRE(buffer.size() == 7);

    REQUIRE(peekAll(buffer) == "o ");
  }

  SECTION("Hard errors are reported") {
    bool ok = buffer.flush([](const char *, size_t) {
      SetErrno(EPIPE);
      return ssize_t(-1);
    });
    REQUIRE(ok == false);
    REQUIRE(buffer.size() == 11);
  }
}
