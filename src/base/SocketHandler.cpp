#include "SocketHandler.hpp"

namespace hb {
namespace {
bool waitOnSocketData(int fd, int64_t timeoutMs) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc < 0 && GetErrno() != EINTR) {
    throw std::runtime_error(string("select failed: ") + strerror(GetErrno()));
  }
  return rc > 0 && FD_ISSET(fd, &fdset);
}
}  // namespace

void SocketHandler::readAll(int fd, void* buf, size_t count,
                            int64_t timeoutMs) {
  auto lastProgress = chrono::steady_clock::now();
  size_t pos = 0;
  while (pos < count) {
    if (!waitOnSocketData(fd, 100)) {
      auto waited = chrono::duration_cast<chrono::milliseconds>(
                        chrono::steady_clock::now() - lastProgress)
                        .count();
      if (timeoutMs >= 0 && waited > timeoutMs) {
        throw std::runtime_error("Socket Timeout");
      }
      continue;
    }

    ssize_t bytesRead = read(fd, ((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      throw std::runtime_error("Socket closed during readAll");
    }
    if (bytesRead < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      VLOG(1) << "Failed a call to readAll: " << strerror(localErrno);
      throw std::runtime_error("Failed a call to readAll");
    }
    pos += bytesRead;
    lastProgress = chrono::steady_clock::now();
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count) {
  auto lastProgress = chrono::steady_clock::now();
  size_t pos = 0;
  while (pos < count) {
    if (chrono::steady_clock::now() - lastProgress > chrono::seconds(10)) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = GetErrno();
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      lastProgress = chrono::steady_clock::now();
    }
  }
}
}  // namespace hb
