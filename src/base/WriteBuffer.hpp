#ifndef __HB_WRITE_BUFFER__
#define __HB_WRITE_BUFFER__

#include "Headers.hpp"

namespace hb {
/**
 * @brief Bounded queue of bytes waiting for a non-blocking descriptor.
 *
 * Used for PTY input and for command-channel clients. `canAcceptMore()`
 * turning false is the backpressure signal for whoever produces the data.
 */
class WriteBuffer {
 public:
  static constexpr size_t DEFAULT_MAX_BUFFER_SIZE = 256 * 1024;

  explicit WriteBuffer(size_t _maxBytes = DEFAULT_MAX_BUFFER_SIZE)
      : maxBytes(_maxBytes), totalBytes(0), writeOffset(0) {}

  bool canAcceptMore() const { return totalBytes < maxBytes; }

  bool hasPendingData() const { return !pending.empty(); }

  size_t size() const { return totalBytes; }

  size_t capacity() const { return maxBytes; }

  void enqueue(const string &data) {
    if (data.empty()) return;
    pending.push_back(data);
    totalBytes += data.size();
  }

  /**
   * @brief Returns a pointer to the next bytes to write and the count.
   * @return Pointer to the data, or nullptr if buffer is empty.
   */
  const char *peekData(size_t *count) const {
    if (pending.empty()) {
      *count = 0;
      return nullptr;
    }
    const string &front = pending.front();
    *count = front.size() - writeOffset;
    return front.data() + writeOffset;
  }

  /** @brief Drops `bytesWritten` bytes from the front of the queue. */
  void consume(size_t bytesWritten) {
    while (bytesWritten > 0 && !pending.empty()) {
      string &front = pending.front();
      size_t available = front.size() - writeOffset;

      if (bytesWritten >= available) {
        bytesWritten -= available;
        totalBytes -= available;
        writeOffset = 0;
        pending.pop_front();
      } else {
        writeOffset += bytesWritten;
        totalBytes -= bytesWritten;
        bytesWritten = 0;
      }
    }
  }

  /**
   * @brief Writes as much as the writer accepts without blocking.
   * @param writer Returns bytes written, or -1 with errno set.
   * @return false on a hard write error (anything but EAGAIN/EINTR).
   */
  bool flush(const function<ssize_t(const char *, size_t)> &writer) {
    while (hasPendingData()) {
      size_t count;
      const char *data = peekData(&count);
      ssize_t rc = writer(data, count);
      if (rc < 0) {
        auto localErrno = GetErrno();
        if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
            localErrno == EINTR) {
          return true;
        }
        return false;
      }
      if (rc == 0) {
        return true;
      }
      consume(rc);
    }
    return true;
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
    writeOffset = 0;
  }

 private:
  size_t maxBytes;
  std::deque<string> pending;
  size_t totalBytes;
  size_t writeOffset;  // Offset into the front chunk for partial writes
};
}  // namespace hb

#endif  // __HB_WRITE_BUFFER__
