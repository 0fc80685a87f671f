#ifndef __HB_SOCKET_HANDLER__
#define __HB_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace hb {
/**
 * @brief Abstract API for command-channel socket reads/writes and lifecycle.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  virtual bool hasData(int fd) = 0;
  /** @brief Reads up to count bytes from fd. */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /** @brief Writes up to count bytes to fd without blocking. */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes.
   * @param timeoutMs Gives up with std::runtime_error after this long without
   * progress; negative waits forever.
   */
  void readAll(int fd, void* buf, size_t count, int64_t timeoutMs);
  /** @brief Writes all bytes, throwing if the peer stalls or fails. */
  void writeAllOrThrow(int fd, const void* buf, size_t count);

  /**
   * @brief Reads one length-prefixed packet.
   * @returns false when the packet length is zero (empty message).
   */
  inline bool readPacket(int fd, Packet* packet, int64_t timeoutMs = -1) {
    int64_t length;
    readAll(fd, (char*)&length, sizeof(int64_t), timeoutMs);
    if (length < 0 || length > MAX_PACKET_LENGTH) {
      string s("Invalid packet size: ");
      s += std::to_string(length);
      throw std::runtime_error(s.c_str());
    }
    if (length == 0) {
      return false;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, timeoutMs);
    *packet = Packet(s);
    return true;
  }

  /** @brief Serializes and writes a packet with a leading length prefix. */
  inline void writePacket(int fd, const Packet& packet) {
    string s = encodePacket(packet);
    writeAllOrThrow(fd, &s[0], s.length());
  }

  /** @brief Length prefix + packet bytes, ready for a write buffer. */
  static string encodePacket(const Packet& packet) {
    string s = packet.serialize();
    int64_t length = s.length();
    if (length > MAX_PACKET_LENGTH) {
      STFATAL << "Invalid message length: " << length;
    }
    string framed(sizeof(int64_t), '\0');
    memcpy(&framed[0], &length, sizeof(int64_t));
    framed.append(s);
    return framed;
  }

  /**
   * @brief Opens a connection to the socket path.
   * @return File descriptor, or -1 on failure (errno is preserved).
   */
  virtual int connect(const string& path) = 0;
  /** @brief Starts listening on the path and returns the listening fd. */
  virtual int listen(const string& path) = 0;
  /** @brief Accepts a pending connection, or returns -1 if none is pending. */
  virtual int accept(int fd) = 0;
  /** @brief Stops listening on the path and unlinks it. */
  virtual void stopListening(const string& path) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
};
}  // namespace hb

#endif  // __HB_SOCKET_HANDLER__
