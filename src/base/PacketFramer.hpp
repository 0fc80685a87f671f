#ifndef __HB_PACKET_FRAMER__
#define __HB_PACKET_FRAMER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace hb {
/**
 * @brief Reassembles length-prefixed packets from a non-blocking byte stream.
 */
class PacketFramer {
 public:
  void append(const char* data, size_t count) { buffer.append(data, count); }

  /**
   * @brief Pops the next complete packet.
   * @return false if more bytes are needed.
   * @throws std::runtime_error on a corrupt length prefix.
   */
  bool next(Packet* packet) {
    while (true) {
      if (buffer.size() < sizeof(int64_t)) {
        return false;
      }
      int64_t length;
      memcpy(&length, buffer.data(), sizeof(int64_t));
      if (length < 0 || length > MAX_PACKET_LENGTH) {
        throw std::runtime_error("Invalid packet size: " + to_string(length));
      }
      if (buffer.size() < sizeof(int64_t) + size_t(length)) {
        return false;
      }
      string body = buffer.substr(sizeof(int64_t), length);
      buffer.erase(0, sizeof(int64_t) + length);
      if (length == 0) {
        // Empty keepalive frame
        continue;
      }
      *packet = Packet(body);
      return true;
    }
  }

  size_t pendingBytes() const { return buffer.size(); }

 protected:
  string buffer;
};
}  // namespace hb

#endif  // __HB_PACKET_FRAMER__
