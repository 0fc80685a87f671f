#ifndef __HB_PACKET_H__
#define __HB_PACKET_H__

#include "Headers.hpp"

namespace hb {
/**
 * @brief One command-channel message: a `HarborPacketType` header byte
 * followed by a serialized protobuf payload.
 */
class Packet {
 public:
  Packet() : header(255) {}
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its raw byte representation.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Empty packet");
    }
    header = serializedPacket[0];
    payload = serializedPacket.substr(1);
  }

  template <typename T>
  static Packet fromProto(HarborPacketType type, const T& t) {
    return Packet(uint8_t(type), protoToString(t));
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  /** @brief Parses the payload, throwing on a malformed message. */
  template <typename T>
  T getProto() const {
    T t;
    if (!stringToProto(payload, &t)) {
      throw std::runtime_error("Invalid proto payload for header " +
                               to_string(int(header)));
    }
    return t;
  }

  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s = "0" + payload;
    s[0] = header;
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace hb

#endif  // __HB_PACKET_H__
