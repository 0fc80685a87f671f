#include "PacketFramer.hpp"

#include "SocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace hb;

namespace {
Packet makeStatusPacket(const string& ownerId) {
  GetStatusRequest request;
  request.set_requestid("7");
  request.set_ownerid(ownerId);
  return Packet::fromProto(GET_STATUS, request);
}
}  // namespace

TEST_CASE("PacketFramer reassembles packets split across reads",
          "[PacketFramer]") {
  string wire = SocketHandler::encodePacket(makeStatusPacket("alpha")) +
                SocketHandler::encodePacket(makeStatusPacket("beta"));
  PacketFramer framer;
  Packet packet;

  // Feed one byte at a time; a packet only appears once complete.
  vector<string> owners;
  for (char c : wire) {
    framer.append(&c, 1);
    while (framer.next(&packet)) {
      REQUIRE(packet.getHeader() == GET_STATUS);
      owners.push_back(packet.getProto<GetStatusRequest>().ownerid());
    }
  }
  REQUIRE(owners == vector<string>({"alpha", "beta"}));
  REQUIRE(framer.pendingBytes() == 0);
}

TEST_CASE("PacketFramer skips empty frames", "[PacketFramer]") {
  string wire(sizeof(int64_t), '\0');
  wire += SocketHandler::encodePacket(makeStatusPacket("gamma"));
  PacketFramer framer;
  framer.append(wire.data(), wire.size());

  Packet packet;
  REQUIRE(framer.next(&packet));
  REQUIRE(packet.getProto<GetStatusRequest>().ownerid() == "gamma");
  REQUIRE_FALSE(framer.next(&packet));
}

TEST_CASE("PacketFramer rejects a corrupt length", "[PacketFramer]") {
  int64_t length = -5;
  string wire(sizeof(int64_t), '\0');
  memcpy(&wire[0], &length, sizeof(int64_t));
  PacketFramer framer;
  framer.append(wire.data(), wire.size());

  Packet packet;
  REQUIRE_THROWS_AS(framer.next(&packet), std::runtime_error);
}

TEST_CASE("Packet rejects a payload of the wrong type", "[PacketFramer]") {
  Packet packet(uint8_t(GET_STATUS), string("\xff\xff\xff", 3));
  REQUIRE_THROWS_AS(packet.getProto<GetStatusRequest>(), std::runtime_error);
}
