#include "network/packet.hpp"

namespace blobnet {
namespace network {

//==============================================
// PACKET CONSTRUCTION
//==============================================

Packet Packet::nop() {
  return Packet{};
}

Packet Packet::hello(const hash::NodeId& node_id, uint8_t version) {
  Packet packet;
  packet.opcode = Opcode::HELLO;
  packet.proto_version = version;
  packet.node_id = node_id;
  return packet;
}

Packet Packet::ask(const hash::Hash128& hash) {
  Packet packet;
  packet.opcode = Opcode::ASK;
  packet.hash = hash;
  return packet;
}

Packet Packet::ask_meta(const hash::Hash128& hash) {
  Packet packet;
  packet.opcode = Opcode::ASK_META;
  packet.hash = hash;
  return packet;
}

Packet Packet::ask_reply(uint32_t packet_size) {
  Packet packet;
  packet.opcode = Opcode::ASK_REPLY;
  packet.packet_size = packet_size;
  return packet;
}

Packet Packet::meta_reply(uint32_t packet_size) {
  Packet packet;
  packet.opcode = Opcode::META_REPLY;
  packet.packet_size = packet_size;
  return packet;
}

std::string opcode_to_string(Opcode opcode) {
  switch (opcode) {
    case Opcode::NOP:        return "nop";
    case Opcode::HELLO:      return "hello";
    case Opcode::ASK:        return "ask";
    case Opcode::ASK_REPLY:  return "ask-reply";
    case Opcode::ASK_META:   return "ask-meta";
    case Opcode::META_REPLY: return "meta-reply";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Packet& packet) {
  os << "[" << opcode_to_string(packet.opcode);
  switch (packet.opcode) {
    case Opcode::HELLO:
      os << " id:" << packet.node_id << " v:" << static_cast<int>(packet.proto_version);
      break;
    case Opcode::ASK:
    case Opcode::ASK_META:
      os << " " << packet.hash;
      break;
    case Opcode::ASK_REPLY:
    case Opcode::META_REPLY:
      os << " size:" << packet.packet_size;
      break;
    default:
      break;
  }
  return os << "]";
}

} // namespace network
} // namespace blobnet
