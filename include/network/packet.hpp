#ifndef BLOBNET_NETWORK_PACKET_HPP
#define BLOBNET_NETWORK_PACKET_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include "hash/hash128.hpp"

namespace blobnet {
namespace network {

constexpr uint8_t PROTO_VERSION = 1;

// Reply payloads must be strictly smaller than this
constexpr uint32_t MAX_PACKET_SIZE = 4 * 1024 * 1024;

// One opcode byte starts every packet
enum class Opcode : uint8_t {
  NOP = 0,
  HELLO = 1,
  ASK = 2,
  ASK_REPLY = 3,
  ASK_META = 4,
  META_REPLY = 5
};

// Data structure used to represent a decoded packet locally. Only the
// fields of the packet's opcode are meaningful.
struct Packet {
  Opcode opcode = Opcode::NOP;
  uint8_t proto_version = 0;   // hello
  hash::NodeId node_id;        // hello
  hash::Hash128 hash;          // ask, ask-meta
  uint32_t packet_size = 0;    // ask-reply, meta-reply

  static Packet nop();
  static Packet hello(const hash::NodeId& node_id, uint8_t version = PROTO_VERSION);
  static Packet ask(const hash::Hash128& hash);
  static Packet ask_meta(const hash::Hash128& hash);
  static Packet ask_reply(uint32_t packet_size);
  static Packet meta_reply(uint32_t packet_size);

  // True for replies whose raw payload follows on the stream
  bool has_payload() const {
    return (opcode == Opcode::ASK_REPLY || opcode == Opcode::META_REPLY) && packet_size > 0;
  }
};

std::string opcode_to_string(Opcode opcode);
std::ostream& operator<<(std::ostream& os, const Packet& packet);

} // namespace network
} // namespace blobnet

#endif // BLOBNET_NETWORK_PACKET_HPP
