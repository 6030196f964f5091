#ifndef BLOBNET_NETWORK_CODEC_HPP
#define BLOBNET_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "network/packet.hpp"

namespace blobnet {
namespace network {

/**
 * Encodes and decodes the fixed binary packet layouts:
 *
 *   nop        0  (empty)
 *   hello      1  proto_version u8, node_id u128
 *   ask        2  hash u128
 *   ask-reply  3  packet_size u32, payload written right after
 *   ask-meta   4  hash u128
 *   meta-reply 5  packet_size u32, encoded BlobMeta written right after
 *
 * There is no framing prefix, a reader needs body_size() of the opcode
 * before it can read the body. Decoding failures throw ProtocolError.
 */
class Codec {
public:
  // ---- PACKET SHAPES ----
  // Throws ProtocolError for unknown opcodes
  static Opcode parse_opcode(uint8_t value);
  static std::size_t body_size(Opcode opcode);


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Writes opcode and body, returns the number of bytes written
  std::size_t serialize(const Packet& packet, std::ostream& output) const;
  std::vector<uint8_t> encode(const Packet& packet) const;
  // Reads opcode and body from the stream
  Packet deserialize(std::istream& input) const;
  // Decodes a body already read off the wire
  Packet decode_body(Opcode opcode, const uint8_t* body, std::size_t size) const;

private:
  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);


  // ---- HOST TO WIRE BYTE ORDER CONVERSION ----
  static uint32_t to_wire_order(uint32_t host_value) {
    return boost::endian::native_to_little(host_value);
  }
  static uint32_t from_wire_order(uint32_t wire_value) {
    return boost::endian::little_to_native(wire_value);
  }

  // Rejects reply sizes at or above MAX_PACKET_SIZE
  static void check_packet_size(uint32_t packet_size);
};

} // namespace network
} // namespace blobnet

#endif // BLOBNET_NETWORK_CODEC_HPP
