#include "network/codec.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <sstream>

namespace blobnet {
namespace network {

//==============================================
// PACKET SHAPES
//==============================================

Opcode Codec::parse_opcode(uint8_t value) {
  if (value > static_cast<uint8_t>(Opcode::META_REPLY)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unknown packet opcode: " << static_cast<int>(value);
    throw ProtocolError("unknown packet opcode: " + std::to_string(value));
  }
  return static_cast<Opcode>(value);
}

std::size_t Codec::body_size(Opcode opcode) {
  switch (opcode) {
    case Opcode::NOP:        return 0;
    case Opcode::HELLO:      return sizeof(uint8_t) + hash::Hash128::SIZE;
    case Opcode::ASK:        return hash::Hash128::SIZE;
    case Opcode::ASK_META:   return hash::Hash128::SIZE;
    case Opcode::ASK_REPLY:  return sizeof(uint32_t);
    case Opcode::META_REPLY: return sizeof(uint32_t);
  }
  throw ProtocolError("unknown packet opcode");
}

void Codec::check_packet_size(uint32_t packet_size) {
  if (packet_size >= MAX_PACKET_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Packet too big: " << packet_size << " bytes";
    throw ProtocolError("packet too big: " + std::to_string(packet_size));
  }
}

//==============================================
// SERIALIZATION
//==============================================

std::size_t Codec::serialize(const Packet& packet, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw IOError("Codec: Invalid output stream");
  }

  uint8_t opcode = static_cast<uint8_t>(packet.opcode);
  write_bytes(output, &opcode, sizeof(opcode));
  std::size_t total_bytes = sizeof(opcode);

  switch (packet.opcode) {
    case Opcode::NOP:
      break;

    case Opcode::HELLO:
      write_bytes(output, &packet.proto_version, sizeof(packet.proto_version));
      write_bytes(output, packet.node_id.bytes.data(), hash::Hash128::SIZE);
      total_bytes += sizeof(packet.proto_version) + hash::Hash128::SIZE;
      break;

    case Opcode::ASK:
    case Opcode::ASK_META:
      write_bytes(output, packet.hash.bytes.data(), hash::Hash128::SIZE);
      total_bytes += hash::Hash128::SIZE;
      break;

    case Opcode::ASK_REPLY:
    case Opcode::META_REPLY: {
      check_packet_size(packet.packet_size);
      uint32_t wire_size = to_wire_order(packet.packet_size);
      write_bytes(output, &wire_size, sizeof(wire_size));
      total_bytes += sizeof(wire_size);
      break;
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Serialized " << packet << " in " << total_bytes << " bytes";
  return total_bytes;
}

std::vector<uint8_t> Codec::encode(const Packet& packet) const {
  std::ostringstream output;
  serialize(packet, output);
  const std::string data = output.str();
  return std::vector<uint8_t>(data.begin(), data.end());
}

//==============================================
// DESERIALIZATION
//==============================================

Packet Codec::deserialize(std::istream& input) const {
  uint8_t opcode_value;
  read_bytes(input, &opcode_value, sizeof(opcode_value));
  Opcode opcode = parse_opcode(opcode_value);

  std::vector<uint8_t> body(body_size(opcode));
  if (!body.empty()) {
    read_bytes(input, body.data(), body.size());
  }
  return decode_body(opcode, body.data(), body.size());
}

Packet Codec::decode_body(Opcode opcode, const uint8_t* body, std::size_t size) const {
  if (size < body_size(opcode)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Truncated " << opcode_to_string(opcode) << " body: " << size << " bytes";
    throw ProtocolError("truncated " + opcode_to_string(opcode) + " packet");
  }

  Packet packet;
  packet.opcode = opcode;

  switch (opcode) {
    case Opcode::NOP:
      break;

    case Opcode::HELLO:
      packet.proto_version = body[0];
      packet.node_id = hash::Hash128::from_bytes(body + 1);
      break;

    case Opcode::ASK:
    case Opcode::ASK_META:
      packet.hash = hash::Hash128::from_bytes(body);
      break;

    case Opcode::ASK_REPLY:
    case Opcode::META_REPLY: {
      uint32_t wire_size;
      std::memcpy(&wire_size, body, sizeof(wire_size));
      packet.packet_size = from_wire_order(wire_size);
      check_packet_size(packet.packet_size);
      break;
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Decoded " << packet;
  return packet;
}

//==============================================
// STREAM OPERATIONS
//==============================================

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw IOError("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw ProtocolError("truncated packet");
  }
}

} // namespace network
} // namespace blobnet
