#include <gtest/gtest.h>
#include <sstream>
#include "common/error.hpp"
#include "network/codec.hpp"

using namespace blobnet;
using namespace blobnet::network;

class CodecTest : public ::testing::Test {
protected:
  Codec codec;

  static hash::Hash128 make_hash(uint8_t fill) {
    hash::Hash128 value;
    value.bytes.fill(fill);
    value.bytes[0] = 0x01;
    return value;
  }

  // Helper to verify serialization and deserialization give back the packet
  Packet round_trip(const Packet& input) {
    std::stringstream stream;
    std::size_t written = codec.serialize(input, stream);
    EXPECT_EQ(written, 1 + Codec::body_size(input.opcode));
    stream.seekg(0);
    return codec.deserialize(stream);
  }

  static std::string as_string(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
  }
};

TEST_F(CodecTest, BodySizes) {
  EXPECT_EQ(Codec::body_size(Opcode::NOP), 0u);
  EXPECT_EQ(Codec::body_size(Opcode::HELLO), 17u);
  EXPECT_EQ(Codec::body_size(Opcode::ASK), 16u);
  EXPECT_EQ(Codec::body_size(Opcode::ASK_REPLY), 4u);
  EXPECT_EQ(Codec::body_size(Opcode::ASK_META), 16u);
  EXPECT_EQ(Codec::body_size(Opcode::META_REPLY), 4u);
}

TEST_F(CodecTest, NopIsOneByte) {
  auto bytes = codec.encode(Packet::nop());
  ASSERT_EQ(bytes.size(), 1u);
  EXPECT_EQ(bytes[0], 0);
}

TEST_F(CodecTest, HelloLayout) {
  auto id = make_hash(0xaa);
  auto bytes = codec.encode(Packet::hello(id));

  ASSERT_EQ(bytes.size(), 18u);
  EXPECT_EQ(bytes[0], 1);
  EXPECT_EQ(bytes[1], PROTO_VERSION);
  // Node id goes out in stored (little-endian) order
  EXPECT_EQ(bytes[2], 0x01);
  EXPECT_EQ(bytes[17], 0xaa);

  auto decoded = round_trip(Packet::hello(id));
  EXPECT_EQ(decoded.opcode, Opcode::HELLO);
  EXPECT_EQ(decoded.proto_version, PROTO_VERSION);
  EXPECT_EQ(decoded.node_id, id);
}

TEST_F(CodecTest, AskAndAskMetaCarryHash) {
  auto hash = make_hash(0x5c);

  auto ask = round_trip(Packet::ask(hash));
  EXPECT_EQ(ask.opcode, Opcode::ASK);
  EXPECT_EQ(ask.hash, hash);

  auto ask_meta = round_trip(Packet::ask_meta(hash));
  EXPECT_EQ(ask_meta.opcode, Opcode::ASK_META);
  EXPECT_EQ(ask_meta.hash, hash);

  EXPECT_EQ(codec.encode(Packet::ask(hash))[0], 2);
  EXPECT_EQ(codec.encode(Packet::ask_meta(hash))[0], 4);
}

TEST_F(CodecTest, ReplySizeIsLittleEndian) {
  auto bytes = codec.encode(Packet::ask_reply(0x00010203));
  ASSERT_EQ(bytes.size(), 5u);
  EXPECT_EQ(bytes[0], 3);
  EXPECT_EQ(bytes[1], 0x03);
  EXPECT_EQ(bytes[2], 0x02);
  EXPECT_EQ(bytes[3], 0x01);
  EXPECT_EQ(bytes[4], 0x00);

  auto decoded = round_trip(Packet::meta_reply(77));
  EXPECT_EQ(decoded.opcode, Opcode::META_REPLY);
  EXPECT_EQ(decoded.packet_size, 77u);
}

TEST_F(CodecTest, ZeroSizeReplyHasNoPayload) {
  auto decoded = round_trip(Packet::ask_reply(0));
  EXPECT_EQ(decoded.packet_size, 0u);
  EXPECT_FALSE(decoded.has_payload());
  EXPECT_TRUE(Packet::ask_reply(1).has_payload());
}

TEST_F(CodecTest, LargestAllowedReplySize) {
  auto decoded = round_trip(Packet::ask_reply(MAX_PACKET_SIZE - 1));
  EXPECT_EQ(decoded.packet_size, MAX_PACKET_SIZE - 1);
}

TEST_F(CodecTest, OversizedReplyRejected) {
  std::stringstream out;
  EXPECT_THROW(codec.serialize(Packet::ask_reply(MAX_PACKET_SIZE), out), ProtocolError);

  // Peer announcing exactly 4 MiB
  std::vector<uint8_t> wire = {3, 0x00, 0x00, 0x40, 0x00};
  std::stringstream in(as_string(wire));
  EXPECT_THROW(codec.deserialize(in), ProtocolError);
}

TEST_F(CodecTest, UnknownOpcodeRejected) {
  EXPECT_THROW(Codec::parse_opcode(6), ProtocolError);
  EXPECT_THROW(Codec::parse_opcode(0xff), ProtocolError);
  EXPECT_EQ(Codec::parse_opcode(5), Opcode::META_REPLY);

  std::stringstream in(std::string(1, '\x09'));
  EXPECT_THROW(codec.deserialize(in), ProtocolError);
}

TEST_F(CodecTest, TruncatedBodyRejected) {
  auto bytes = codec.encode(Packet::hello(make_hash(0x11)));
  bytes.pop_back();
  std::stringstream in(as_string(bytes));
  EXPECT_THROW(codec.deserialize(in), ProtocolError);

  std::stringstream empty;
  EXPECT_THROW(codec.deserialize(empty), ProtocolError);

  uint8_t body[3] = {0, 0, 0};
  EXPECT_THROW(codec.decode_body(Opcode::ASK_REPLY, body, sizeof(body)), ProtocolError);
}

TEST_F(CodecTest, ConsecutivePacketsOnOneStream) {
  std::stringstream stream;
  codec.serialize(Packet::nop(), stream);
  codec.serialize(Packet::ask(make_hash(0x22)), stream);
  codec.serialize(Packet::ask_reply(0), stream);

  stream.seekg(0);
  EXPECT_EQ(codec.deserialize(stream).opcode, Opcode::NOP);
  EXPECT_EQ(codec.deserialize(stream).hash, make_hash(0x22));
  EXPECT_EQ(codec.deserialize(stream).opcode, Opcode::ASK_REPLY);
}

TEST_F(CodecTest, OpcodeNames) {
  EXPECT_EQ(opcode_to_string(Opcode::ASK_REPLY), "ask-reply");
  EXPECT_EQ(opcode_to_string(Opcode::META_REPLY), "meta-reply");
  EXPECT_EQ(opcode_to_string(Opcode::HELLO), "hello");
}
