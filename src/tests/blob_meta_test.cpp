#include <gtest/gtest.h>
#include <cstring>
#include <limits>
#include "common/error.hpp"
#include "hash/blob_meta.hpp"

using namespace blobnet;
using namespace blobnet::hash;

class BlobMetaTest : public ::testing::Test {
protected:
  Hasher hasher;

  BlobMeta make_meta(uint64_t file_size, uint32_t block_size, const std::string& name = "file.bin") {
    BlobMeta meta;
    meta.file_name = name;
    meta.file_size = file_size;
    meta.block_size = block_size;
    uint64_t count = BlobMeta::block_count_for(file_size, block_size);
    for (uint64_t i = 0; i < count; ++i) {
      uint8_t seed = static_cast<uint8_t>(i);
      meta.block_hashes.push_back(hasher.digest(&seed, 1));
    }
    return meta;
  }
};

TEST_F(BlobMetaTest, BlockGeometry) {
  auto meta = make_meta(2500, 1000);
  EXPECT_EQ(meta.block_count(), 3u);
  EXPECT_EQ(meta.block_offset(0), 0u);
  EXPECT_EQ(meta.block_offset(2), 2000u);
  EXPECT_EQ(meta.block_length(0), 1000u);
  EXPECT_EQ(meta.block_length(2), 500u);
  EXPECT_THROW(meta.block_length(3), InvalidRequestError);
}

TEST_F(BlobMetaTest, BlockCountFor) {
  EXPECT_EQ(BlobMeta::block_count_for(0, 1000), 0u);
  EXPECT_EQ(BlobMeta::block_count_for(1, 1000), 1u);
  EXPECT_EQ(BlobMeta::block_count_for(1000, 1000), 1u);
  EXPECT_EQ(BlobMeta::block_count_for(1001, 1000), 2u);
  EXPECT_THROW(BlobMeta::block_count_for(10, 0), InvalidRequestError);

  const uint64_t largest = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(BlobMeta::block_count_for(largest, 1000), largest / 1000 + 1);
  EXPECT_EQ(BlobMeta::block_count_for(largest, 1), largest);
}

TEST_F(BlobMetaTest, HugeFileSizeWithoutBlocksIsRejected) {
  BlobMeta meta;
  meta.file_size = std::numeric_limits<uint64_t>::max();
  meta.block_size = 1000;
  EXPECT_THROW(meta.validate(), ProtocolError);

  auto encoded = meta.encode();
  EXPECT_THROW(BlobMeta::decode(encoded.data(), encoded.size()), ProtocolError);
}

TEST_F(BlobMetaTest, ValidateRejectsInconsistentMeta) {
  auto meta = make_meta(2500, 1000);
  EXPECT_NO_THROW(meta.validate());

  auto short_list = meta;
  short_list.block_hashes.pop_back();
  EXPECT_THROW(short_list.validate(), ProtocolError);

  auto oversized = meta;
  oversized.block_size = BLOCK_SIZE_LIMIT;
  EXPECT_THROW(oversized.validate(), ProtocolError);

  auto zero = meta;
  zero.block_size = 0;
  EXPECT_THROW(zero.validate(), ProtocolError);
}

TEST_F(BlobMetaTest, EncodeDecode) {
  auto meta = make_meta(123456, 4096, "dir/report.pdf");
  auto encoded = meta.encode();
  EXPECT_EQ(encoded.size(), 8u + 4u + 4u + meta.file_name.size() + 4u + meta.block_count() * Hash128::SIZE);
  EXPECT_EQ(BlobMeta::decode(encoded.data(), encoded.size()), meta);
}

TEST_F(BlobMetaTest, EncodingIsLittleEndian) {
  auto meta = make_meta(0x0102, 0x10, "");
  auto encoded = meta.encode();
  ASSERT_GE(encoded.size(), 16u);
  EXPECT_EQ(encoded[0], 0x02);
  EXPECT_EQ(encoded[1], 0x01);
  EXPECT_EQ(encoded[8], 0x10);
  EXPECT_EQ(encoded[12], 0x00);
}

TEST_F(BlobMetaTest, DecodeRejectsTruncatedInput) {
  auto encoded = make_meta(5000, 1000).encode();
  for (std::size_t cut : {std::size_t(0), std::size_t(7), std::size_t(15), encoded.size() - 1}) {
    EXPECT_THROW(BlobMeta::decode(encoded.data(), cut), ProtocolError) << "cut at " << cut;
  }
}

TEST_F(BlobMetaTest, DecodeRejectsTrailingBytes) {
  auto encoded = make_meta(5000, 1000).encode();
  encoded.push_back(0);
  EXPECT_THROW(BlobMeta::decode(encoded.data(), encoded.size()), ProtocolError);
}

TEST_F(BlobMetaTest, DecodeRejectsWrongBlockCount) {
  auto meta = make_meta(5000, 1000);
  meta.file_size = 9000;
  auto encoded = meta.encode();
  EXPECT_THROW(BlobMeta::decode(encoded.data(), encoded.size()), ProtocolError);
}

TEST_F(BlobMetaTest, BlobHashDependsOnBlocksOnly) {
  auto a = make_meta(2500, 1000, "a.bin");
  auto b = make_meta(2500, 1000, "b.bin");
  EXPECT_EQ(a.blob_hash(hasher), b.blob_hash(hasher));
  b.block_hashes[1] = b.block_hashes[0];
  EXPECT_NE(a.blob_hash(hasher), b.blob_hash(hasher));
}
