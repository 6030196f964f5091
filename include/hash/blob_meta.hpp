#ifndef BLOBNET_HASH_BLOB_META_HPP
#define BLOBNET_HASH_BLOB_META_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "hash/hash128.hpp"
#include "hash/hasher.hpp"

namespace blobnet {
namespace hash {

// Blocks must fit a single ask-reply payload
constexpr uint32_t BLOCK_SIZE_LIMIT = 4 * 1024 * 1024;
constexpr uint32_t DEFAULT_BLOCK_SIZE = 1024 * 1024;

/**
 * Description of a blob: its label, size, block size and the ordered
 * list of block hashes. Every block is block_size bytes long except the
 * last one, which holds the remainder.
 */
struct BlobMeta {
  std::string file_name;
  uint64_t file_size = 0;
  uint32_t block_size = 0;
  std::vector<BlockHash> block_hashes;

  // ---- BLOCK GEOMETRY ----
  static uint64_t block_count_for(uint64_t file_size, uint32_t block_size);
  std::size_t block_count() const { return block_hashes.size(); }
  uint64_t block_offset(std::size_t index) const;
  uint32_t block_length(std::size_t index) const;

  // Checks block size bounds and the block count invariant, throws ProtocolError
  void validate() const;

  // Aggregate hash over the ordered block hashes
  BlobHash blob_hash(const Hasher& hasher) const;


  // ---- BINARY ENCODING ----
  // file_size u64, block_size u32, name_len u32, name, count u32, count x 16 bytes (LE)
  std::vector<uint8_t> encode() const;
  // Throws ProtocolError on truncated or inconsistent input
  static BlobMeta decode(const uint8_t* data, std::size_t size);

  bool operator==(const BlobMeta& other) const {
    return file_name == other.file_name && file_size == other.file_size &&
           block_size == other.block_size && block_hashes == other.block_hashes;
  }
};

} // namespace hash
} // namespace blobnet

#endif // BLOBNET_HASH_BLOB_META_HPP
