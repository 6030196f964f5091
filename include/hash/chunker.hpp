#ifndef BLOBNET_HASH_CHUNKER_HPP
#define BLOBNET_HASH_CHUNKER_HPP

#include <filesystem>
#include <istream>
#include <string>
#include <vector>
#include "hash/blob_meta.hpp"
#include "hash/hasher.hpp"

namespace blobnet {
namespace hash {

// Reads the stream sequentially in block_size windows and hashes each
// window. Throws IOError on read failure; nothing is returned on failure.
BlobMeta chunk_and_hash(std::istream& input, const std::string& file_name,
                        uint32_t block_size, const Hasher& hasher);

// Same as chunk_and_hash for a file on disk. The file must still hold
// as many bytes as its size reported when hashing started.
BlobMeta chunk_file(const std::filesystem::path& path, const std::string& file_name,
                    uint32_t block_size, const Hasher& hasher);

// Order-sensitive digest over the concatenated block hashes
BlobHash aggregate_hash(const std::vector<BlockHash>& block_hashes, const Hasher& hasher);

} // namespace hash
} // namespace blobnet

#endif // BLOBNET_HASH_CHUNKER_HPP
