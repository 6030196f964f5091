#include "hash/chunker.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace blobnet {
namespace hash {

BlobMeta chunk_and_hash(std::istream& input, const std::string& file_name,
                        uint32_t block_size, const Hasher& hasher) {
  if (block_size == 0 || block_size >= BLOCK_SIZE_LIMIT) {
    throw InvalidRequestError("invalid block size: " + std::to_string(block_size));
  }

  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Invalid input stream state for " << file_name;
    throw IOError("Chunker: Invalid input stream");
  }

  BlobMeta meta;
  meta.file_name = file_name;
  meta.block_size = block_size;

  std::vector<uint8_t> buffer(block_size);

  // Hash one block_size window at a time, the last window may be short
  while (true) {
    input.read(reinterpret_cast<char*>(buffer.data()), block_size);
    std::size_t bytes_read = static_cast<std::size_t>(input.gcount());

    if (input.bad()) {
      BOOST_LOG_TRIVIAL(error) << "Chunker: Read failure after " << meta.file_size << " bytes of " << file_name;
      throw IOError("Chunker: Failed to read " + file_name);
    }

    if (bytes_read == 0) {
      break;
    }

    meta.block_hashes.push_back(hasher.digest(buffer.data(), bytes_read));
    meta.file_size += bytes_read;

    if (bytes_read < block_size) {
      break;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Hashed " << file_name << " - " << meta.file_size
                           << " bytes in " << meta.block_hashes.size() << " blocks";
  return meta;
}

BlobMeta chunk_file(const std::filesystem::path& path, const std::string& file_name,
                    uint32_t block_size, const Hasher& hasher) {
  BOOST_LOG_TRIVIAL(info) << "Chunker: Hashing file " << path.string();

  std::error_code ec;
  std::uintmax_t expected_size = std::filesystem::file_size(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Cannot stat " << path.string() << ": " << ec.message();
    throw IOError("Failed to open " + path.string() + ": " + ec.message());
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw IOError("Failed to open " + path.string());
  }

  BlobMeta meta = chunk_and_hash(file, file_name, block_size, hasher);

  if (meta.file_size != expected_size) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Unexpected end of file " << path.string()
                             << " after " << meta.file_size << " of " << expected_size << " bytes";
    throw IOError("Unexpected end of file: " + path.string());
  }

  return meta;
}

BlobHash aggregate_hash(const std::vector<BlockHash>& block_hashes, const Hasher& hasher) {
  std::vector<uint8_t> concatenated;
  concatenated.reserve(block_hashes.size() * Hash128::SIZE);

  for (const auto& hash : block_hashes) {
    concatenated.insert(concatenated.end(), hash.bytes.begin(), hash.bytes.end());
  }

  return hasher.digest(concatenated);
}

} // namespace hash
} // namespace blobnet
