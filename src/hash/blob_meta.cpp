#include "hash/blob_meta.hpp"
#include "hash/chunker.hpp"
#include "common/error.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstring>

namespace blobnet {
namespace hash {

namespace {

constexpr std::size_t MAX_FILE_NAME_LENGTH = 4096;

template <typename T>
void put_le(std::vector<uint8_t>& out, T value) {
  T wire = boost::endian::native_to_little(value);
  const auto* raw = reinterpret_cast<const uint8_t*>(&wire);
  out.insert(out.end(), raw, raw + sizeof(T));
}

// Bounds-checked cursor over an encoded body
class Reader {
public:
  Reader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  template <typename T>
  T get_le() {
    require(sizeof(T));
    T wire;
    std::memcpy(&wire, data_ + offset_, sizeof(T));
    offset_ += sizeof(T);
    return boost::endian::little_to_native(wire);
  }

  const uint8_t* take(std::size_t count) {
    require(count);
    const uint8_t* start = data_ + offset_;
    offset_ += count;
    return start;
  }

  std::size_t remaining() const { return size_ - offset_; }

private:
  void require(std::size_t count) const {
    if (size_ - offset_ < count) {
      throw ProtocolError("truncated blob metadata");
    }
  }

  const uint8_t* data_;
  std::size_t size_;
  std::size_t offset_ = 0;
};

} // namespace

//==============================================
// BLOCK GEOMETRY
//==============================================

uint64_t BlobMeta::block_count_for(uint64_t file_size, uint32_t block_size) {
  if (block_size == 0) {
    throw InvalidRequestError("block size must be positive");
  }
  // Rounding up by addition would wrap near UINT64_MAX
  return file_size / block_size + (file_size % block_size != 0 ? 1 : 0);
}

uint64_t BlobMeta::block_offset(std::size_t index) const {
  return static_cast<uint64_t>(index) * block_size;
}

uint32_t BlobMeta::block_length(std::size_t index) const {
  uint64_t offset = block_offset(index);
  if (index >= block_hashes.size() || offset >= file_size) {
    throw InvalidRequestError("block index out of range: " + std::to_string(index));
  }
  return static_cast<uint32_t>(std::min<uint64_t>(block_size, file_size - offset));
}

void BlobMeta::validate() const {
  if (block_size == 0 || block_size >= BLOCK_SIZE_LIMIT) {
    throw ProtocolError("invalid block size: " + std::to_string(block_size));
  }
  if (block_count_for(file_size, block_size) != block_hashes.size()) {
    throw ProtocolError("block count " + std::to_string(block_hashes.size()) +
                        " does not match file size " + std::to_string(file_size));
  }
}

BlobHash BlobMeta::blob_hash(const Hasher& hasher) const {
  return aggregate_hash(block_hashes, hasher);
}

//==============================================
// BINARY ENCODING
//==============================================

std::vector<uint8_t> BlobMeta::encode() const {
  std::vector<uint8_t> out;
  out.reserve(sizeof(uint64_t) + 3 * sizeof(uint32_t) + file_name.size() +
              block_hashes.size() * Hash128::SIZE);

  put_le<uint64_t>(out, file_size);
  put_le<uint32_t>(out, block_size);
  put_le<uint32_t>(out, static_cast<uint32_t>(file_name.size()));
  out.insert(out.end(), file_name.begin(), file_name.end());
  put_le<uint32_t>(out, static_cast<uint32_t>(block_hashes.size()));
  for (const auto& hash : block_hashes) {
    out.insert(out.end(), hash.bytes.begin(), hash.bytes.end());
  }
  return out;
}

BlobMeta BlobMeta::decode(const uint8_t* data, std::size_t size) {
  Reader reader(data, size);
  BlobMeta meta;

  meta.file_size = reader.get_le<uint64_t>();
  meta.block_size = reader.get_le<uint32_t>();

  uint32_t name_length = reader.get_le<uint32_t>();
  if (name_length > MAX_FILE_NAME_LENGTH) {
    throw ProtocolError("file name too long: " + std::to_string(name_length));
  }
  const uint8_t* name = reader.take(name_length);
  meta.file_name.assign(reinterpret_cast<const char*>(name), name_length);

  uint32_t count = reader.get_le<uint32_t>();
  if (static_cast<uint64_t>(count) * Hash128::SIZE != reader.remaining()) {
    BOOST_LOG_TRIVIAL(debug) << "Blob meta: Declared " << count << " hashes, "
                             << reader.remaining() << " bytes left";
    throw ProtocolError("block hash list length mismatch");
  }

  meta.block_hashes.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    meta.block_hashes.push_back(Hash128::from_bytes(reader.take(Hash128::SIZE)));
  }

  meta.validate();
  return meta;
}

} // namespace hash
} // namespace blobnet
