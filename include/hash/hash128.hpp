#ifndef BLOBNET_HASH_HASH128_HPP
#define BLOBNET_HASH_HASH128_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace blobnet {
namespace hash {

// 128-bit value used for block hashes, blob hashes and node identifiers.
// Bytes are kept in wire (little-endian) order.
struct Hash128 {
  static constexpr std::size_t SIZE = 16;

  std::array<uint8_t, SIZE> bytes{};

  // ---- CONVERSION ----
  // Renders the 128-bit number as 32 lowercase hex digits, most significant first
  std::string to_hex() const;
  // Parses exactly 32 hex digits, throws InvalidRequestError otherwise
  static Hash128 from_hex(const std::string& hex);
  static std::optional<Hash128> try_from_hex(const std::string& hex);
  static Hash128 from_bytes(const uint8_t* data);

  // Cryptographically random value (used for node ids)
  static Hash128 random();

  bool is_zero() const;

  bool operator==(const Hash128& other) const { return bytes == other.bytes; }
  bool operator!=(const Hash128& other) const { return bytes != other.bytes; }
  bool operator<(const Hash128& other) const { return bytes < other.bytes; }
};

using BlockHash = Hash128;
using BlobHash = Hash128;
using NodeId = Hash128;

inline std::ostream& operator<<(std::ostream& os, const Hash128& hash) {
  return os << hash.to_hex();
}

} // namespace hash
} // namespace blobnet

namespace std {
template <>
struct hash<blobnet::hash::Hash128> {
  std::size_t operator()(const blobnet::hash::Hash128& value) const noexcept {
    // Digest output is already uniformly distributed
    std::size_t result;
    std::memcpy(&result, value.bytes.data(), sizeof(result));
    return result;
  }
};
} // namespace std

#endif // BLOBNET_HASH_HASH128_HPP
