#ifndef BLOBNET_HASH_HASHER_HPP
#define BLOBNET_HASH_HASHER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "hash/hash128.hpp"

namespace blobnet {
namespace hash {

// Digest algorithms a node can be configured with. Both ends of a
// transfer must agree on the algorithm; SHA224 is the default.
enum class HashAlgorithm {
  SHA224,
  SHA256,
  SHA512_256,
  BLAKE2S256
};

std::string algorithm_to_string(HashAlgorithm algorithm);
// Throws InvalidRequestError for unknown names
HashAlgorithm parse_hash_algorithm(const std::string& name);

// Stateless 128-bit hash function: the first 16 bytes of an EVP digest.
// Safe to share between threads.
class Hasher {
public:
  // ---- CONSTRUCTOR ----
  explicit Hasher(HashAlgorithm algorithm = HashAlgorithm::SHA224);


  // ---- HASHING ----
  Hash128 digest(const uint8_t* data, std::size_t size) const;
  Hash128 digest(const std::vector<uint8_t>& data) const {
    return digest(data.data(), data.size());
  }


  // ---- GETTERS ----
  HashAlgorithm algorithm() const { return algorithm_; }

private:
  // ---- PARAMETERS ----
  HashAlgorithm algorithm_;
  const EVP_MD* md_;
};

} // namespace hash
} // namespace blobnet

#endif // BLOBNET_HASH_HASHER_HPP
