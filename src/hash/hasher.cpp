#include "hash/hasher.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>

namespace blobnet {
namespace hash {

//==============================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//==============================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw IOError("Hasher: Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

const EVP_MD* select_digest(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::SHA224:     return EVP_sha224();
    case HashAlgorithm::SHA256:     return EVP_sha256();
    case HashAlgorithm::SHA512_256: return EVP_sha512_256();
    case HashAlgorithm::BLAKE2S256: return EVP_blake2s256();
  }
  return nullptr;
}

} // namespace

//==============================================
// ALGORITHM NAMES
//==============================================

std::string algorithm_to_string(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::SHA224:     return "sha224";
    case HashAlgorithm::SHA256:     return "sha256";
    case HashAlgorithm::SHA512_256: return "sha512-256";
    case HashAlgorithm::BLAKE2S256: return "blake2s256";
  }
  return "unknown";
}

HashAlgorithm parse_hash_algorithm(const std::string& name) {
  if (name == "sha224") return HashAlgorithm::SHA224;
  if (name == "sha256") return HashAlgorithm::SHA256;
  if (name == "sha512-256") return HashAlgorithm::SHA512_256;
  if (name == "blake2s256") return HashAlgorithm::BLAKE2S256;
  throw InvalidRequestError("unknown hash algorithm: " + name);
}

//==============================================
// CONSTRUCTOR
//==============================================

Hasher::Hasher(HashAlgorithm algorithm)
  : algorithm_(algorithm)
  , md_(select_digest(algorithm)) {
  if (!md_) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Digest unavailable for " << algorithm_to_string(algorithm);
    throw InvalidRequestError("digest unavailable: " + algorithm_to_string(algorithm));
  }
}

//==============================================
// HASHING
//==============================================

Hash128 Hasher::digest(const uint8_t* data, std::size_t size) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  DigestContext ctx;

  if (!EVP_DigestInit_ex(ctx.get(), md_, nullptr)) {
    throw IOError("Hasher: Failed to initialize digest");
  }

  if (size > 0 && !EVP_DigestUpdate(ctx.get(), data, size)) {
    throw IOError("Hasher: Failed to update digest");
  }

  if (!EVP_DigestFinal_ex(ctx.get(), digest, &digest_len)) {
    throw IOError("Hasher: Failed to finalize digest");
  }

  if (digest_len < Hash128::SIZE) {
    throw IOError("Hasher: Digest shorter than 128 bits");
  }

  return Hash128::from_bytes(digest);
}

} // namespace hash
} // namespace blobnet
