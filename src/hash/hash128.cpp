#include "hash/hash128.hpp"
#include "common/error.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>

namespace blobnet {
namespace hash {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string Hash128::to_hex() const {
  static const char digits[] = "0123456789abcdef";
  std::string result;
  result.reserve(SIZE * 2);

  // Most significant byte is the last one in wire order
  for (std::size_t i = SIZE; i-- > 0;) {
    result.push_back(digits[bytes[i] >> 4]);
    result.push_back(digits[bytes[i] & 0x0f]);
  }
  return result;
}

std::optional<Hash128> Hash128::try_from_hex(const std::string& hex) {
  if (hex.size() != SIZE * 2) {
    return std::nullopt;
  }

  Hash128 result;
  for (std::size_t i = 0; i < SIZE; ++i) {
    int high = hex_value(hex[2 * i]);
    int low = hex_value(hex[2 * i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    result.bytes[SIZE - 1 - i] = static_cast<uint8_t>((high << 4) | low);
  }
  return result;
}

Hash128 Hash128::from_hex(const std::string& hex) {
  auto result = try_from_hex(hex);
  if (!result) {
    throw InvalidRequestError("invalid 128-bit hex value [" + hex + "]");
  }
  return *result;
}

Hash128 Hash128::from_bytes(const uint8_t* data) {
  Hash128 result;
  std::memcpy(result.bytes.data(), data, SIZE);
  return result;
}

Hash128 Hash128::random() {
  Hash128 result;
  if (RAND_bytes(result.bytes.data(), static_cast<int>(SIZE)) != 1) {
    throw IOError("failed to generate random id: " + std::to_string(ERR_get_error()));
  }
  return result;
}

bool Hash128::is_zero() const {
  for (auto b : bytes) {
    if (b != 0) return false;
  }
  return true;
}

} // namespace hash
} // namespace blobnet
