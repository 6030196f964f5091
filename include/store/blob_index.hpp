#ifndef BLOBNET_STORE_BLOB_INDEX_HPP
#define BLOBNET_STORE_BLOB_INDEX_HPP

#include <filesystem>
#include <vector>
#include "hash/blob_meta.hpp"
#include "hash/hasher.hpp"

namespace blobnet {
namespace store {

constexpr int DESCRIPTOR_FORMAT = 1;

// A READY blob as persisted on disk
struct BlobRecord {
  hash::BlobHash hash;
  hash::BlobMeta meta;
  std::filesystem::path data_path;
};

/**
 * One JSON descriptor per READY blob under a directory, named
 * <hash hex>.blob:
 *   {"format": 1, "hash": hex, "path": data file, "file_name": ...,
 *    "file_size": n, "block_size": n, "blocks": [hex, ...]}
 * Lets a restarted node serve what it registered before.
 */
class BlobIndex {
public:
  // Creates dir when missing, throws IOError if that fails
  explicit BlobIndex(const std::filesystem::path& dir);

  // Both return false and log on filesystem failure
  bool save(const BlobRecord& record);
  bool remove(const hash::BlobHash& hash);

  // Descriptors that cannot be parsed, do not hash to their name under
  // hasher, or whose data file is gone or resized are deleted
  std::vector<BlobRecord> load_all(const hash::Hasher& hasher);

  const std::filesystem::path& dir() const { return dir_; }

private:
  std::filesystem::path dir_;

  std::filesystem::path descriptor_path(const hash::BlobHash& hash) const;
};

} // namespace store
} // namespace blobnet

#endif // BLOBNET_STORE_BLOB_INDEX_HPP
