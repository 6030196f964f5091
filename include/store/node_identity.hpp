#ifndef BLOBNET_STORE_NODE_IDENTITY_HPP
#define BLOBNET_STORE_NODE_IDENTITY_HPP

#include <filesystem>
#include "hash/hash128.hpp"

namespace blobnet {
namespace store {

constexpr int IDENTITY_FORMAT = 1;

// Reads the node id from <db_dir>/meta, a JSON document
// {"format": 1, "id": "<hex>", "flags": []}. A missing, unreadable or
// foreign file is replaced by one holding a fresh random id.
hash::NodeId load_or_create_identity(const std::filesystem::path& db_dir);

} // namespace store
} // namespace blobnet

#endif // BLOBNET_STORE_NODE_IDENTITY_HPP
