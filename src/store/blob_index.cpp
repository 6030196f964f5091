#include "store/blob_index.hpp"
#include "common/error.hpp"
#include <fstream>
#include <optional>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace blobnet {
namespace store {

namespace {

using json = nlohmann::json;

constexpr const char* DESCRIPTOR_EXTENSION = ".blob";

json to_json(const BlobRecord& record) {
  json blocks = json::array();
  for (const auto& block : record.meta.block_hashes) {
    blocks.push_back(block.to_hex());
  }
  return {
    {"format", DESCRIPTOR_FORMAT},
    {"hash", record.hash.to_hex()},
    {"path", record.data_path.string()},
    {"file_name", record.meta.file_name},
    {"file_size", record.meta.file_size},
    {"block_size", record.meta.block_size},
    {"blocks", blocks}
  };
}

// Throws json::exception or blobnet::Error on malformed content
BlobRecord from_json(const json& descriptor) {
  if (descriptor.at("format").get<int>() != DESCRIPTOR_FORMAT) {
    throw ProtocolError("unsupported descriptor format");
  }

  BlobRecord record;
  record.hash = hash::Hash128::from_hex(descriptor.at("hash").get<std::string>());
  record.data_path = descriptor.at("path").get<std::string>();
  record.meta.file_name = descriptor.at("file_name").get<std::string>();
  record.meta.file_size = descriptor.at("file_size").get<uint64_t>();
  record.meta.block_size = descriptor.at("block_size").get<uint32_t>();
  for (const json& block : descriptor.at("blocks")) {
    record.meta.block_hashes.push_back(hash::Hash128::from_hex(block.get<std::string>()));
  }
  record.meta.validate();
  return record;
}

std::optional<BlobRecord> read_descriptor(const std::filesystem::path& path, const hash::Hasher& hasher) {
  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(warning) << "Blob index: Cannot open " << path.string();
    return std::nullopt;
  }

  BlobRecord record;
  try {
    record = from_json(json::parse(file));
  } catch (const json::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Blob index: Malformed descriptor " << path.string() << ": " << e.what();
    return std::nullopt;
  } catch (const Error& e) {
    BOOST_LOG_TRIVIAL(warning) << "Blob index: Invalid descriptor " << path.string() << ": " << e.what();
    return std::nullopt;
  }

  if (path.stem().string() != record.hash.to_hex() || record.meta.blob_hash(hasher) != record.hash) {
    BOOST_LOG_TRIVIAL(warning) << "Blob index: " << path.string() << " does not describe " << record.hash
                               << " under " << hash::algorithm_to_string(hasher.algorithm());
    return std::nullopt;
  }

  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(record.data_path, ec);
  if (ec || size != record.meta.file_size) {
    BOOST_LOG_TRIVIAL(warning) << "Blob index: Data of " << record.hash << " missing or changed at "
                               << record.data_path.string();
    return std::nullopt;
  }
  return record;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

BlobIndex::BlobIndex(const std::filesystem::path& dir)
  : dir_(dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Blob index: Cannot create " << dir_.string() << ": " << ec.message();
    throw IOError("Failed to create index directory " + dir_.string() + ": " + ec.message());
  }
}

//==============================================
// DESCRIPTORS
//==============================================

bool BlobIndex::save(const BlobRecord& record) {
  const std::filesystem::path path = descriptor_path(record.hash);
  std::filesystem::path staging = path;
  staging += ".tmp";

  {
    std::ofstream file(staging, std::ios::trunc);
    file << to_json(record).dump() << '\n';
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Blob index: Failed to write " << staging.string();
      return false;
    }
  }

  // Readers never see a half-written descriptor
  std::error_code ec;
  std::filesystem::rename(staging, path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Blob index: Failed to publish " << path.string() << ": " << ec.message();
    std::filesystem::remove(staging, ec);
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "Blob index: Saved " << record.hash;
  return true;
}

bool BlobIndex::remove(const hash::BlobHash& hash) {
  std::error_code ec;
  std::filesystem::remove(descriptor_path(hash), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Blob index: Failed to remove descriptor of " << hash << ": " << ec.message();
    return false;
  }
  return true;
}

std::vector<BlobRecord> BlobIndex::load_all(const hash::Hasher& hasher) {
  std::vector<BlobRecord> records;
  std::vector<std::filesystem::path> broken;

  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
    const std::filesystem::path& path = it->path();
    if (path.extension() != DESCRIPTOR_EXTENSION) {
      continue;
    }
    if (std::optional<BlobRecord> record = read_descriptor(path, hasher)) {
      records.push_back(std::move(*record));
    } else {
      broken.push_back(path);
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Blob index: Failed to scan " << dir_.string() << ": " << ec.message();
    throw IOError("Failed to scan index directory " + dir_.string() + ": " + ec.message());
  }

  for (const auto& path : broken) {
    std::filesystem::remove(path, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Blob index: Could not delete " << path.string() << ": " << ec.message();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Blob index: Loaded " << records.size() << " descriptors from " << dir_.string()
                          << (broken.empty() ? "" : ", dropped " + std::to_string(broken.size()));
  return records;
}

std::filesystem::path BlobIndex::descriptor_path(const hash::BlobHash& hash) const {
  return dir_ / (hash.to_hex() + DESCRIPTOR_EXTENSION);
}

} // namespace store
} // namespace blobnet
