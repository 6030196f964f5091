#include "store/node_identity.hpp"
#include "common/error.hpp"
#include <fstream>
#include <optional>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace blobnet {
namespace store {

namespace {

using json = nlohmann::json;

std::optional<hash::NodeId> read_identity(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file) {
    return std::nullopt;
  }

  try {
    json meta = json::parse(file);
    if (meta.value("format", 0) != IDENTITY_FORMAT || !meta.contains("id") || !meta["id"].is_string()) {
      BOOST_LOG_TRIVIAL(warning) << "Node identity: Unsupported identity file " << path.string();
      return std::nullopt;
    }
    return hash::Hash128::try_from_hex(meta["id"].get<std::string>());
  } catch (const json::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Node identity: Unreadable identity file " << path.string() << ": " << e.what();
    return std::nullopt;
  }
}

} // namespace

hash::NodeId load_or_create_identity(const std::filesystem::path& db_dir) {
  std::error_code ec;
  std::filesystem::create_directories(db_dir, ec);
  if (ec) {
    throw IOError("Failed to create database directory " + db_dir.string() + ": " + ec.message());
  }

  const std::filesystem::path path = db_dir / "meta";
  if (std::optional<hash::NodeId> id = read_identity(path)) {
    BOOST_LOG_TRIVIAL(info) << "Node identity: Loaded node id " << *id;
    return *id;
  }

  hash::NodeId id = hash::Hash128::random();
  json meta = {{"format", IDENTITY_FORMAT}, {"id", id.to_hex()}, {"flags", json::array()}};

  std::ofstream file(path, std::ios::trunc);
  file << meta.dump() << '\n';
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Node identity: Failed to write " << path.string();
    throw IOError("Failed to write identity file " + path.string());
  }

  BOOST_LOG_TRIVIAL(info) << "Node identity: Generated node id " << id;
  return id;
}

} // namespace store
} // namespace blobnet
