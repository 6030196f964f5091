#include "api/command_handler.hpp"
#include <boost/log/trivial.hpp>
#include <set>

namespace blobnet {
namespace api {

//==============================================
// CONSTRUCTOR
//==============================================

CommandHandler::CommandHandler(store::BlobStore& store, transfer::DownloadCoordinator& coordinator,
                               const NodeInfo& info, Clock::duration download_timeout)
  : store_(store)
  , coordinator_(coordinator)
  , info_(info)
  , download_timeout_(download_timeout) {
}

//==============================================
// COMMAND DISPATCH
//==============================================

ApiResponse CommandHandler::handle_text(const std::string& text) {
  json command;
  try {
    command = json::parse(text);
  } catch (const json::parse_error& e) {
    BOOST_LOG_TRIVIAL(warning) << "Command handler: Unparseable command: " << e.what();
    return error_response(InvalidRequestError(std::string("malformed JSON: ") + e.what()));
  }
  return handle(command);
}

ApiResponse CommandHandler::handle(const json& command) {
  try {
    if (!command.is_object() || !command.contains("command") || !command["command"].is_string()) {
      throw InvalidRequestError("missing \"command\" field");
    }

    const std::string name = command["command"].get<std::string>();
    BOOST_LOG_TRIVIAL(debug) << "Command handler: Handling " << name;

    if (name == "id") {
      return handle_id();
    }
    if (name == "addresses") {
      return handle_addresses();
    }
    if (name == "upload") {
      if (command.contains("hash") && !command["hash"].is_null()) {
        return handle_check_key(command);
      }
      return handle_upload(command);
    }
    if (name == "download") {
      return handle_download(command);
    }
    throw InvalidRequestError("unknown command: " + name);
  } catch (const Error& e) {
    return error_response(e);
  } catch (const json::exception& e) {
    return error_response(InvalidRequestError(e.what()));
  } catch (const std::filesystem::filesystem_error& e) {
    return error_response(IOError(e.what()));
  }
}

ApiResponse CommandHandler::error_response(const Error& error) {
  ApiResponse response;
  response.status = (error.kind() == ErrorKind::NOT_FOUND || error.kind() == ErrorKind::INVALID_REQUEST) ? 400 : 500;
  response.body = json{{"error", to_error_payload(error)}};
  BOOST_LOG_TRIVIAL(warning) << "Command handler: Request failed with " << response.status << ": "
                             << to_error_payload(error);
  return response;
}

//==============================================
// COMMANDS
//==============================================

ApiResponse CommandHandler::handle_id() const {
  return ApiResponse{200, json{{"id", info_.id.to_hex()}, {"version", info_.version}}};
}

ApiResponse CommandHandler::handle_addresses() const {
  json tcp = {{"address", info_.address}, {"port", info_.port}};
  return ApiResponse{200, json{{"addresses", json{{"TCP", tcp}}}}};
}

ApiResponse CommandHandler::handle_upload(const json& command) {
  if (!command.contains("files") || !command["files"].is_object()) {
    throw InvalidRequestError("upload requires a \"files\" object");
  }
  const json& files = command["files"];
  if (files.size() != 1) {
    throw InvalidRequestError("upload takes exactly one file, got " + std::to_string(files.size()));
  }

  std::optional<Clock::duration> timeout;
  if (command.contains("timeout")) {
    timeout = parse_timeout(command["timeout"]);
  }

  auto file = files.begin();
  const std::string path = file.key();
  std::string label = file.value().is_string() ? file.value().get<std::string>() : std::string();
  if (label.empty()) {
    label = std::filesystem::path(path).filename().string();
  }

  BOOST_LOG_TRIVIAL(info) << "Command handler: Uploading " << path << " as \"" << label << "\"";
  hash::BlobHash blob_hash = store_.register_file(path, label, timeout);
  return ApiResponse{200, json{{"hash", blob_hash.to_hex()}}};
}

ApiResponse CommandHandler::handle_check_key(const json& command) {
  if (!command["hash"].is_string()) {
    throw InvalidRequestError("\"hash\" must be a string");
  }
  const std::string raw = command["hash"].get<std::string>();

  std::optional<Clock::duration> timeout;
  if (command.contains("timeout")) {
    timeout = parse_timeout(command["timeout"]);
  }

  // Anything that is not one of our hashes is simply unknown
  std::optional<hash::BlobHash> blob_hash = hash::Hash128::try_from_hex(raw);
  if (!blob_hash) {
    throw NotFoundError(store::key_not_found_message(raw));
  }

  bool known = store_.state(*blob_hash) == store::EntryState::READY;
  if (!known && timeout) {
    known = store_.wait_for(*blob_hash, *timeout);
  }
  if (!known) {
    throw NotFoundError(store::key_not_found_message(raw));
  }

  return ApiResponse{200, json{{"hash", blob_hash->to_hex()}}};
}

ApiResponse CommandHandler::handle_download(const json& command) {
  if (!command.contains("hash") || !command["hash"].is_string()) {
    throw InvalidRequestError("download requires a \"hash\" string");
  }
  if (!command.contains("dest") || !command["dest"].is_string()) {
    throw InvalidRequestError("download requires a \"dest\" string");
  }

  transfer::DownloadRequest request;
  request.target = hash::Hash128::from_hex(command["hash"].get<std::string>());
  request.dest_dir = command["dest"].get<std::string>();
  request.peers = parse_peers(command.contains("peers") ? command["peers"] : json::array());
  request.timeout = download_timeout_;

  if (command.contains("timeout")) {
    std::optional<Clock::duration> timeout = parse_timeout(command["timeout"]);
    if (timeout) {
      request.timeout = *timeout;
    }
  }
  if (command.contains("size") && !command["size"].is_null()) {
    if (!command["size"].is_number_unsigned()) {
      throw InvalidRequestError("\"size\" must be a non-negative integer");
    }
    request.expected_size = command["size"].get<uint64_t>();
  }

  std::vector<std::filesystem::path> paths = coordinator_.download(request);

  json files = json::array();
  for (const auto& path : paths) {
    files.push_back(path.string());
  }
  return ApiResponse{200, json{{"files", files}}};
}

//==============================================
// PAYLOAD HELPERS
//==============================================

std::optional<Clock::duration> CommandHandler::parse_timeout(const json& value) {
  if (value.is_null()) {
    return std::nullopt;
  }
  if (!value.is_number()) {
    throw InvalidRequestError("\"timeout\" must be a number of seconds or null");
  }

  double seconds = value.get<double>();
  if (seconds < 0) {
    throw InvalidRequestError("\"timeout\" must not be negative");
  }
  return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

std::vector<boost::asio::ip::tcp::endpoint> CommandHandler::parse_peers(const json& peers) {
  if (!peers.is_array()) {
    throw InvalidRequestError("\"peers\" must be an array");
  }

  std::vector<boost::asio::ip::tcp::endpoint> endpoints;
  std::set<boost::asio::ip::tcp::endpoint> seen;

  for (const json& peer : peers) {
    if (!peer.is_object() || !peer.contains("TCP") || !peer["TCP"].is_array() || peer["TCP"].size() != 2) {
      throw InvalidRequestError("peer entries must look like {\"TCP\": [ip, port]}");
    }
    const json& tcp = peer["TCP"];
    if (!tcp[0].is_string() || !tcp[1].is_number_unsigned() || tcp[1].get<uint64_t>() > 65535) {
      throw InvalidRequestError("invalid TCP peer " + tcp.dump());
    }

    boost::system::error_code ec;
    boost::asio::ip::address address = boost::asio::ip::make_address(tcp[0].get<std::string>(), ec);
    if (ec) {
      throw InvalidRequestError("invalid peer address " + tcp[0].get<std::string>());
    }

    boost::asio::ip::tcp::endpoint endpoint(address, static_cast<uint16_t>(tcp[1].get<uint64_t>()));
    if (seen.insert(endpoint).second) {
      endpoints.push_back(endpoint);
    }
  }
  return endpoints;
}

} // namespace api
} // namespace blobnet
