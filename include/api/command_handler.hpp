#ifndef BLOBNET_API_COMMAND_HANDLER_HPP
#define BLOBNET_API_COMMAND_HANDLER_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>
#include "common/error.hpp"
#include "store/blob_store.hpp"
#include "transfer/download_coordinator.hpp"

namespace blobnet {
namespace api {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

// Status code and JSON body returned to the control API caller
struct ApiResponse {
  int status = 200;
  json body;

  std::string dump() const { return body.dump(); }
};

// Identity and address the node reports about itself
struct NodeInfo {
  hash::NodeId id;
  std::string version;
  std::string address;
  uint16_t port = 0;
};

/**
 * Executes control API commands:
 *
 *   {"command":"id"}
 *   {"command":"addresses"}
 *   {"command":"upload","files":{<path>:<label>},"timeout":<s|null>}
 *   {"command":"upload","hash":<hex>,"timeout":<s|null>}          (check key)
 *   {"command":"download","hash":<hex>,"dest":<dir>,"peers":[{"TCP":[ip,port]}],
 *    "size":<n|null>,"timeout":<s|null>}
 *
 * NotFoundError and malformed requests answer 400, other failures 500,
 * both with {"error": "<KindName>: <message>"}.
 */
class CommandHandler {
public:
  CommandHandler(store::BlobStore& store, transfer::DownloadCoordinator& coordinator,
                 const NodeInfo& info, Clock::duration download_timeout);


  // ---- COMMAND DISPATCH ----
  ApiResponse handle(const json& command);
  // Parses one JSON document first
  ApiResponse handle_text(const std::string& text);


  // ---- PAYLOAD HELPERS ----
  // Seconds as a number or null; negative values are rejected
  static std::optional<Clock::duration> parse_timeout(const json& value);
  // [{"TCP": [ip, port]}, ...], duplicates removed, order kept
  static std::vector<boost::asio::ip::tcp::endpoint> parse_peers(const json& peers);
  static ApiResponse error_response(const Error& error);

private:
  // ---- PARAMETERS ----
  store::BlobStore& store_;
  transfer::DownloadCoordinator& coordinator_;
  const NodeInfo info_;
  const Clock::duration download_timeout_;


  // ---- COMMANDS ----
  ApiResponse handle_id() const;
  ApiResponse handle_addresses() const;
  ApiResponse handle_upload(const json& command);
  ApiResponse handle_check_key(const json& command);
  ApiResponse handle_download(const json& command);
};

} // namespace api
} // namespace blobnet

#endif // BLOBNET_API_COMMAND_HANDLER_HPP
