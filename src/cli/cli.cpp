#include "cli/cli.hpp"
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace blobnet {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(api::CommandHandler& handler, std::istream& in, std::ostream& out)
  : running_(false)
  , handler_(handler)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "blobnet> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    if (line == "quit") {
      running_ = false;
      continue;
    }

    if (!line.empty()) {
      process_line(line);
    }

    if (running_) {
      out_ << "blobnet> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_line(const std::string& line) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command line: " << line;

  if (line == "help") {
    handle_help_command();
    return;
  }

  // JSON lines go to the handler as text so parse errors come back as responses
  if (line.front() == '{') {
    out_ << handler_.handle_text(line).dump() << std::endl;
    return;
  }

  std::optional<api::json> command = translate(line);
  if (!command) {
    return;
  }
  out_ << handler_.handle(*command).dump() << std::endl;
}

std::optional<api::json> CLI::translate(const std::string& line) {
  if (!line.empty() && line.front() == '{') {
    api::json command = api::json::parse(line, nullptr, false);
    if (command.is_discarded()) {
      out_ << "Invalid JSON command" << std::endl;
      return std::nullopt;
    }
    return command;
  }

  std::istringstream args(line);
  std::string name;
  args >> name;

  if (name == "id" || name == "addresses") {
    return api::json{{"command", name}};
  }
  if (name == "upload") {
    return translate_upload(args);
  }
  if (name == "check") {
    return translate_check(args);
  }
  if (name == "download") {
    return translate_download(args);
  }

  out_ << "Unknown command: " << name << ". Type 'help' for the list of commands" << std::endl;
  return std::nullopt;
}

std::optional<api::json> CLI::translate_upload(std::istringstream& args) {
  std::string path;
  if (!(args >> path)) {
    out_ << "Usage: upload <path> [label]" << std::endl;
    return std::nullopt;
  }

  // The label is the rest of the line
  std::string label;
  std::getline(args >> std::ws, label);

  return api::json{{"command", "upload"}, {"id", nullptr}, {"files", api::json{{path, label}}}, {"timeout", nullptr}};
}

std::optional<api::json> CLI::translate_check(std::istringstream& args) {
  std::string hash;
  if (!(args >> hash)) {
    out_ << "Usage: check <hash> [timeout]" << std::endl;
    return std::nullopt;
  }

  api::json command = {{"command", "upload"}, {"id", nullptr}, {"hash", hash}, {"timeout", nullptr}};

  std::string timeout;
  if (args >> timeout) {
    try {
      command["timeout"] = std::stod(timeout);
    } catch (const std::exception& e) {
      out_ << "Invalid timeout: " << timeout << std::endl;
      return std::nullopt;
    }
  }
  return command;
}

std::optional<api::json> CLI::translate_download(std::istringstream& args) {
  std::string hash;
  std::string dest;
  if (!(args >> hash >> dest)) {
    out_ << "Usage: download <hash> <dest> <host:port>..." << std::endl;
    return std::nullopt;
  }

  api::json peers = api::json::array();
  std::string peer;
  while (args >> peer) {
    size_t colon_pos = peer.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
      out_ << "Invalid peer format. Usage: <ip:port> (e.g., 127.0.0.1:3282)" << std::endl;
      return std::nullopt;
    }

    std::string ip = peer.substr(0, colon_pos);
    std::string port_str = peer.substr(colon_pos + 1);
    unsigned long port = 0;
    try {
      port = std::stoul(port_str);
    } catch (const std::exception& e) {
      out_ << "Invalid port number: " << port_str << std::endl;
      return std::nullopt;
    }
    if (port == 0 || port > 65535) {
      out_ << "Invalid port number: " << port_str << std::endl;
      return std::nullopt;
    }
    peers.push_back(api::json{{"TCP", api::json::array({ip, port})}});
  }

  return api::json{{"command", "download"}, {"hash", hash}, {"dest", dest}, {"peers", peers},
                   {"size", nullptr}, {"timeout", nullptr}};
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                                 Display this help message" << std::endl;
  out_ << "  id                                   Print the node id and version" << std::endl;
  out_ << "  addresses                            Print the listening address" << std::endl;
  out_ << "  upload <path> [label]                Register a local file, print its hash" << std::endl;
  out_ << "  check <hash> [timeout]               Check whether a hash is known" << std::endl;
  out_ << "  download <hash> <dest> <ip:port>...  Fetch a blob from peers into <dest>" << std::endl;
  out_ << "  {\"command\": ...}                     Send a raw JSON command" << std::endl;
  out_ << "  quit                                 Exit the shell" << std::endl << std::endl;
}

} // namespace cli
} // namespace blobnet
