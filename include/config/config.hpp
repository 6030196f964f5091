#ifndef BLOBNET_CONFIG_CONFIG_HPP
#define BLOBNET_CONFIG_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include "hash/hasher.hpp"

namespace blobnet {
namespace config {

struct NodeConfig {
  // Network Parameters
  std::string host = "0.0.0.0";
  uint16_t port = 3282;

  // Storage
  std::string db_dir = "./blobnet-db";
  uint32_t block_size = 1024 * 1024;
  hash::HashAlgorithm hash_algorithm = hash::HashAlgorithm::SHA224;

  // Timeouts and retry budgets
  std::chrono::seconds handshake_timeout{10};
  std::chrono::seconds request_timeout{30};
  std::chrono::seconds keepalive_interval{15};
  std::chrono::seconds download_timeout{300};
  std::size_t max_block_attempts = 10;
  std::size_t max_consecutive_failures = 3;
  std::size_t io_threads = 2;

  // Store sweeper
  std::chrono::seconds sweep_interval{86400};
  std::chrono::seconds sweep_lifetime{86400};

  // Logging
  std::string log_file;
  std::string log_level = "info";

  // Throws InvalidRequestError on out-of-range values
  void validate() const;
};

struct ProgramOptions {
  NodeConfig config;
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out = std::cerr);

// Parses "--flag value" pairs over the defaults of NodeConfig
ProgramOptions parse_command_line(int argc, char* argv[], std::ostream& err = std::cerr);

} // namespace config
} // namespace blobnet

#endif // BLOBNET_CONFIG_CONFIG_HPP
