#include "config/config.hpp"
#include "common/error.hpp"
#include "hash/blob_meta.hpp"
#include "logger/logger.hpp"
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace blobnet {
namespace config {

namespace {

uint64_t parse_number(const std::string& flag, const std::string& value, uint64_t max) {
  std::size_t consumed = 0;
  unsigned long long number = 0;
  try {
    number = std::stoull(value, &consumed);
  } catch (const std::exception&) {
    throw InvalidRequestError("invalid number for " + flag + ": " + value);
  }
  if (consumed != value.size() || value[0] == '-' || number > max) {
    throw InvalidRequestError("invalid number for " + flag + ": " + value);
  }
  return number;
}

std::chrono::seconds parse_seconds(const std::string& flag, const std::string& value) {
  return std::chrono::seconds(parse_number(flag, value, std::numeric_limits<uint32_t>::max()));
}

} // namespace

void NodeConfig::validate() const {
  if (host.empty()) {
    throw InvalidRequestError("host must not be empty");
  }
  if (db_dir.empty()) {
    throw InvalidRequestError("database directory must not be empty");
  }
  if (block_size == 0 || block_size >= hash::BLOCK_SIZE_LIMIT) {
    throw InvalidRequestError("block size must be between 1 and " + std::to_string(hash::BLOCK_SIZE_LIMIT - 1));
  }
  if (handshake_timeout.count() <= 0 || request_timeout.count() <= 0 || download_timeout.count() <= 0) {
    throw InvalidRequestError("timeouts must be positive");
  }
  if (keepalive_interval.count() < 0) {
    throw InvalidRequestError("keep-alive interval must not be negative");
  }
  if (max_block_attempts == 0 || max_consecutive_failures == 0) {
    throw InvalidRequestError("retry budgets must be positive");
  }
  if (io_threads == 0) {
    throw InvalidRequestError("at least one io thread is required");
  }
  if (sweep_interval.count() <= 0 || sweep_lifetime.count() <= 0) {
    throw InvalidRequestError("sweep interval and lifetime must be positive");
  }
  try {
    logging::parse_severity(log_level);
  } catch (const std::invalid_argument& e) {
    throw InvalidRequestError(e.what());
  }
}

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -h, --host <addr>          Listen address (default 0.0.0.0)\n"
      << "  -p, --port <port>          Listen port (default 3282)\n"
      << "  --db <dir>                 Database directory (default ./blobnet-db)\n"
      << "  --block-size <bytes>       Block size, below 4 MiB (default 1048576)\n"
      << "  --hash <name>              sha224, sha256, sha512-256 or blake2s256\n"
      << "  --download-timeout <s>     Default download timeout (default 300)\n"
      << "  --sweep-interval <s>       Eviction sweep interval (default 86400)\n"
      << "  --sweep-lifetime <s>       Lifetime of registered blobs (default 86400)\n"
      << "  --logfile <path>           Log to a rotating file instead of the console\n"
      << "  --loglevel <level>         trace, debug, info, warning, error or fatal\n"
      << "  --io-threads <n>           Network threads (default 2)\n"
      << "Example: " << program_name << " -h 127.0.0.1 -p 3282 --db /tmp/blobnet\n";
}

ProgramOptions parse_command_line(int argc, char* argv[], std::ostream& err) {
  const std::unordered_set<std::string> known_flags = {
    "-h", "--host", "-p", "--port", "--db", "--block-size", "--hash", "--download-timeout",
    "--sweep-interval", "--sweep-lifetime", "--logfile", "--loglevel", "--io-threads"
  };

  ProgramOptions options;
  NodeConfig& config = options.config;
  const std::string program_name = argc > 0 ? argv[0] : "blobnet";

  if (argc % 2 == 0) {
    err << "Error: Every option needs a value\n";
    print_usage(program_name, err);
    return options;
  }

  try {
    for (int i = 1; i < argc - 1; i += 2) {
      const std::string flag(argv[i]);
      const std::string value(argv[i + 1]);

      if (known_flags.count(flag) == 0) {
        err << "Error: Unknown argument: " << flag << '\n';
        print_usage(program_name, err);
        return options;
      }

      if (flag == "-h" || flag == "--host") {
        config.host = value;
      } else if (flag == "-p" || flag == "--port") {
        config.port = static_cast<uint16_t>(parse_number(flag, value, std::numeric_limits<uint16_t>::max()));
      } else if (flag == "--db") {
        config.db_dir = value;
      } else if (flag == "--block-size") {
        config.block_size = static_cast<uint32_t>(parse_number(flag, value, std::numeric_limits<uint32_t>::max()));
      } else if (flag == "--hash") {
        config.hash_algorithm = hash::parse_hash_algorithm(value);
      } else if (flag == "--download-timeout") {
        config.download_timeout = parse_seconds(flag, value);
      } else if (flag == "--sweep-interval") {
        config.sweep_interval = parse_seconds(flag, value);
      } else if (flag == "--sweep-lifetime") {
        config.sweep_lifetime = parse_seconds(flag, value);
      } else if (flag == "--logfile") {
        config.log_file = value;
      } else if (flag == "--loglevel") {
        config.log_level = value;
      } else if (flag == "--io-threads") {
        config.io_threads = static_cast<std::size_t>(parse_number(flag, value, 256));
      }
    }

    config.validate();
  } catch (const Error& e) {
    err << "Error: " << e.what() << '\n';
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace blobnet
