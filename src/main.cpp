#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "node/node.hpp"
#include <iostream>
#include <stdexcept>

bool run_node(const blobnet::config::NodeConfig& config) {
  try {
    blobnet::node::Node node(config);

    if (!node.start()) {
      std::cerr << "Error: Failed to start node\n";
      return false;
    }

    blobnet::cli::CLI cli(node.get_command_handler());
    cli.run();
    return node.shutdown();
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start node: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = blobnet::config::parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    blobnet::logging::init(options.config.log_file,
                           blobnet::logging::parse_severity(options.config.log_level));
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << '\n';
    return 1;
  }

  if (!run_node(options.config)) {
    return 1;
  }
  return 0;
}
