#include "node/node.hpp"
#include "store/node_identity.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

#ifndef BLOBNET_VERSION
#define BLOBNET_VERSION "0.1.0"
#endif

namespace blobnet {
namespace node {

namespace {
// Blob descriptors live beside the identity file
constexpr const char* BLOB_INDEX_DIR = "blobs";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Node::Node(const config::NodeConfig& config)
  : config_(config)
  , hasher_(config.hash_algorithm) {
  config_.validate();

  try {
    id_ = store::load_or_create_identity(config_.db_dir);
    BOOST_LOG_TRIVIAL(info) << "Node: Initializing node " << id_;

    store_ = std::make_unique<store::BlobStore>(hasher_, config_.block_size,
                                                std::filesystem::path(config_.db_dir) / BLOB_INDEX_DIR);
    std::size_t restored = store_->load_index();
    BOOST_LOG_TRIVIAL(debug) << "Node: Blob store created successfully with " << restored << " known blobs";

    network::SessionOptions session_options;
    session_options.handshake_timeout = config_.handshake_timeout;
    session_options.request_timeout = config_.request_timeout;
    session_options.keepalive_interval = config_.keepalive_interval;
    sessions_ = std::make_unique<network::SessionTable>(*store_, id_, session_options, config_.io_threads);
    BOOST_LOG_TRIVIAL(debug) << "Node: Session table created successfully";

    tcp_server_ = std::make_unique<network::TcpServer>(config_.host, config_.port, *sessions_);
    BOOST_LOG_TRIVIAL(debug) << "Node: TCP Server created successfully";

    transfer::CoordinatorOptions coordinator_options;
    coordinator_options.handshake_timeout = config_.handshake_timeout;
    coordinator_options.max_block_attempts = config_.max_block_attempts;
    coordinator_options.max_consecutive_failures = config_.max_consecutive_failures;
    coordinator_ = std::make_unique<transfer::DownloadCoordinator>(*store_, *sessions_, coordinator_options);
    BOOST_LOG_TRIVIAL(debug) << "Node: Download coordinator created successfully";

    BOOST_LOG_TRIVIAL(info) << "Node: Successfully created all components";
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: Failed to initialize components: " << e.what();
    throw;
  }
}

Node::~Node() {
  if (!shutdown()) {
    BOOST_LOG_TRIVIAL(error) << "Node: Failed to shutdown cleanly in destructor";
  }
}

//==============================================
// INITIALIZATION AND DESTRUCTION METHODS
//==============================================

bool Node::start() {
  if (!tcp_server_->start_listener()) {
    BOOST_LOG_TRIVIAL(error) << "Node: Failed to start TCP server";
    return false;
  }

  api::NodeInfo info;
  info.id = id_;
  info.version = BLOBNET_VERSION;
  info.address = config_.host;
  info.port = tcp_server_->port();
  command_handler_ = std::make_unique<api::CommandHandler>(*store_, *coordinator_, info, config_.download_timeout);

  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    sweeper_running_ = true;
  }
  sweeper_ = std::thread(&Node::run_sweeper, this);

  BOOST_LOG_TRIVIAL(info) << "Node: Listening on " << config_.host << ":" << tcp_server_->port();
  return true;
}

bool Node::shutdown() {
  try {
    BOOST_LOG_TRIVIAL(info) << "Node: Initiating shutdown sequence";

    {
      std::lock_guard<std::mutex> lock(sweeper_mutex_);
      sweeper_running_ = false;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
      sweeper_.join();
    }

    // Stop accepting before the sessions go away
    if (tcp_server_) {
      tcp_server_->shutdown();
    }
    if (sessions_) {
      sessions_->shutdown();
    }

    BOOST_LOG_TRIVIAL(info) << "Node: Shutdown complete";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: Error during shutdown: " << e.what();
    return false;
  }
}

//==============================================
// STORE SWEEPER
//==============================================

void Node::run_sweeper() {
  const auto expire_period = std::chrono::seconds(1);
  auto last_eviction = store::Clock::now();

  std::unique_lock<std::mutex> lock(sweeper_mutex_);
  while (sweeper_running_) {
    sweeper_cv_.wait_for(lock, expire_period, [this]() { return !sweeper_running_; });
    if (!sweeper_running_) {
      break;
    }

    lock.unlock();
    try {
      std::size_t expired = store_->expire();
      if (expired > 0) {
        BOOST_LOG_TRIVIAL(info) << "Node: Expired " << expired << " pending entries";
      }

      auto now = store::Clock::now();
      if (now - last_eviction >= config_.sweep_interval) {
        last_eviction = now;
        std::size_t evicted = store_->evict_older_than(config_.sweep_lifetime, now);
        BOOST_LOG_TRIVIAL(info) << "Node: Evicted " << evicted << " entries older than "
                                << config_.sweep_lifetime.count() << "s";
      }
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Node: Sweep failed: " << e.what();
    }
    lock.lock();
  }
}

//==============================================
// GETTERS AND SETTERS
//==============================================

api::CommandHandler& Node::get_command_handler() {
  if (!command_handler_) {
    throw std::logic_error("Node: command handler requested before start");
  }
  return *command_handler_;
}

uint16_t Node::get_port() const {
  return tcp_server_->port();
}

} // namespace node
} // namespace blobnet
