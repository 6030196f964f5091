#ifndef BLOBNET_NODE_NODE_HPP
#define BLOBNET_NODE_NODE_HPP

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include "api/command_handler.hpp"
#include "config/config.hpp"
#include "hash/hasher.hpp"
#include "network/session_table.hpp"
#include "network/tcp_server.hpp"
#include "store/blob_store.hpp"
#include "transfer/download_coordinator.hpp"

namespace blobnet {
namespace node {

// Wires the components of one running node together
class Node {
public:
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Node(const config::NodeConfig& config);
  ~Node();


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts the listener and the store sweeper
  bool start();
  // Terminates all components in reverse dependency order
  bool shutdown();


  // ---- GETTERS AND SETTERS ----
  // Only available once started
  api::CommandHandler& get_command_handler();
  store::BlobStore& get_store() { return *store_; }
  network::SessionTable& get_sessions() { return *sessions_; }
  transfer::DownloadCoordinator& get_coordinator() { return *coordinator_; }
  const hash::NodeId& get_id() const { return id_; }
  uint16_t get_port() const;

private:
  // ---- PARAMETERS ----
  const config::NodeConfig config_;
  hash::NodeId id_;
  hash::Hasher hasher_;

  // System components
  std::unique_ptr<store::BlobStore> store_;
  std::unique_ptr<network::SessionTable> sessions_;
  std::unique_ptr<network::TcpServer> tcp_server_;
  std::unique_ptr<transfer::DownloadCoordinator> coordinator_;
  std::unique_ptr<api::CommandHandler> command_handler_;

  // Store sweeper
  std::thread sweeper_;
  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
  bool sweeper_running_ = false;


  // ---- STORE SWEEPER ----
  void run_sweeper();
};

} // namespace node
} // namespace blobnet

#endif // BLOBNET_NODE_NODE_HPP
