#ifndef BLOBNET_NETWORK_SESSION_TABLE_HPP
#define BLOBNET_NETWORK_SESSION_TABLE_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include "network/peer_session.hpp"

namespace blobnet {
namespace network {

/**
 * Owns every live PeerSession of the node, keyed by SessionId, and the
 * io_context thread pool they run on. Sessions remove themselves when
 * they close.
 */
class SessionTable {
public:
  // Delete copy constructor and assignment operator
  SessionTable(const SessionTable&) = delete;
  SessionTable& operator=(const SessionTable&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SessionTable(store::BlobStore& store, const hash::NodeId& local_id,
               const SessionOptions& options, std::size_t io_threads);
  ~SessionTable();


  // ---- SESSION MANAGEMENT ----
  // Connects and handshakes, reusing an open session to the same endpoint.
  // Throws PeerUnavailableError when the peer cannot be reached in time.
  SessionId open(const boost::asio::ip::tcp::endpoint& endpoint, Clock::duration timeout);
  // Starts every connection before waiting, all handshakes share one
  // deadline. Unreachable endpoints map to nullopt.
  std::vector<std::optional<SessionId>> open_all(const std::vector<boost::asio::ip::tcp::endpoint>& endpoints,
                                                 Clock::duration timeout);
  // Registers and starts a session on an accepted socket
  SessionId adopt(boost::asio::ip::tcp::socket socket);
  bool close(SessionId id);
  std::shared_ptr<PeerSession> get(SessionId id) const;


  // ---- UTILITY METHODS ----
  std::size_t size() const;
  void shutdown();
  boost::asio::io_context& io_context() { return io_context_; }
  const hash::NodeId& local_id() const { return local_id_; }

private:
  // ---- PARAMETERS ----
  store::BlobStore& store_;
  const hash::NodeId local_id_;
  const SessionOptions options_;

  // Thread pool running every session
  boost::asio::io_context io_context_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{true};

  // Sessions map and access mutex
  std::map<SessionId, std::shared_ptr<PeerSession>> sessions_;
  SessionId next_id_ = 1;
  mutable std::mutex mutex_;


  // ---- SESSION MANAGEMENT ----
  // Live session to endpoint, or a new one still handshaking
  std::pair<std::shared_ptr<PeerSession>, bool> connect_or_reuse(const boost::asio::ip::tcp::endpoint& endpoint);
  bool await_established(const std::shared_ptr<PeerSession>& session, bool reused, Clock::time_point deadline);
  std::shared_ptr<PeerSession> insert(std::shared_ptr<PeerSession> session);
  void remove(SessionId id);
};

} // namespace network
} // namespace blobnet

#endif // BLOBNET_NETWORK_SESSION_TABLE_HPP
