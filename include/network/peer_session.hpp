#ifndef BLOBNET_NETWORK_PEER_SESSION_HPP
#define BLOBNET_NETWORK_PEER_SESSION_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "network/codec.hpp"
#include "network/session_state.hpp"
#include "store/blob_store.hpp"

namespace blobnet {
namespace network {

using SessionId = uint64_t;
using Clock = std::chrono::steady_clock;

// How a request issued on a session ended
enum class RequestOutcome {
  OK,
  UNAVAILABLE,     // zero-size reply
  TIMEOUT,         // no complete reply before the request deadline
  CLOSED,          // session closed while the request was outstanding
  PROTOCOL_ERROR   // peer sent something the protocol forbids
};

std::string outcome_to_string(RequestOutcome outcome);

struct SessionOptions {
  Clock::duration handshake_timeout = std::chrono::seconds(10);
  Clock::duration request_timeout = std::chrono::seconds(30);
  // Zero disables keep-alive
  Clock::duration keepalive_interval = std::chrono::seconds(15);
};

/**
 * One peer connection driven as the SessionState machine.
 *
 * All socket work runs on the session's strand. Public methods may be
 * called from any thread; they take the state mutex and post the I/O.
 * Incoming ask and ask-meta requests are answered from the BlobStore,
 * outgoing requests are strictly one at a time.
 */
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
  // Called once per request with the outcome and the reply payload
  using ResponseHandler = std::function<void(RequestOutcome, std::vector<uint8_t>)>;
  using CloseHandler = std::function<void(SessionId)>;

  // Delete copy operations to prevent socket duplication
  PeerSession(const PeerSession&) = delete;
  PeerSession& operator=(const PeerSession&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Outbound session, call connect() next
  PeerSession(SessionId id, boost::asio::io_context& io_context, store::BlobStore& store,
              const hash::NodeId& local_id, const SessionOptions& options);
  // Inbound session on an accepted socket, call start() next
  PeerSession(SessionId id, boost::asio::ip::tcp::socket socket, store::BlobStore& store,
              const hash::NodeId& local_id, const SessionOptions& options);
  ~PeerSession();


  // ---- LIFECYCLE ----
  void connect(const boost::asio::ip::tcp::endpoint& endpoint);
  void start();
  void close();
  // Blocks until the handshake finished or the session closed
  bool wait_established(Clock::duration timeout);


  // ---- REQUESTS ----
  // Both return false when the session is not IDLE
  bool ask_block(const hash::BlockHash& block_hash, ResponseHandler handler);
  bool ask_meta(const hash::BlobHash& blob_hash, ResponseHandler handler);
  // Detaches the outstanding request's handler, the reply is still drained
  void cancel_request();


  // ---- GETTERS AND SETTERS ----
  SessionId id() const { return id_; }
  SessionState::State state() const;
  bool is_established() const;
  bool is_closed() const;
  std::optional<hash::NodeId> peer_id() const;
  const boost::asio::ip::tcp::endpoint& endpoint() const { return endpoint_; }
  void set_close_handler(CloseHandler handler);

private:
  struct PendingRequest {
    Opcode opcode;
    hash::Hash128 hash;
    ResponseHandler handler;
    uint64_t generation;
  };

  // ---- PARAMETERS ----
  const SessionId id_;
  store::BlobStore& store_;
  const hash::NodeId local_id_;
  const SessionOptions options_;
  Codec codec_;

  // Network components
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::ip::tcp::endpoint endpoint_;
  boost::asio::steady_timer handshake_timer_;
  boost::asio::steady_timer request_timer_;
  boost::asio::steady_timer keepalive_timer_;

  // Read buffers, touched only on the strand
  uint8_t opcode_byte_ = 0;
  std::vector<uint8_t> body_;
  std::vector<uint8_t> payload_;
  Packet incoming_;

  // Write queue, touched only on the strand
  std::deque<std::shared_ptr<std::vector<uint8_t>>> write_queue_;

  // Guarded by mutex_
  mutable std::mutex mutex_;
  std::condition_variable state_cv_;
  SessionState state_;
  std::optional<hash::NodeId> peer_id_;
  std::optional<PendingRequest> pending_;
  uint64_t generation_ = 0;
  CloseHandler close_handler_;


  // ---- HANDSHAKE ----
  void arm_handshake_timer();
  void begin();
  void handle_hello(const Packet& packet);


  // ---- INCOMING DATA PROCESSING ----
  void read_opcode();
  void handle_read_opcode(const boost::system::error_code& ec);
  void handle_read_body(const boost::system::error_code& ec);
  void handle_read_payload(const boost::system::error_code& ec);
  void handle_packet(const Packet& packet);
  void handle_reply(const Packet& packet, std::vector<uint8_t> payload);


  // ---- SERVING PEERS ----
  void serve_block(const hash::BlockHash& block_hash);
  void serve_meta(const hash::BlobHash& blob_hash);


  // ---- OUTGOING DATA PROCESSING ----
  bool issue_request(Opcode opcode, const hash::Hash128& hash, ResponseHandler handler);
  void send_packet(const Packet& packet);
  void send_raw(std::vector<uint8_t> bytes);
  void do_write();


  // ---- TIMERS ----
  void arm_request_timer(uint64_t generation);
  void schedule_keepalive();


  // ---- TEARDOWN ----
  // Runs on the strand, reports the outstanding request with outcome
  void shutdown(RequestOutcome outcome, const std::string& reason);
};

} // namespace network
} // namespace blobnet

#endif // BLOBNET_NETWORK_PEER_SESSION_HPP
