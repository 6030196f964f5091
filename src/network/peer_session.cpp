#include "network/peer_session.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>

namespace blobnet {
namespace network {

std::string outcome_to_string(RequestOutcome outcome) {
  switch (outcome) {
    case RequestOutcome::OK:             return "OK";
    case RequestOutcome::UNAVAILABLE:    return "UNAVAILABLE";
    case RequestOutcome::TIMEOUT:        return "TIMEOUT";
    case RequestOutcome::CLOSED:         return "CLOSED";
    case RequestOutcome::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
  }
  return "UNKNOWN";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PeerSession::PeerSession(SessionId id, boost::asio::io_context& io_context, store::BlobStore& store,
                         const hash::NodeId& local_id, const SessionOptions& options)
  : id_(id)
  , store_(store)
  , local_id_(local_id)
  , options_(options)
  , strand_(boost::asio::any_io_executor(io_context.get_executor()))
  , socket_(io_context)
  , handshake_timer_(io_context)
  , request_timer_(io_context)
  , keepalive_timer_(io_context) {
  BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": Created outbound session";
}

PeerSession::PeerSession(SessionId id, boost::asio::ip::tcp::socket socket, store::BlobStore& store,
                         const hash::NodeId& local_id, const SessionOptions& options)
  : id_(id)
  , store_(store)
  , local_id_(local_id)
  , options_(options)
  , strand_(socket.get_executor())
  , socket_(std::move(socket))
  , handshake_timer_(socket_.get_executor())
  , request_timer_(socket_.get_executor())
  , keepalive_timer_(socket_.get_executor()) {
  boost::system::error_code ec;
  endpoint_ = socket_.remote_endpoint(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Peer session " << id_ << ": Remote endpoint unknown: " << ec.message();
  }
  BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": Created inbound session from " << endpoint_;
}

PeerSession::~PeerSession() {
  BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": Destroyed";
}

//==============================================
// LIFECYCLE
//==============================================

void PeerSession::connect(const boost::asio::ip::tcp::endpoint& endpoint) {
  endpoint_ = endpoint;
  auto self = shared_from_this();

  boost::asio::post(strand_, [this, self, endpoint]() {
    if (is_closed()) {
      return;
    }
    BOOST_LOG_TRIVIAL(info) << "Peer session " << id_ << ": Connecting to " << endpoint;
    arm_handshake_timer();

    socket_.async_connect(endpoint, boost::asio::bind_executor(strand_,
      [this, self](const boost::system::error_code& ec) {
        if (ec) {
          shutdown(RequestOutcome::CLOSED, "connect failed: " + ec.message());
          return;
        }
        begin();
      }));
  });
}

void PeerSession::start() {
  auto self = shared_from_this();
  boost::asio::post(strand_, [this, self]() {
    if (is_closed()) {
      return;
    }
    arm_handshake_timer();
    begin();
  });
}

void PeerSession::close() {
  auto self = shared_from_this();
  boost::asio::post(strand_, [this, self]() {
    shutdown(RequestOutcome::CLOSED, "closed locally");
  });
}

bool PeerSession::wait_established(Clock::duration timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  state_cv_.wait_for(lock, timeout, [this]() {
    return state_.is_established() || state_.is_closed();
  });
  return state_.is_established();
}

//==============================================
// HANDSHAKE
//==============================================

void PeerSession::arm_handshake_timer() {
  auto self = shared_from_this();
  handshake_timer_.expires_after(options_.handshake_timeout);
  handshake_timer_.async_wait(boost::asio::bind_executor(strand_,
    [this, self](const boost::system::error_code& ec) {
      if (ec == boost::asio::error::operation_aborted) {
        return;
      }
      bool waiting;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        waiting = !state_.is_established() && !state_.is_closed();
      }
      if (waiting) {
        shutdown(RequestOutcome::TIMEOUT, "handshake timed out");
      }
    }));
}

void PeerSession::begin() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.advance(SessionState::State::HANDSHAKING)) {
      return;
    }
  }

  boost::system::error_code ec;
  socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": Could not disable Nagle: " << ec.message();
  }

  BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": Sending hello to " << endpoint_;
  send_packet(Packet::hello(local_id_));
  read_opcode();
}

void PeerSession::handle_hello(const Packet& packet) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Exactly one hello per session; IDLE is also reachable from AWAITING_BLOCK
    if (state_.current() != SessionState::State::HANDSHAKING) {
      throw ProtocolError("unexpected hello in state " + std::string(SessionState::name(state_.current())));
    }
    if (packet.proto_version != PROTO_VERSION) {
      throw ProtocolError("protocol version mismatch: peer speaks " +
                          std::to_string(packet.proto_version) + ", expected " + std::to_string(PROTO_VERSION));
    }
    if (!state_.advance(SessionState::State::IDLE)) {
      throw ProtocolError("hello could not complete the handshake");
    }
    peer_id_ = packet.node_id;
  }
  state_cv_.notify_all();
  handshake_timer_.cancel();

  BOOST_LOG_TRIVIAL(info) << "Peer session " << id_ << ": Handshake complete with " << packet.node_id
                          << " at " << endpoint_;
  schedule_keepalive();
}

//==============================================
// INCOMING DATA PROCESSING
//==============================================

void PeerSession::read_opcode() {
  auto self = shared_from_this();
  boost::asio::async_read(socket_, boost::asio::buffer(&opcode_byte_, sizeof(opcode_byte_)),
    boost::asio::bind_executor(strand_,
      [this, self](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
        handle_read_opcode(ec);
      }));
}

void PeerSession::handle_read_opcode(const boost::system::error_code& ec) {
  if (ec) {
    shutdown(RequestOutcome::CLOSED, "read failed: " + ec.message());
    return;
  }

  try {
    incoming_ = Packet{};
    incoming_.opcode = Codec::parse_opcode(opcode_byte_);
    std::size_t size = Codec::body_size(incoming_.opcode);
    if (size == 0) {
      handle_packet(incoming_);
      return;
    }

    body_.resize(size);
    auto self = shared_from_this();
    boost::asio::async_read(socket_, boost::asio::buffer(body_),
      boost::asio::bind_executor(strand_,
        [this, self](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
          handle_read_body(ec);
        }));
  } catch (const ProtocolError& e) {
    shutdown(RequestOutcome::PROTOCOL_ERROR, e.what());
  } catch (const std::exception& e) {
    shutdown(RequestOutcome::CLOSED, e.what());
  }
}

void PeerSession::handle_read_body(const boost::system::error_code& ec) {
  if (ec) {
    shutdown(RequestOutcome::CLOSED, "read failed: " + ec.message());
    return;
  }

  try {
    handle_packet(codec_.decode_body(incoming_.opcode, body_.data(), body_.size()));
  } catch (const ProtocolError& e) {
    shutdown(RequestOutcome::PROTOCOL_ERROR, e.what());
  } catch (const std::exception& e) {
    shutdown(RequestOutcome::CLOSED, e.what());
  }
}

void PeerSession::handle_read_payload(const boost::system::error_code& ec) {
  if (ec) {
    shutdown(RequestOutcome::CLOSED, "payload read failed: " + ec.message());
    return;
  }

  BOOST_LOG_TRIVIAL(trace) << "Peer session " << id_ << ": Received " << payload_.size() << " payload bytes";
  handle_reply(incoming_, std::move(payload_));
  payload_.clear();
  read_opcode();
}

void PeerSession::handle_packet(const Packet& packet) {
  BOOST_LOG_TRIVIAL(trace) << "Peer session " << id_ << ": Received " << packet;

  if (packet.opcode == Opcode::HELLO) {
    handle_hello(packet);
    read_opcode();
    return;
  }

  if (!is_established()) {
    throw ProtocolError(opcode_to_string(packet.opcode) + " received before hello");
  }

  switch (packet.opcode) {
    case Opcode::NOP:
      break;

    case Opcode::ASK:
      serve_block(packet.hash);
      break;

    case Opcode::ASK_META:
      serve_meta(packet.hash);
      break;

    case Opcode::ASK_REPLY:
    case Opcode::META_REPLY: {
      const Opcode expected = packet.opcode == Opcode::ASK_REPLY ? Opcode::ASK : Opcode::ASK_META;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.current() != SessionState::State::AWAITING_BLOCK || !pending_ || pending_->opcode != expected) {
          throw ProtocolError("unsolicited " + opcode_to_string(packet.opcode));
        }
      }

      if (packet.has_payload()) {
        incoming_ = packet;
        payload_.resize(packet.packet_size);
        auto self = shared_from_this();
        boost::asio::async_read(socket_, boost::asio::buffer(payload_),
          boost::asio::bind_executor(strand_,
            [this, self](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
              handle_read_payload(ec);
            }));
        return;
      }
      handle_reply(packet, {});
      break;
    }

    case Opcode::HELLO:
      break;
  }

  read_opcode();
}

void PeerSession::handle_reply(const Packet& packet, std::vector<uint8_t> payload) {
  ResponseHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Closed while the payload was in flight; shutdown already answered
    if (!state_.advance(SessionState::State::IDLE)) {
      return;
    }
    if (pending_) {
      handler = std::move(pending_->handler);
      pending_.reset();
    }
  }
  request_timer_.cancel();

  RequestOutcome outcome = packet.packet_size == 0 ? RequestOutcome::UNAVAILABLE : RequestOutcome::OK;
  BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": " << opcode_to_string(packet.opcode)
                           << " completed with " << outcome_to_string(outcome);

  if (handler) {
    handler(outcome, std::move(payload));
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": Drained reply of a cancelled request";
  }
}

//==============================================
// SERVING PEERS
//==============================================

void PeerSession::serve_block(const hash::BlockHash& block_hash) {
  std::vector<uint8_t> bytes;
  try {
    bytes = store_.read_block(block_hash);
  } catch (const Error& e) {
    BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": Cannot serve block " << block_hash << ": " << e.what();
  }

  if (bytes.size() >= MAX_PACKET_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "Peer session " << id_ << ": Block " << block_hash << " too big to serve";
    bytes.clear();
  }

  send_packet(Packet::ask_reply(static_cast<uint32_t>(bytes.size())));
  if (!bytes.empty()) {
    send_raw(std::move(bytes));
  }
}

void PeerSession::serve_meta(const hash::BlobHash& blob_hash) {
  std::vector<uint8_t> encoded;
  try {
    encoded = store_.lookup(blob_hash).encode();
  } catch (const Error& e) {
    BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": Cannot serve meta of " << blob_hash << ": " << e.what();
  }

  if (encoded.size() >= MAX_PACKET_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "Peer session " << id_ << ": Meta of " << blob_hash << " too big to serve";
    encoded.clear();
  }

  send_packet(Packet::meta_reply(static_cast<uint32_t>(encoded.size())));
  if (!encoded.empty()) {
    send_raw(std::move(encoded));
  }
}

//==============================================
// OUTGOING DATA PROCESSING
//==============================================

bool PeerSession::ask_block(const hash::BlockHash& block_hash, ResponseHandler handler) {
  return issue_request(Opcode::ASK, block_hash, std::move(handler));
}

bool PeerSession::ask_meta(const hash::BlobHash& blob_hash, ResponseHandler handler) {
  return issue_request(Opcode::ASK_META, blob_hash, std::move(handler));
}

void PeerSession::cancel_request() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_ && pending_->handler) {
    pending_->handler = nullptr;
    BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": Cancelled request for " << pending_->hash;
  }
}

bool PeerSession::issue_request(Opcode opcode, const hash::Hash128& hash, ResponseHandler handler) {
  uint64_t generation;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.advance(SessionState::State::AWAITING_BLOCK)) {
      return false;
    }
    generation = ++generation_;
    pending_ = PendingRequest{opcode, hash, std::move(handler), generation};
  }

  Packet packet = opcode == Opcode::ASK ? Packet::ask(hash) : Packet::ask_meta(hash);
  auto self = shared_from_this();
  boost::asio::post(strand_, [this, self, packet, generation]() {
    if (is_closed()) {
      return;
    }
    arm_request_timer(generation);
    send_packet(packet);
  });
  return true;
}

void PeerSession::send_packet(const Packet& packet) {
  BOOST_LOG_TRIVIAL(trace) << "Peer session " << id_ << ": Sending " << packet;
  send_raw(codec_.encode(packet));
}

void PeerSession::send_raw(std::vector<uint8_t> bytes) {
  if (is_closed()) {
    return;
  }

  bool write_in_progress = !write_queue_.empty();
  write_queue_.push_back(std::make_shared<std::vector<uint8_t>>(std::move(bytes)));
  if (!write_in_progress) {
    do_write();
  }
}

void PeerSession::do_write() {
  auto self = shared_from_this();
  boost::asio::async_write(socket_, boost::asio::buffer(*write_queue_.front()),
    boost::asio::bind_executor(strand_,
      [this, self](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          shutdown(RequestOutcome::CLOSED, "write failed: " + ec.message());
          return;
        }
        write_queue_.pop_front();
        if (!write_queue_.empty()) {
          do_write();
        }
      }));
}

//==============================================
// TIMERS
//==============================================

void PeerSession::arm_request_timer(uint64_t generation) {
  auto self = shared_from_this();
  request_timer_.expires_after(options_.request_timeout);
  request_timer_.async_wait(boost::asio::bind_executor(strand_,
    [this, self, generation](const boost::system::error_code& ec) {
      if (ec == boost::asio::error::operation_aborted) {
        return;
      }
      bool expired;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        expired = pending_ && pending_->generation == generation;
      }
      if (expired) {
        shutdown(RequestOutcome::TIMEOUT, "request timed out");
      }
    }));
}

void PeerSession::schedule_keepalive() {
  if (options_.keepalive_interval <= Clock::duration::zero()) {
    return;
  }

  auto self = shared_from_this();
  keepalive_timer_.expires_after(options_.keepalive_interval);
  keepalive_timer_.async_wait(boost::asio::bind_executor(strand_,
    [this, self](const boost::system::error_code& ec) {
      if (ec) {
        return;
      }
      SessionState::State current = state();
      if (current == SessionState::State::CLOSED) {
        return;
      }
      if (current == SessionState::State::IDLE) {
        send_packet(Packet::nop());
      }
      schedule_keepalive();
    }));
}

//==============================================
// TEARDOWN
//==============================================

void PeerSession::shutdown(RequestOutcome outcome, const std::string& reason) {
  ResponseHandler handler;
  CloseHandler on_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.advance(SessionState::State::CLOSED)) {
      return;
    }
    if (pending_) {
      handler = std::move(pending_->handler);
      pending_.reset();
    }
    on_close = close_handler_;
  }
  state_cv_.notify_all();

  if (outcome == RequestOutcome::CLOSED) {
    BOOST_LOG_TRIVIAL(info) << "Peer session " << id_ << ": Closing (" << reason << ")";
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Peer session " << id_ << ": Closing on " << outcome_to_string(outcome)
                               << " (" << reason << ")";
  }

  handshake_timer_.cancel();
  request_timer_.cancel();
  keepalive_timer_.cancel();

  boost::system::error_code ec;
  if (socket_.is_open()) {
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "Peer session " << id_ << ": Socket shutdown error: " << ec.message();
    }
    socket_.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Peer session " << id_ << ": Socket close error: " << ec.message();
    }
  }

  if (handler) {
    handler(outcome, {});
  }
  if (on_close) {
    on_close(id_);
  }
}

//==============================================
// GETTERS AND SETTERS
//==============================================

SessionState::State PeerSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.current();
}

bool PeerSession::is_established() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.is_established();
}

bool PeerSession::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.is_closed();
}

std::optional<hash::NodeId> PeerSession::peer_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peer_id_;
}

void PeerSession::set_close_handler(CloseHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  close_handler_ = std::move(handler);
}

} // namespace network
} // namespace blobnet
