#include "network/session_table.hpp"
#include "common/error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <sstream>

namespace blobnet {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SessionTable::SessionTable(store::BlobStore& store, const hash::NodeId& local_id,
                           const SessionOptions& options, std::size_t io_threads)
  : store_(store)
  , local_id_(local_id)
  , options_(options) {
  if (io_threads == 0) {
    throw InvalidRequestError("Session table: at least one io thread is required");
  }

  work_guard_.emplace(boost::asio::make_work_guard(io_context_));
  for (std::size_t i = 0; i < io_threads; ++i) {
    io_threads_.emplace_back([this]() {
      try {
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Session table: IO context error: " << e.what();
      }
    });
  }

  BOOST_LOG_TRIVIAL(info) << "Session table: Initialized with " << io_threads << " io threads";
}

SessionTable::~SessionTable() {
  shutdown();
}

//==============================================
// SESSION MANAGEMENT
//==============================================

SessionId SessionTable::open(const boost::asio::ip::tcp::endpoint& endpoint, Clock::duration timeout) {
  std::optional<SessionId> id = open_all({endpoint}, timeout).front();
  if (!id) {
    std::ostringstream reason;
    reason << "could not establish session with " << endpoint;
    throw PeerUnavailableError(reason.str());
  }
  return *id;
}

std::vector<std::optional<SessionId>> SessionTable::open_all(
    const std::vector<boost::asio::ip::tcp::endpoint>& endpoints, Clock::duration timeout) {
  if (!running_) {
    throw PeerUnavailableError("session table is shut down");
  }

  const Clock::time_point deadline = Clock::now() + timeout;

  std::vector<std::pair<std::shared_ptr<PeerSession>, bool>> started;
  started.reserve(endpoints.size());
  for (const auto& endpoint : endpoints) {
    started.push_back(connect_or_reuse(endpoint));
  }

  std::vector<std::optional<SessionId>> ids;
  ids.reserve(started.size());
  for (const auto& [session, reused] : started) {
    if (await_established(session, reused, deadline)) {
      ids.emplace_back(session->id());
    } else {
      ids.emplace_back(std::nullopt);
    }
  }
  return ids;
}

std::pair<std::shared_ptr<PeerSession>, bool> SessionTable::connect_or_reuse(
    const boost::asio::ip::tcp::endpoint& endpoint) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, candidate] : sessions_) {
      if (candidate->endpoint() == endpoint && !candidate->is_closed()) {
        return {candidate, true};
      }
    }
  }

  SessionId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
  }
  auto created = std::make_shared<PeerSession>(id, io_context_, store_, local_id_, options_);
  created->connect(endpoint);
  return {insert(created), false};
}

bool SessionTable::await_established(const std::shared_ptr<PeerSession>& session, bool reused,
                                     Clock::time_point deadline) {
  Clock::duration remaining = std::max(deadline - Clock::now(), Clock::duration::zero());
  if (!session->wait_established(remaining)) {
    BOOST_LOG_TRIVIAL(warning) << "Session table: Could not establish session with " << session->endpoint();
    if (!reused && !close(session->id())) {
      BOOST_LOG_TRIVIAL(debug) << "Session table: Session " << session->id() << " already gone";
    }
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "Session table: " << (reused ? "Reusing" : "Opened") << " session "
                           << session->id() << " to " << session->endpoint();
  return true;
}

SessionId SessionTable::adopt(boost::asio::ip::tcp::socket socket) {
  if (!running_) {
    throw PeerUnavailableError("session table is shut down");
  }

  SessionId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
  }

  auto session = insert(std::make_shared<PeerSession>(id, std::move(socket), store_, local_id_, options_));
  session->start();
  BOOST_LOG_TRIVIAL(info) << "Session table: Adopted incoming session " << id << " from " << session->endpoint();
  return id;
}

bool SessionTable::close(SessionId id) {
  std::shared_ptr<PeerSession> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      BOOST_LOG_TRIVIAL(warning) << "Session table: Cannot close - session not found: " << id;
      return false;
    }
    session = it->second;
    sessions_.erase(it);
  }

  session->close();
  BOOST_LOG_TRIVIAL(info) << "Session table: Closed session " << id;
  return true;
}

std::shared_ptr<PeerSession> SessionTable::get(SessionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it != sessions_.end()) {
    return it->second;
  }
  return nullptr;
}

std::shared_ptr<PeerSession> SessionTable::insert(std::shared_ptr<PeerSession> session) {
  SessionId id = session->id();
  session->set_close_handler([this](SessionId closed) { remove(closed); });

  std::lock_guard<std::mutex> lock(mutex_);
  sessions_[id] = session;
  return session;
}

void SessionTable::remove(SessionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sessions_.erase(id) > 0) {
    BOOST_LOG_TRIVIAL(debug) << "Session table: Removed closed session " << id;
  }
}

//==============================================
// UTILITY METHODS
//==============================================

std::size_t SessionTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

void SessionTable::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Session table: Initiating shutdown";

  std::map<SessionId, std::shared_ptr<PeerSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions.swap(sessions_);
  }
  for (auto& [id, session] : sessions) {
    session->close();
  }

  // Let the close handlers drain, then the threads run out of work
  work_guard_.reset();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  BOOST_LOG_TRIVIAL(info) << "Session table: Shutdown complete";
}

} // namespace network
} // namespace blobnet
