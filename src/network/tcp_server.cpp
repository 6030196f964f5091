#include "network/tcp_server.hpp"
#include <boost/log/trivial.hpp>

namespace blobnet {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpServer::TcpServer(const std::string& address, uint16_t port, SessionTable& sessions)
  : address_(address)
  , port_(port)
  , bound_port_(port)
  , sessions_(sessions) {
  BOOST_LOG_TRIVIAL(debug) << "Listener: configured for " << address << ":" << port;
}

TcpServer::~TcpServer() {
  shutdown();
}


//==============================================
// LISTENER LIFECYCLE
//==============================================

bool TcpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Listener: already accepting on port " << bound_port_;
    return false;
  }

  try {
    // A previous shutdown leaves the context stopped
    io_context_.restart();
    const auto listen_ip = boost::asio::ip::make_address(address_);
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(
      io_context_, boost::asio::ip::tcp::endpoint(listen_ip, port_));
    bound_port_ = acceptor_->local_endpoint().port();
    is_running_ = true;

    accept_next();
    io_thread_ = std::make_unique<std::thread>(&TcpServer::run_io, this);

    BOOST_LOG_TRIVIAL(info) << "Listener: accepting peers on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Listener: could not bind " << address_ << ":" << port_
                             << " (" << e.what() << ")";
    acceptor_.reset();
    is_running_ = false;
    return false;
  }
}

void TcpServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Listener: closing port " << bound_port_;

  // The acceptor belongs to the io thread, close it from there
  boost::asio::post(io_context_, [this]() {
    if (!acceptor_ || !acceptor_->is_open()) {
      return;
    }
    boost::system::error_code close_ec;
    acceptor_->close(close_ec);
    if (close_ec) {
      BOOST_LOG_TRIVIAL(warning) << "Listener: acceptor close failed: " << close_ec.message();
    }
  });

  if (io_thread_ != nullptr && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "Listener: stopped";
}


//==============================================
// ACCEPT LOOP
//==============================================

void TcpServer::run_io() {
  try {
    io_context_.run();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Listener: io loop terminated: " << e.what();
    is_running_ = false;
  }
}

void TcpServer::accept_next() {
  if (acceptor_ == nullptr || !is_running_) {
    return;
  }

  // Accepted sockets live on the session table's io_context
  auto incoming = std::make_shared<boost::asio::ip::tcp::socket>(sessions_.io_context());
  acceptor_->async_accept(*incoming,
    [this, incoming](const boost::system::error_code& ec) { on_accept(ec, incoming); });
}

void TcpServer::on_accept(const boost::system::error_code& ec,
                          const std::shared_ptr<boost::asio::ip::tcp::socket>& incoming) {
  if (ec == boost::asio::error::operation_aborted) {
    return;
  }

  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Listener: accept failed: " << ec.message();
  } else {
    try {
      sessions_.adopt(std::move(*incoming));
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Listener: session setup failed: " << e.what();
    }
  }

  accept_next();
}

} // namespace network
} // namespace blobnet
