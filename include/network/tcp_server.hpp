#ifndef BLOBNET_NETWORK_TCP_SERVER_HPP
#define BLOBNET_NETWORK_TCP_SERVER_HPP

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "network/session_table.hpp"

namespace blobnet {
namespace network {

// Accepts peer connections and hands each socket to the session table
class TcpServer {
public:
  TcpServer(const TcpServer&) = delete;
  TcpServer& operator=(const TcpServer&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TcpServer(const std::string& address, uint16_t port, SessionTable& sessions);
  ~TcpServer();


  // ---- LISTENER LIFECYCLE ----
  // Binds and starts the io thread; false when bind fails or already running
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // Bound port, differs from the configured one when that was 0
  uint16_t port() const { return bound_port_; }
  const std::string& address() const { return address_; }
  bool is_running() const { return is_running_; }

private:
  // ---- PARAMETERS ----
  const std::string address_;
  const uint16_t port_;
  uint16_t bound_port_;

  // Accept side runs on its own context and thread
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};

  SessionTable& sessions_;


  // ---- ACCEPT LOOP ----
  void run_io();
  void accept_next();
  void on_accept(const boost::system::error_code& ec,
                 const std::shared_ptr<boost::asio::ip::tcp::socket>& incoming);
};

} // namespace network
} // namespace blobnet

#endif // BLOBNET_NETWORK_TCP_SERVER_HPP
