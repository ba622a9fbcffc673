#pragma once

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "network/request_handler.hpp"

namespace bucketd {
namespace network {

class HttpServer {
public:

  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see local_port()
  HttpServer(const uint16_t port, const std::string& address, RequestHandler& handler);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  // False if the server is already running or the endpoint cannot be bound
  bool start_listener();
  // Closes the acceptor and every open connection, then joins all threads
  void shutdown();


  // ---- GETTERS ----
  uint16_t local_port() const;
  bool is_running() const { return is_running_; }

private:

  // One accepted connection served by its own thread
  struct Session {
    boost::asio::ip::tcp::socket socket;
    std::thread thread;
    std::atomic<bool> finished{false};

    explicit Session(boost::asio::ip::tcp::socket socket) : socket(std::move(socket)) {}
  };


  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Live connections
  std::mutex sessions_mutex_;
  std::list<std::shared_ptr<Session>> sessions_;

  // System components
  RequestHandler& handler_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();


  // ---- CONNECTION HANDLING ----
  // Request/response loop of one connection. Runs on the session thread
  void serve(std::shared_ptr<Session> session);
  // Joins and drops sessions whose thread has finished
  void reap_sessions();
};

} // namespace network
} // namespace bucketd
